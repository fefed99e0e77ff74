#ifndef MASTERTREE_MASTER_TREE_NODE_HPP_
#define MASTERTREE_MASTER_TREE_NODE_HPP_

#include <cassert>
#include <cstddef>
#include <memory>
#include <utility>
#include <boost/optional.hpp>

#include "rand.hpp"

namespace mastertree
{

template <typename Manager> class NodeHandle;

/**
   One element of the sequence plus the bookkeeping for its subtree.

   info always describes the subtree as it currently reads, pending reversal included.
   val and the children are only meaningful after setup() has flushed this node.
   idx is the size of the left subtree, so the node sits at position idx of its subtree.
 */
template <typename Manager>
struct Node
{
    using ValueType = typename Manager::ValueType;
    using InfoType = typename Manager::InfoType;
    using Handle = NodeHandle<Manager>;

    ValueType val;
    InfoType info;
    size_t idx;
    bool rev = false;
    Handle left;
    Handle right;

    Node(ValueType val_, Handle left_, size_t idx_, Handle right_, size_t len)
        : val(std::move(val_))
        , info(Manager::make_info(left_.info(), idx_, val, right_.info(), len - 1 - idx_))
        , idx(idx_)
        , left(std::move(left_))
        , right(std::move(right_))
    {}

    // push pending lazy state and reversal one level down.
    void setup(size_t len)
    {
        Manager::propagate(info, left.info_mut(), idx, val, right.info_mut(), len - 1 - idx);
        if (rev) {
            std::swap(left, right);
            idx = len - idx - 1;
            left.flip(idx);
            right.flip(len - 1 - idx);
            rev = false;
        }
    }

    // rebuild info from the children, which must already be flushed into info.
    void update(size_t len)
    {
        info = Manager::make_info(left.info(), idx, val, right.info(), len - 1 - idx);
    }
};

/**
   Reference counted, possibly empty, handle to a Node.

   Several trees may hold the same node. Writes go through mut(), which copies the
   node first unless this handle is its only owner. The copy is shallow: the children
   are shared by both copies.
   No weak references to nodes are ever created, so use_count() == 1 means unique.
 */
template <typename Manager>
class NodeHandle
{
public:
    using NodeType = Node<Manager>;
    using ValueType = typename Manager::ValueType;
    using InfoType = typename Manager::InfoType;
    using ProdType = typename Manager::ProdType;
    using LazyType = typename Manager::LazyType;
private:
    std::shared_ptr<NodeType> ptr;
public:
    NodeHandle() = default;
    NodeHandle(ValueType val, NodeHandle left, size_t idx, NodeHandle right, size_t len)
        : ptr(std::make_shared<NodeType>(std::move(val), std::move(left), idx, std::move(right), len)) {}
    explicit NodeHandle(ValueType val)
        : NodeHandle(std::move(val), NodeHandle(), 0, NodeHandle(), 1) {}

    explicit operator bool () const { return static_cast<bool>(ptr); }
    bool unique() const { return ptr.use_count() == 1; }

    const NodeType& get() const { assert(ptr); return *ptr; }
    NodeType& mut()
    {
        assert(ptr);
        if (!unique())
            ptr = std::make_shared<NodeType>(*ptr);
        return *ptr;
    }

    boost::optional<const InfoType&> info() const
    {
        if (!ptr) return boost::none;
        return boost::optional<const InfoType&>(ptr->info);
    }
    boost::optional<InfoType&> info_mut()
    {
        if (!ptr) return boost::none;
        return boost::optional<InfoType&>(mut().info);
    }

    // reverse the subtree lazily: info now, structure on the next setup().
    void flip(size_t len)
    {
        if (!ptr) return;
        NodeType& node = mut();
        Manager::rev(node.info, len);
        node.rev = !node.rev;
    }

    /*
      setup() flushes the node in place even when it is shared: flushing never
      changes what the subtree reads as, and children are copied on write
      before anything is pushed into them.
     */
    const NodeType& setup(size_t len) const { assert(ptr); ptr->setup(len); return *ptr; }
    NodeType& setup_mut(size_t len) { setup(len); return mut(); }

    const ValueType& index(size_t len, size_t index) const
    {
        const NodeType* node = &setup(len);
        while (true) {
            assert(index < len);
            size_t idx = node->idx;
            if (index < idx) {
                len = idx;
                node = &node->left.setup(len);
            } else if (index == idx) {
                return node->val;
            } else {
                index -= idx + 1;
                len -= idx + 1;
                node = &node->right.setup(len);
            }
        }
    }

    // both sides non-empty. The root of lhs survives with probability llen/(llen+rlen).
    static NodeHandle merge(NodeHandle lhs, size_t llen, NodeHandle rhs, size_t rlen, CoinFlip& rng)
    {
        assert(lhs && rhs);
        size_t len = llen + rlen;
        if (rng.choose(llen, rlen)) {
            NodeType& node = lhs.setup_mut(llen);
            size_t rest = llen - 1 - node.idx;
            if (node.right)
                node.right = merge(std::move(node.right), rest, std::move(rhs), rlen, rng);
            else
                node.right = std::move(rhs);
            node.update(len);
            return lhs;
        }
        else {
            NodeType& node = rhs.setup_mut(rlen);
            size_t idx = node.idx;
            if (node.left)
                node.left = merge(std::move(lhs), llen, std::move(node.left), idx, rng);
            else
                node.left = std::move(lhs);
            node.idx = idx + llen;
            node.update(len);
            return rhs;
        }
    }

    // [0, index) and [index, len)
    static std::pair<NodeHandle, NodeHandle> split(NodeHandle self, size_t len, size_t index)
    {
        if (!self)
            return std::make_pair(NodeHandle(), NodeHandle());
        if (index == 0)
            return std::make_pair(NodeHandle(), std::move(self));
        if (index == len)
            return std::make_pair(std::move(self), NodeHandle());
        assert(index < len);
        NodeType& node = self.setup_mut(len);
        size_t idx = node.idx;
        if (index > idx) {
            auto parts = split(std::move(node.right), len - 1 - idx, index - 1 - idx);
            node.right = std::move(parts.first);
            node.update(index);
            return std::make_pair(std::move(self), std::move(parts.second));
        }
        else {
            auto parts = split(std::move(node.left), idx, index);
            node.left = std::move(parts.second);
            node.idx = idx - index;
            node.update(len - index);
            return std::make_pair(std::move(parts.first), std::move(self));
        }
    }

    // the new element becomes the subtree root with probability 1/(len+1).
    static void insert(NodeHandle& self, size_t len, size_t index, ValueType val, CoinFlip& rng)
    {
        if (!self) {
            self = NodeHandle(std::move(val));
            return;
        }
        assert(index <= len);
        if (rng.choose(len, 1)) {
            NodeType& node = self.setup_mut(len);
            size_t idx = node.idx;
            if (index > idx)
                insert(node.right, len - 1 - idx, index - 1 - idx, std::move(val), rng);
            else {
                insert(node.left, idx, index, std::move(val), rng);
                node.idx++;
            }
            node.update(len + 1);
        }
        else {
            auto parts = split(std::move(self), len, index);
            self = NodeHandle(std::move(val), std::move(parts.first), index, std::move(parts.second), len + 1);
        }
    }

    static ValueType remove(NodeHandle& self, size_t len, size_t index, CoinFlip& rng)
    {
        assert(index < len);
        NodeType& node = self.setup_mut(len);
        size_t idx = node.idx;
        if (index < idx) {
            ValueType ret = remove(node.left, idx, index, rng);
            node.idx--;
            node.update(len - 1);
            return ret;
        }
        if (index > idx) {
            ValueType ret = remove(node.right, len - 1 - idx, index - 1 - idx, rng);
            node.update(len - 1);
            return ret;
        }
        // node is owned by self alone after setup_mut, so the value can be moved out.
        ValueType ret = std::move(node.val);
        NodeHandle l = std::move(node.left);
        NodeHandle r = std::move(node.right);
        if (!l)
            self = std::move(r);
        else if (!r)
            self = std::move(l);
        else
            self = merge(std::move(l), idx, std::move(r), len - 1 - idx, rng);
        return ret;
    }

    // product of [0, index)
    ProdType prod_left(size_t len, size_t index) const
    {
        if (index == 0)
            return Manager::e();
        if (index == len)
            return Manager::info2prod(get().info);
        const NodeType* node = &setup(len);
        ProdType ret = Manager::e();
        while (true) {
            size_t idx = node->idx;
            if (index < idx) {
                len = idx;
                node = &node->left.setup(len);
                continue;
            }
            if (node->left)
                ret = Manager::op(std::move(ret), Manager::info2prod(node->left.get().info));
            if (index == idx)
                return ret;
            ret = Manager::op(std::move(ret), Manager::val2prod(node->val));
            if (index == idx + 1)
                return ret;
            index -= idx + 1;
            len -= idx + 1;
            node = &node->right.setup(len);
        }
    }

    // product of [index, len)
    ProdType prod_right(size_t len, size_t index) const
    {
        if (index == len)
            return Manager::e();
        if (index == 0)
            return Manager::info2prod(get().info);
        const NodeType* node = &setup(len);
        ProdType ret = Manager::e();
        while (true) {
            size_t idx = node->idx;
            if (index > idx) {
                if (index == idx + 1)
                    return Manager::op(Manager::info2prod(node->right.get().info), std::move(ret));
                index -= idx + 1;
                len -= idx + 1;
                node = &node->right.setup(len);
                continue;
            }
            if (node->right)
                ret = Manager::op(Manager::info2prod(node->right.get().info), std::move(ret));
            ret = Manager::op(Manager::val2prod(node->val), std::move(ret));
            if (index == idx)
                return ret;
            len = idx;
            node = &node->left.setup(len);
        }
    }

    // product of [l, r), l < r
    ProdType prod(size_t len, size_t l, size_t r) const
    {
        const NodeHandle* self = this;
        while (true) {
            assert(l < r && r <= len);
            if (l == 0)
                return self->prod_left(len, r);
            if (r == len)
                return self->prod_right(len, l);
            const NodeType& node = self->setup(len);
            size_t idx = node.idx;
            if (r <= idx) {
                self = &node.left;
                len = idx;
            }
            else if (l > idx) {
                self = &node.right;
                l -= idx + 1;
                r -= idx + 1;
                len -= idx + 1;
            }
            else {
                return Manager::op(
                    Manager::op(node.left.prod_right(idx, l), Manager::val2prod(node.val)),
                    node.right.prod_left(len - 1 - idx, r - 1 - idx));
            }
        }
    }

    void apply_left(size_t len, size_t index, const LazyType& lazy)
    {
        if (index == 0)
            return;
        if (index == len) {
            Manager::apply_info(mut().info, len, lazy);
            return;
        }
        NodeType& node = setup_mut(len);
        size_t idx = node.idx;
        if (index <= idx)
            node.left.apply_left(idx, index, lazy);
        else {
            if (node.left)
                Manager::apply_info(node.left.mut().info, idx, lazy);
            Manager::apply_val(node.val, lazy);
            node.right.apply_left(len - 1 - idx, index - 1 - idx, lazy);
        }
        node.update(len);
    }

    void apply_right(size_t len, size_t index, const LazyType& lazy)
    {
        if (index == 0) {
            Manager::apply_info(mut().info, len, lazy);
            return;
        }
        if (index == len)
            return;
        NodeType& node = setup_mut(len);
        size_t idx = node.idx;
        if (index > idx)
            node.right.apply_right(len - 1 - idx, index - 1 - idx, lazy);
        else {
            if (node.right)
                Manager::apply_info(node.right.mut().info, len - 1 - idx, lazy);
            Manager::apply_val(node.val, lazy);
            node.left.apply_right(idx, index, lazy);
        }
        node.update(len);
    }

    // l < r
    void apply(size_t len, size_t l, size_t r, const LazyType& lazy)
    {
        assert(l < r && r <= len);
        if (l == 0) {
            apply_left(len, r, lazy);
            return;
        }
        if (r == len) {
            apply_right(len, l, lazy);
            return;
        }
        NodeType& node = setup_mut(len);
        size_t idx = node.idx;
        if (r <= idx)
            node.left.apply(idx, l, r, lazy);
        else if (l > idx)
            node.right.apply(len - 1 - idx, l - 1 - idx, r - 1 - idx, lazy);
        else {
            node.left.apply_right(idx, l, lazy);
            Manager::apply_val(node.val, lazy);
            node.right.apply_left(len - 1 - idx, r - 1 - idx, lazy);
        }
        node.update(len);
    }
};

}

#endif
