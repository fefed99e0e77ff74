#ifndef MASTERTREE_MASTER_TREE_HPP_
#define MASTERTREE_MASTER_TREE_HPP_

#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>
#include <boost/format.hpp>

#include "master-tree-node.hpp"
#include "rand.hpp"
#include "type_trait.hpp"

namespace mastertree
{

struct Bound
{
    enum Kind { Included, Excluded, Unbounded };
    Kind kind;
    size_t value;
};

/**
   A range over positions with the usual bound kinds.
   Range::half_open(2, 5) is [2,5), Range::closed(2, 5) is [2,5],
   Range::from(2) is [2,..), Range::until(5) is [..,5), Range::through(5) is [..,5].
 */
struct Range
{
    Bound start;
    Bound end;

    static Range half_open(size_t l, size_t r) { return Range{Bound{Bound::Included, l}, Bound{Bound::Excluded, r}}; }
    static Range closed(size_t l, size_t r)    { return Range{Bound{Bound::Included, l}, Bound{Bound::Included, r}}; }
    static Range from(size_t l)                { return Range{Bound{Bound::Included, l}, Bound{Bound::Unbounded, 0}}; }
    static Range until(size_t r)               { return Range{Bound{Bound::Unbounded, 0}, Bound{Bound::Excluded, r}}; }
    static Range through(size_t r)             { return Range{Bound{Bound::Unbounded, 0}, Bound{Bound::Included, r}}; }
    static Range all()                         { return Range{Bound{Bound::Unbounded, 0}, Bound{Bound::Unbounded, 0}}; }
};

/**
   Sequence with O(log N) expected split, merge, insert, remove, range product and
   range lazy update, plus O(1) reverse and O(1) copy.

   Copies share every node. A write copies only the nodes on its own path,
   so any earlier copy keeps reading as it did.

   Manager supplies the algebra, see is_master_manager in type_trait.hpp.
   Not thread safe, not even for concurrent reads: reads flush lazy state in place.
 */
template <typename Manager>
class MasterTree
{
    static_assert(is_master_manager<Manager>::value, "Manager does not provide the MasterTree manager interface");
public:
    using ManagerType = Manager;
    using ValueType = typename Manager::ValueType;
    using ProdType = typename Manager::ProdType;
    using LazyType = typename Manager::LazyType;
private:
    using Handle = NodeHandle<Manager>;
    using NodeType = typename Handle::NodeType;

    Handle root;
    size_t len = 0;
    CoinFlip rng;

    MasterTree(Handle root_, size_t len_, CoinFlip rng_):root(std::move(root_)), len(len_), rng(rng_){}

public:
    /**
       In-order walk over the values. Input iterator: one pass only, and the tree
       must not be modified while it is in use.
     */
    class const_iterator
    {
        std::vector<std::pair<const NodeType*, size_t> > stack;
        size_t remaining = 0;

        void descend(const Handle* h, size_t sub_len)
        {
            while (*h) {
                const NodeType& node = h->setup(sub_len);
                stack.emplace_back(&node, sub_len);
                sub_len = node.idx;
                h = &node.left;
            }
        }
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ValueType;
        using difference_type = std::ptrdiff_t;
        using pointer = const ValueType*;
        using reference = const ValueType&;

        const_iterator(){}
        const_iterator(const Handle& root_, size_t len_):remaining(len_) { descend(&root_, len_); }

        reference operator*() const { return stack.back().first->val; }
        pointer operator->() const { return &stack.back().first->val; }
        const_iterator& operator++()
        {
            const NodeType* node = stack.back().first;
            size_t sub_len = stack.back().second;
            stack.pop_back();
            descend(&node->right, sub_len - node->idx - 1);
            remaining--;
            return *this;
        }
        const_iterator operator++(int) { const_iterator ret = *this; ++*this; return ret; }
        bool operator==(const const_iterator& rhs) const { return remaining == rhs.remaining; }
        bool operator!=(const const_iterator& rhs) const { return remaining != rhs.remaining; }
        size_t size() const { return remaining; }
    };
    using iterator = const_iterator;

    MasterTree(){}
    explicit MasterTree(std::uint64_t seed):rng(seed){}
    template <typename InputIt, typename = typename std::iterator_traits<InputIt>::iterator_category>
    MasterTree(InputIt first, InputIt last)
    {
        for (; first != last; ++first)
            insert(len, *first);
    }
    MasterTree(std::initializer_list<ValueType> init):MasterTree(init.begin(), init.end()){}

    // copies are O(1) and share all nodes
    MasterTree(const MasterTree&) = default;
    MasterTree& operator=(const MasterTree&) = default;
    MasterTree(MasterTree&& rhs):root(std::move(rhs.root)), len(rhs.len), rng(rhs.rng) { rhs.len = 0; }
    MasterTree& operator=(MasterTree&& rhs)
    {
        if (this != &rhs) {
            root = std::move(rhs.root);
            len = rhs.len;
            rng = rhs.rng;
            rhs.len = 0;
        }
        return *this;
    }

    size_t size() const { return len; }
    bool empty() const { return len == 0; }

    void swap(MasterTree& rhs)
    {
        std::swap(root, rhs.root);
        std::swap(len, rhs.len);
        std::swap(rng, rhs.rng);
    }

    // lhs followed by rhs. The result draws its coins from lhs's generator.
    static MasterTree merge(MasterTree lhs, MasterTree rhs)
    {
        if (rhs.len > std::numeric_limits<size_t>::max() - lhs.len)
            throw std::length_error((boost::format("MasterTree::merge: length overflow (%1% + %2%)") % lhs.len % rhs.len).str());
        size_t new_len = lhs.len + rhs.len;
        Handle merged;
        if (!lhs.root)
            merged = std::move(rhs.root);
        else if (!rhs.root)
            merged = std::move(lhs.root);
        else
            merged = Handle::merge(std::move(lhs.root), lhs.len, std::move(rhs.root), rhs.len, lhs.rng);
        return MasterTree(std::move(merged), new_len, lhs.rng);
    }

    // [0, index) and [index, size()). The right half gets a forked generator.
    static std::pair<MasterTree, MasterTree> split(MasterTree tree, size_t index)
    {
        if (index > tree.len)
            throw std::out_of_range((boost::format("MasterTree::split: index %1% out of range (size %2%)") % index % tree.len).str());
        auto parts = Handle::split(std::move(tree.root), tree.len, index);
        CoinFlip parent = tree.rng;
        CoinFlip right_rng = parent.fork();
        return std::make_pair(MasterTree(std::move(parts.first), index, tree.rng),
                              MasterTree(std::move(parts.second), tree.len - index, right_rng));
    }

    void insert(size_t index, ValueType val)
    {
        if (index > len)
            throw std::out_of_range((boost::format("MasterTree::insert: index %1% out of range (size %2%)") % index % len).str());
        if (len == std::numeric_limits<size_t>::max())
            throw std::length_error("MasterTree::insert: length overflow");
        Handle::insert(root, len, index, std::move(val), rng);
        len++;
    }

    void push_back(ValueType val) { insert(len, std::move(val)); }

    ValueType remove(size_t index)
    {
        check_index("remove", index);
        ValueType ret = Handle::remove(root, len, index, rng);
        len--;
        return ret;
    }

    // O(1). The flip reaches the nodes as they are next visited.
    void reverse()
    {
        root.flip(len);
    }

    const ValueType& at(size_t index) const
    {
        check_index("at", index);
        return root.index(len, index);
    }
    const ValueType& operator[](size_t index) const { return at(index); }

    const_iterator begin() const { return const_iterator(root, len); }
    const_iterator end() const { return const_iterator(); }

    ProdType prod(const Range& range) const
    {
        std::pair<size_t, size_t> lr = normalize("prod", range);
        if (lr.first == lr.second)
            return Manager::e();
        return root.prod(len, lr.first, lr.second);
    }
    ProdType prod(size_t l, size_t r) const { return prod(Range::half_open(l, r)); }
    ProdType prod() const { return prod(Range::all()); }

    void apply(const Range& range, const LazyType& lazy)
    {
        std::pair<size_t, size_t> lr = normalize("apply", range);
        if (lr.first == lr.second)
            return;
        root.apply(len, lr.first, lr.second, lazy);
    }
    void apply(size_t l, size_t r, const LazyType& lazy) { apply(Range::half_open(l, r), lazy); }
    void apply(const LazyType& lazy) { apply(Range::all(), lazy); }

    // tree shape, one parenthesised group per node: ( left value right )
    void debug(std::ostream& os = std::cout) const
    {
        debug_(os, root, len);
        os << '\n';
    }

private:
    void check_index(const char* op, size_t index) const
    {
        if (index >= len)
            throw std::out_of_range((boost::format("MasterTree::%1%: index %2% out of range (size %3%)") % op % index % len).str());
    }

    // to a half-open [l, r) inside [0, len]
    std::pair<size_t, size_t> normalize(const char* op, const Range& range) const
    {
        size_t l = 0, r = len;
        switch (range.start.kind)
        {
          case Bound::Included:
              if (range.start.value > len)
                  throw std::out_of_range((boost::format("MasterTree::%1%: start %2% out of range (size %3%)") % op % range.start.value % len).str());
              l = range.start.value;
              break;
          case Bound::Excluded:
              if (range.start.value >= len)
                  throw std::out_of_range((boost::format("MasterTree::%1%: start %2% out of range (size %3%)") % op % range.start.value % len).str());
              l = range.start.value + 1;
              break;
          case Bound::Unbounded:
              break;
        }
        switch (range.end.kind)
        {
          case Bound::Included:
              if (range.end.value >= len)
                  throw std::out_of_range((boost::format("MasterTree::%1%: end %2% out of range (size %3%)") % op % range.end.value % len).str());
              r = range.end.value + 1;
              break;
          case Bound::Excluded:
              if (range.end.value > len)
                  throw std::out_of_range((boost::format("MasterTree::%1%: end %2% out of range (size %3%)") % op % range.end.value % len).str());
              r = range.end.value;
              break;
          case Bound::Unbounded:
              break;
        }
        if (l > r)
            throw std::invalid_argument((boost::format("MasterTree::%1%: range [%2%, %3%) is reversed") % op % l % r).str());
        return std::make_pair(l, r);
    }

    static void debug_(std::ostream& os, const Handle& h, size_t sub_len)
    {
        if (!h)
            return;
        const NodeType& node = h.setup(sub_len);
        os << "( ";
        debug_(os, node.left, node.idx);
        os << node.val << ' ';
        debug_(os, node.right, sub_len - 1 - node.idx);
        os << ") ";
    }
};

template <typename Manager>
std::ostream& operator<<(std::ostream& os, const MasterTree<Manager>& tree)
{
    os << '[';
    bool first = true;
    for (const auto& v : tree) {
        if (!first)
            os << ", ";
        os << v;
        first = false;
    }
    return os << ']';
}

template <typename Manager>
void swap(MasterTree<Manager>& lhs, MasterTree<Manager>& rhs)
{
    lhs.swap(rhs);
}

}

#endif
