#ifndef MASTERTREE_MASTER_MANAGER_HPP_
#define MASTERTREE_MASTER_MANAGER_HPP_

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <limits>
#include <utility>
#include <boost/optional.hpp>

namespace mastertree
{

/**
   Managers for the usual range query / range update pairs.

   Each InfoType holds the aggregate of its subtree with the pending update already
   applied, plus the update itself (the mark) still owed to the children.
   propagate pushes the mark one level down and clears it.
 */

template <typename T>
struct RangeSumRangeAdd // query for range sum, op on range add
{
    using ValueType = T;
    struct InfoType { T sum; T add; };
    using ProdType = T;
    using LazyType = T;

    static InfoType make_info(boost::optional<const InfoType&> left, size_t, const T& val,
                              boost::optional<const InfoType&> right, size_t)
    {
        return InfoType{(left ? left->sum : T(0)) + val + (right ? right->sum : T(0)), T(0)};
    }
    static void rev(InfoType&, size_t){}
    static void apply_info(InfoType& info, size_t len, const T& lazy)
    {
        info.sum += lazy * static_cast<T>(len);
        info.add += lazy;
    }
    static void apply_val(T& val, const T& lazy){ val += lazy; }
    static void propagate(InfoType& info, boost::optional<InfoType&> left, size_t left_len, T& val,
                          boost::optional<InfoType&> right, size_t right_len)
    {
        if (info.add == T(0))
            return;
        apply_val(val, info.add);
        if (left) apply_info(*left, left_len, info.add);
        if (right) apply_info(*right, right_len, info.add);
        info.add = T(0);
    }
    static T info2prod(const InfoType& info){ return info.sum; }
    static T val2prod(const T& val){ return val; }
    static T e(){ return T(0); }
    static T op(T l, T r){ return l + r; }
};

template <typename T>
struct RangeSumRangeAssign // query for range sum, op on range reset
{
    using ValueType = T;
    struct InfoType { T sum; T val; bool isMark; };
    using ProdType = T;
    using LazyType = T;

    static InfoType make_info(boost::optional<const InfoType&> left, size_t, const T& val,
                              boost::optional<const InfoType&> right, size_t)
    {
        return InfoType{(left ? left->sum : T(0)) + val + (right ? right->sum : T(0)), T(0), false};
    }
    static void rev(InfoType&, size_t){}
    static void apply_info(InfoType& info, size_t len, const T& lazy)
    {
        info.sum = lazy * static_cast<T>(len);
        info.val = lazy;
        info.isMark = true;
    }
    static void apply_val(T& val, const T& lazy){ val = lazy; }
    static void propagate(InfoType& info, boost::optional<InfoType&> left, size_t left_len, T& val,
                          boost::optional<InfoType&> right, size_t right_len)
    {
        if (!info.isMark)
            return;
        apply_val(val, info.val);
        if (left) apply_info(*left, left_len, info.val);
        if (right) apply_info(*right, right_len, info.val);
        info.isMark = false;
    }
    static T info2prod(const InfoType& info){ return info.sum; }
    static T val2prod(const T& val){ return val; }
    static T e(){ return T(0); }
    static T op(T l, T r){ return l + r; }
};

template <typename T>
struct RangeMaxRangeAssign
{
    using ValueType = T;
    struct InfoType { T max; T val; bool isMark; };
    using ProdType = T;
    using LazyType = T;

    static InfoType make_info(boost::optional<const InfoType&> left, size_t, const T& val,
                              boost::optional<const InfoType&> right, size_t)
    {
        T m = val;
        if (left) m = std::max(m, left->max);
        if (right) m = std::max(m, right->max);
        return InfoType{m, T(), false};
    }
    static void rev(InfoType&, size_t){}
    static void apply_info(InfoType& info, size_t, const T& lazy)
    {
        info.max = lazy;
        info.val = lazy;
        info.isMark = true;
    }
    static void apply_val(T& val, const T& lazy){ val = lazy; }
    static void propagate(InfoType& info, boost::optional<InfoType&> left, size_t left_len, T& val,
                          boost::optional<InfoType&> right, size_t right_len)
    {
        if (!info.isMark)
            return;
        apply_val(val, info.val);
        if (left) apply_info(*left, left_len, info.val);
        if (right) apply_info(*right, right_len, info.val);
        info.isMark = false;
    }
    static T info2prod(const InfoType& info){ return info.max; }
    static T val2prod(const T& val){ return val; }
    static T e(){ return std::numeric_limits<T>::lowest(); }
    static T op(T l, T r){ return std::max(l, r); }
};

template <typename T>
struct RangeMinRangeAdd
{
    using ValueType = T;
    struct InfoType { T min; T add; };
    using ProdType = T;
    using LazyType = T;

    static InfoType make_info(boost::optional<const InfoType&> left, size_t, const T& val,
                              boost::optional<const InfoType&> right, size_t)
    {
        T m = val;
        if (left) m = std::min(m, left->min);
        if (right) m = std::min(m, right->min);
        return InfoType{m, T(0)};
    }
    static void rev(InfoType&, size_t){}
    static void apply_info(InfoType& info, size_t, const T& lazy)
    {
        info.min += lazy;
        info.add += lazy;
    }
    static void apply_val(T& val, const T& lazy){ val += lazy; }
    static void propagate(InfoType& info, boost::optional<InfoType&> left, size_t left_len, T& val,
                          boost::optional<InfoType&> right, size_t right_len)
    {
        if (info.add == T(0))
            return;
        apply_val(val, info.add);
        if (left) apply_info(*left, left_len, info.add);
        if (right) apply_info(*right, right_len, info.add);
        info.add = T(0);
    }
    static T info2prod(const InfoType& info){ return info.min; }
    static T val2prod(const T& val){ return val; }
    static T e(){ return std::numeric_limits<T>::max(); }
    static T op(T l, T r){ return std::min(l, r); }
};

// x -> a*x + b
template <typename T>
struct Affine
{
    T a;
    T b;
    Affine():a(1), b(0){}
    Affine(T a_, T b_):a(a_), b(b_){}

    T operator()(const T& x) const { return a * x + b; }
    // *this first, then g
    Affine then(const Affine& g) const { return Affine(g.a * a, g.a * b + g.b); }
    bool is_identity() const { return a == T(1) && b == T(0); }
    bool operator==(const Affine& rhs) const { return a == rhs.a && b == rhs.b; }
    bool operator!=(const Affine& rhs) const { return !(*this == rhs); }
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const Affine<T>& f)
{
    return os << '(' << f.a << ", " << f.b << ')';
}

template <typename T>
Affine<T> power(Affine<T> f, size_t n)
{
    Affine<T> ret;
    while (n) {
        if (n & 1)
            ret = ret.then(f);
        f = f.then(f);
        n >>= 1;
    }
    return ret;
}

template <typename T>
struct RangeAffineRangeSum
{
    using ValueType = T;
    struct InfoType { T sum; Affine<T> lazy; };
    using ProdType = T;
    using LazyType = Affine<T>;

    static InfoType make_info(boost::optional<const InfoType&> left, size_t, const T& val,
                              boost::optional<const InfoType&> right, size_t)
    {
        return InfoType{(left ? left->sum : T(0)) + val + (right ? right->sum : T(0)), Affine<T>()};
    }
    static void rev(InfoType&, size_t){}
    static void apply_info(InfoType& info, size_t len, const Affine<T>& f)
    {
        info.sum = f.a * info.sum + f.b * static_cast<T>(len);
        info.lazy = info.lazy.then(f);
    }
    static void apply_val(T& val, const Affine<T>& f){ val = f(val); }
    static void propagate(InfoType& info, boost::optional<InfoType&> left, size_t left_len, T& val,
                          boost::optional<InfoType&> right, size_t right_len)
    {
        if (info.lazy.is_identity())
            return;
        apply_val(val, info.lazy);
        if (left) apply_info(*left, left_len, info.lazy);
        if (right) apply_info(*right, right_len, info.lazy);
        info.lazy = Affine<T>();
    }
    static T info2prod(const InfoType& info){ return info.sum; }
    static T val2prod(const T& val){ return val; }
    static T e(){ return T(0); }
    static T op(T l, T r){ return l + r; }
};

/**
   Elements are affine maps, the product of a range is their composition applied
   left to right. Not commutative, so reversal matters: info keeps the composition
   in both directions and rev swaps them.
 */
template <typename T>
struct RangeCompositeRangeAssign
{
    using ValueType = Affine<T>;
    struct InfoType { Affine<T> fwd; Affine<T> bwd; Affine<T> val; bool isMark; };
    using ProdType = Affine<T>;
    using LazyType = Affine<T>;

    static InfoType make_info(boost::optional<const InfoType&> left, size_t, const Affine<T>& val,
                              boost::optional<const InfoType&> right, size_t)
    {
        Affine<T> fwd = left ? left->fwd.then(val) : val;
        Affine<T> bwd = right ? right->bwd.then(val) : val;
        if (right) fwd = fwd.then(right->fwd);
        if (left) bwd = bwd.then(left->bwd);
        return InfoType{fwd, bwd, Affine<T>(), false};
    }
    static void rev(InfoType& info, size_t){ std::swap(info.fwd, info.bwd); }
    static void apply_info(InfoType& info, size_t len, const Affine<T>& f)
    {
        info.fwd = info.bwd = power(f, len);
        info.val = f;
        info.isMark = true;
    }
    static void apply_val(Affine<T>& val, const Affine<T>& f){ val = f; }
    static void propagate(InfoType& info, boost::optional<InfoType&> left, size_t left_len, Affine<T>& val,
                          boost::optional<InfoType&> right, size_t right_len)
    {
        if (!info.isMark)
            return;
        apply_val(val, info.val);
        if (left) apply_info(*left, left_len, info.val);
        if (right) apply_info(*right, right_len, info.val);
        info.isMark = false;
    }
    static Affine<T> info2prod(const InfoType& info){ return info.fwd; }
    static Affine<T> val2prod(const Affine<T>& val){ return val; }
    static Affine<T> e(){ return Affine<T>(); }
    static Affine<T> op(Affine<T> l, Affine<T> r){ return l.then(r); }
};

}

#endif
