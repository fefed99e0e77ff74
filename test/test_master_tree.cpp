#define BOOST_TEST_MODULE test_mastertree

#include <boost/test/unit_test.hpp>
#include <boost/timer/timer.hpp>

#include "master-tree.hpp"
#include "master-manager.hpp"
#include "rand.hpp"
#include <algorithm>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

using namespace mastertree;

namespace
{

using Tree = MasterTree<RangeSumRangeAdd<int> >;

std::vector<int> to_vector(const Tree& t)
{
    return std::vector<int>(t.begin(), t.end());
}

Tree random_tree(size_t n, std::uint64_t seed, std::vector<int>& model)
{
    Tree t(seed);
    RandInt value_gen(-100, 100);
    RandInt pos_gen;
    model.clear();
    for (size_t i = 0; i < n; i++) {
        size_t at = pos_gen.get(0, model.size());
        int v = value_gen.get();
        model.insert(model.begin() + at, v);
        t.insert(at, v);
    }
    return t;
}

}

BOOST_AUTO_TEST_SUITE(master_tree_test)

BOOST_AUTO_TEST_CASE(reference_scenario)
{
    CoinFlip seeder;
    // try 1000 different seeds
    for (int round = 0; round < 1000; round++) {
        Tree mt(seeder.fork().seed());
        for (int v : {3, 1, 4, 1, 5, 9, 2, 6, 5, 3, 5, 8, 9, 7, 9, 3})
            mt.insert(0, v);
        BOOST_REQUIRE(to_vector(mt) == std::vector<int>({3, 9, 7, 9, 8, 5, 3, 5, 6, 2, 9, 5, 1, 4, 1, 3}));

        mt.reverse();
        BOOST_REQUIRE(to_vector(mt) == std::vector<int>({3, 1, 4, 1, 5, 9, 2, 6, 5, 3, 5, 8, 9, 7, 9, 3}));
        BOOST_CHECK_EQUAL(mt.prod(4, 12), 43);
        BOOST_CHECK_EQUAL(mt.prod(Range::from(5)), 66);

        mt.apply(7, 12, 20);
        mt.apply(Range::all(), 40);
        // [43, 41, 44, 41, 45, 49, 42, 66, 65, 63, 65, 68, 49, 47, 49, 43]
        BOOST_CHECK_EQUAL(mt.prod(4, 12), 463);
        BOOST_CHECK_EQUAL(mt.prod(Range::from(5)), 606);

        auto parts = Tree::split(std::move(mt), 9);
        BOOST_CHECK_EQUAL(parts.first.prod(3, 6), 135);
        BOOST_CHECK_EQUAL(parts.second.prod(Range::until(5)), 292);

        mt = Tree::merge(std::move(parts.second), std::move(parts.first));
        const int hand_calculation[] = {63, 65, 68, 49, 47, 49, 43, 43, 41, 44, 41, 45, 49, 42, 66, 65};
        BOOST_REQUIRE_EQUAL(mt.size(), 16u);
        for (size_t i = 0; i < 16; i++)
            BOOST_CHECK_EQUAL(mt[i], hand_calculation[i]);
    }
}

BOOST_AUTO_TEST_CASE(insert_keeps_order)
{
    std::vector<int> v;
    Tree t = random_tree(500, 1, v);
    BOOST_CHECK_EQUAL(t.size(), v.size());
    BOOST_CHECK(to_vector(t) == v);
    for (size_t i = 0; i < v.size(); i++)
        BOOST_CHECK_EQUAL(t[i], v[i]);
}

BOOST_AUTO_TEST_CASE(remove_returns_value)
{
    std::vector<int> v;
    Tree t = random_tree(300, 2, v);
    RandInt pos_gen;
    while (!v.empty()) {
        size_t at = pos_gen.get(0, v.size() - 1);
        size_t before = t.size();
        BOOST_CHECK_EQUAL(t.remove(at), v[at]);
        v.erase(v.begin() + at);
        BOOST_CHECK_EQUAL(t.size(), before - 1);
        if (v.size() % 37 == 0)
            BOOST_CHECK(to_vector(t) == v);
    }
    BOOST_CHECK(t.empty());
    BOOST_CHECK(t.begin() == t.end());
    BOOST_CHECK_EQUAL(t.prod(), 0);
}

BOOST_AUTO_TEST_CASE(split_then_merge_restores)
{
    std::vector<int> v;
    Tree t = random_tree(64, 3, v);
    for (size_t i = 0; i <= v.size(); i++) {
        auto parts = Tree::split(t, i);
        BOOST_CHECK_EQUAL(parts.first.size(), i);
        BOOST_CHECK_EQUAL(parts.second.size(), v.size() - i);
        BOOST_CHECK(to_vector(parts.first) == std::vector<int>(v.begin(), v.begin() + i));
        BOOST_CHECK(to_vector(parts.second) == std::vector<int>(v.begin() + i, v.end()));

        Tree back = Tree::merge(std::move(parts.first), std::move(parts.second));
        BOOST_CHECK(to_vector(back) == v);
        for (size_t l = 0; l <= v.size(); l += 7)
            for (size_t r = l; r <= v.size(); r += 5)
                BOOST_CHECK_EQUAL(back.prod(l, r), std::accumulate(v.begin() + l, v.begin() + r, 0));
    }
}

BOOST_AUTO_TEST_CASE(reverse_twice_is_identity)
{
    std::vector<int> v;
    Tree t = random_tree(100, 4, v);
    t.reverse();
    BOOST_CHECK(to_vector(t) == std::vector<int>(v.rbegin(), v.rend()));
    t.reverse();
    BOOST_CHECK(to_vector(t) == v);

    Tree empty;
    empty.reverse();
    BOOST_CHECK(empty.empty());
}

BOOST_AUTO_TEST_CASE(apply_hits_range_once)
{
    std::vector<int> v;
    Tree t = random_tree(120, 5, v);
    RandInt pos_gen;
    RandInt value_gen(-5, 5);
    for (int round = 0; round < 500; round++) {
        size_t b = pos_gen.get(0, v.size());
        size_t e = pos_gen.get(0, v.size());
        if (b > e)
            std::swap(b, e);
        int val = value_gen.get();
        t.apply(b, e, val);
        for (size_t i = b; i < e; i++)
            v[i] += val;
        size_t qb = pos_gen.get(0, v.size());
        size_t qe = pos_gen.get(0, v.size());
        if (qb > qe)
            std::swap(qb, qe);
        BOOST_CHECK_EQUAL(t.prod(qb, qe), std::accumulate(v.begin() + qb, v.begin() + qe, 0));
    }
    BOOST_CHECK(to_vector(t) == v);
}

BOOST_AUTO_TEST_CASE(copy_on_write_isolation)
{
    std::vector<int> v;
    Tree original = random_tree(200, 6, v);
    const int total = std::accumulate(v.begin(), v.end(), 0);

    Tree copy = original;
    copy.insert(10, 1000);
    copy.remove(50);
    copy.apply(20, 150, 7);
    copy.reverse();
    BOOST_CHECK(to_vector(original) == v);
    BOOST_CHECK_EQUAL(original.prod(), total);

    // split and merge through a copy leave the source alone
    auto parts = Tree::split(original, 77);
    parts.second.apply(Range::all(), -3);
    Tree swapped = Tree::merge(parts.second, parts.first);
    BOOST_CHECK_EQUAL(swapped.size(), v.size());
    BOOST_CHECK(to_vector(original) == v);

    // and writes to the source do not leak into the copy
    std::vector<int> copied = to_vector(copy);
    original.apply(Range::all(), 11);
    original.reverse();
    original.remove(0);
    BOOST_CHECK(to_vector(copy) == copied);
}

BOOST_AUTO_TEST_CASE(every_version_stays_readable)
{
    std::vector<Tree> versions;
    std::vector<std::vector<int> > models;
    Tree t(99);
    std::vector<int> v;
    RandInt op_gen(1, 4);
    RandInt pos_gen;
    RandInt value_gen(-9, 9);
    for (int round = 0; round < 300; round++) {
        switch (op_gen.get())
        {
          case 1:
          {
              size_t at = pos_gen.get(0, v.size());
              int val = value_gen.get();
              t.insert(at, val);
              v.insert(v.begin() + at, val);
              break;
          }
          case 2:
          {
              if (v.empty())
                  break;
              size_t at = pos_gen.get(0, v.size() - 1);
              t.remove(at);
              v.erase(v.begin() + at);
              break;
          }
          case 3:
          {
              t.reverse();
              std::reverse(v.begin(), v.end());
              break;
          }
          case 4:
          {
              size_t b = pos_gen.get(0, v.size());
              size_t e = pos_gen.get(0, v.size());
              if (b > e)
                  std::swap(b, e);
              int val = value_gen.get();
              t.apply(b, e, val);
              for (size_t i = b; i < e; i++)
                  v[i] += val;
              break;
          }
        }
        versions.push_back(t);
        models.push_back(v);
    }
    for (size_t i = 0; i < versions.size(); i++) {
        BOOST_CHECK(to_vector(versions[i]) == models[i]);
        BOOST_CHECK_EQUAL(versions[i].prod(), std::accumulate(models[i].begin(), models[i].end(), 0));
    }
}

BOOST_AUTO_TEST_CASE(seeds_change_shape_not_contents)
{
    std::vector<int> v(50);
    std::iota(v.begin(), v.end(), 0);
    Tree a(1), b(2);
    for (int x : v) {
        a.push_back(x);
        b.push_back(x);
    }
    BOOST_CHECK(to_vector(a) == to_vector(b));
    BOOST_CHECK_EQUAL(a.prod(10, 40), b.prod(10, 40));
}

BOOST_AUTO_TEST_CASE(range_bounds)
{
    Tree t{10, 20, 30, 40, 50};
    BOOST_CHECK_EQUAL(t.prod(Range::half_open(1, 3)), 50);
    BOOST_CHECK_EQUAL(t.prod(Range::closed(1, 3)), 90);
    BOOST_CHECK_EQUAL(t.prod(Range::from(3)), 90);
    BOOST_CHECK_EQUAL(t.prod(Range::until(2)), 30);
    BOOST_CHECK_EQUAL(t.prod(Range::through(2)), 60);
    BOOST_CHECK_EQUAL(t.prod(Range::all()), 150);
    BOOST_CHECK_EQUAL(t.prod(Range{Bound{Bound::Excluded, 0}, Bound{Bound::Excluded, 2}}), 20);
    BOOST_CHECK_EQUAL(t.prod(Range{Bound{Bound::Excluded, 4}, Bound{Bound::Unbounded, 0}}), 0);
    BOOST_CHECK_EQUAL(t.prod(2, 2), 0);
    BOOST_CHECK_EQUAL(t.prod(5, 5), 0);

    t.apply(Range::closed(0, 1), 1);
    t.apply(Range::from(4), 100);
    t.apply(3, 3, 1000);
    BOOST_CHECK(to_vector(t) == std::vector<int>({11, 21, 30, 40, 150}));
}

BOOST_AUTO_TEST_CASE(precondition_violations_throw)
{
    Tree t{1, 2, 3};
    BOOST_CHECK_THROW(t.insert(4, 0), std::out_of_range);
    BOOST_CHECK_THROW(t.remove(3), std::out_of_range);
    BOOST_CHECK_THROW(t.at(3), std::out_of_range);
    BOOST_CHECK_THROW(t[7], std::out_of_range);
    BOOST_CHECK_THROW(Tree::split(t, 4), std::out_of_range);
    BOOST_CHECK_THROW(t.prod(0, 4), std::out_of_range);
    BOOST_CHECK_THROW(t.prod(Range::closed(0, 3)), std::out_of_range);
    BOOST_CHECK_THROW(t.prod(Range{Bound{Bound::Excluded, 3}, Bound{Bound::Unbounded, 0}}), std::out_of_range);
    BOOST_CHECK_THROW(t.prod(2, 1), std::invalid_argument);
    BOOST_CHECK_THROW(t.apply(Range::from(4), 1), std::out_of_range);
    BOOST_CHECK_THROW(t.apply(3, 0, 1), std::invalid_argument);

    Tree empty;
    BOOST_CHECK_THROW(empty.remove(0), std::out_of_range);
    BOOST_CHECK_THROW(empty.at(0), std::out_of_range);
    // nothing was changed by the failed calls
    BOOST_CHECK(to_vector(t) == std::vector<int>({1, 2, 3}));
}

BOOST_AUTO_TEST_CASE(iterator_and_printing)
{
    Tree t{1, 2, 3, 4};
    auto it = t.begin();
    BOOST_CHECK_EQUAL(it.size(), 4u);
    BOOST_CHECK_EQUAL(*it++, 1);
    BOOST_CHECK_EQUAL(*it, 2);
    BOOST_CHECK_EQUAL(it.size(), 3u);

    std::ostringstream flat;
    flat << t;
    BOOST_CHECK_EQUAL(flat.str(), "[1, 2, 3, 4]");

    t.reverse();
    std::ostringstream shape;
    t.debug(shape);
    std::string s = shape.str();
    BOOST_CHECK(s.substr(0, 2) == "( ");
    BOOST_CHECK_EQUAL(std::count(s.begin(), s.end(), '('), 4);
    BOOST_CHECK_EQUAL(std::count(s.begin(), s.end(), ')'), 4);
    std::string values;
    for (char c : s)
        if (c >= '0' && c <= '9')
            values += c;
    BOOST_CHECK_EQUAL(values, "4321");
}

BOOST_AUTO_TEST_CASE(bulk_insert_timing)
{
    constexpr size_t N = 200000;
    boost::timer::cpu_timer timer;
    Tree t;
    RandInt pos_gen;
    for (size_t i = 0; i < N; i++)
        t.insert(pos_gen.get(0, i), static_cast<int>(i % 7));
    BOOST_TEST_MESSAGE("inserting " << N << " elements:" << timer.format());
    BOOST_CHECK_EQUAL(t.size(), N);
    BOOST_CHECK_EQUAL(t.prod(), static_cast<int>(std::accumulate(t.begin(), t.end(), 0LL)));
}

BOOST_AUTO_TEST_SUITE_END()
