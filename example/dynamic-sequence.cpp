#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <boost/lexical_cast.hpp>
#include "master-tree.hpp"
#include "master-manager.hpp"

using namespace std;

/*
  Dynamic sequence with range affine update and range sum, modulo 998244353.

  input:
    N Q
    a_0 ... a_{N-1}
    Q lines, one of
      0 i x        insert x before position i
      1 i          erase position i
      2 l r        reverse [l, r)
      3 l r b c    a_k = b * a_k + c for l <= k < r
      4 l r        print sum of [l, r)

  usage: dynamic-sequence [seed] < input
 */

namespace
{

constexpr unsigned long long MOD = 998244353;

class ModInt
{
public:
    ModInt(unsigned long long v_ = 0):v(v_ % MOD){}
    ModInt operator+(const ModInt& b) const { return ModInt(v + b.v); }
    ModInt operator*(const ModInt& b) const { return ModInt(v * b.v); }
    bool operator==(const ModInt& b) const { return v == b.v; }
    unsigned long long get() const { return v; }
private:
    unsigned long long v;
};

ostream& operator<<(ostream& os, const ModInt& m) { return os << m.get(); }

using Tree = mastertree::MasterTree<mastertree::RangeAffineRangeSum<ModInt> >;

void reverse_range(Tree& tree, size_t l, size_t r)
{
    auto rest = Tree::split(std::move(tree), r);
    auto head = Tree::split(std::move(rest.first), l);
    head.second.reverse();
    tree = Tree::merge(Tree::merge(std::move(head.first), std::move(head.second)), std::move(rest.second));
}

}

int main(int argc, char* argv[])
{
    std::uint64_t seed = MASTERTREE_DEFAULT_SEED;
    if (argc > 1) {
        try {
            seed = boost::lexical_cast<std::uint64_t>(argv[1]);
        } catch (const boost::bad_lexical_cast& e) {
            cerr << "bad seed '" << argv[1] << "': " << e.what() << endl;
            return 1;
        }
    }

    ios::sync_with_stdio(false);
    cin.tie(nullptr);

    size_t n, q;
    if (!(cin >> n >> q)) {
        cerr << "expected N Q" << endl;
        return 1;
    }
    try {
        Tree tree(seed);
        for (size_t i = 0; i < n; i++) {
            unsigned long long a;
            cin >> a;
            tree.push_back(ModInt(a));
        }
        while (q--) {
            int t;
            if (!(cin >> t)) {
                cerr << "input ended early" << endl;
                return 1;
            }
            switch (t)
            {
              case 0:
              {
                  size_t i;
                  unsigned long long x;
                  cin >> i >> x;
                  tree.insert(i, ModInt(x));
                  break;
              }
              case 1:
              {
                  size_t i;
                  cin >> i;
                  tree.remove(i);
                  break;
              }
              case 2:
              {
                  size_t l, r;
                  cin >> l >> r;
                  reverse_range(tree, l, r);
                  break;
              }
              case 3:
              {
                  size_t l, r;
                  unsigned long long b, c;
                  cin >> l >> r >> b >> c;
                  tree.apply(l, r, mastertree::Affine<ModInt>(b, c));
                  break;
              }
              case 4:
              {
                  size_t l, r;
                  cin >> l >> r;
                  cout << tree.prod(l, r) << '\n';
                  break;
              }
              default:
                  cerr << "unknown query type " << t << endl;
                  return 1;
            }
        }
    } catch (const std::exception& e) {
        cerr << e.what() << endl;
        return 1;
    }
    cout << flush;
    return 0;
}
