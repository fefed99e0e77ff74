#ifndef MASTERTREE_RAND_HPP_
#define MASTERTREE_RAND_HPP_

#include <cstdint>
#include <cstddef>
#include <random>
#include <limits>
#include <type_traits>

#ifndef MASTERTREE_DEFAULT_SEED
#define MASTERTREE_DEFAULT_SEED 0xf285692d6bf31f57ULL
#endif

namespace mastertree
{

template<typename Numeric, typename Generator = std::default_random_engine>
class Rand
{
    using Distribution = typename std::conditional<
        std::is_integral<Numeric>::value
        , std::uniform_int_distribution<Numeric>
        , std::uniform_real_distribution<Numeric>
    >::type;
public:
    Rand():gen(rd()){}
    template <typename ...Args>
    Rand(Args... args):gen(rd()), dis(static_cast<Numeric>(args)...){}
    Numeric operator()() { return get(); }
    Numeric get() {return dis(gen); }
    template <typename ...Args>
    void set_range(Args... args) { dis = Distribution(static_cast<Numeric>(args)...); }
    template <typename ...Args>
    Numeric get(Args... args) { return Distribution(static_cast<Numeric>(args)...)(gen); }
    void seed(typename Generator::result_type val){gen.seed(val);}
    template <class Sseq>
    void seed(Sseq& q){gen.seed(q);}
private:
    std::random_device rd;
    Generator gen;
    Distribution dis;
};

using RandInt = Rand<long long>;

/**
   xorshift64 (shifts 7 and 9) used as a weighted coin.

   The state is never zero: a zero seed is replaced by MASTERTREE_DEFAULT_SEED,
   and every step is an invertible linear map, so a non-zero state stays non-zero.
 */
class CoinFlip
{
    std::uint64_t state;
public:
    CoinFlip():state(MASTERTREE_DEFAULT_SEED){}
    explicit CoinFlip(std::uint64_t seed):state(seed ? seed : MASTERTREE_DEFAULT_SEED){}

    std::uint64_t next()
    {
        state ^= state << 7;
        state ^= state >> 9;
        return state;
    }

    // true with probability a/(a+b). a+b must not overflow size_t.
    bool choose(std::size_t a, std::size_t b)
    {
        unsigned __int128 wide = static_cast<unsigned __int128>(next()) * (a + b);
        return static_cast<std::size_t>(wide >> 64) < a;
    }

    // advance once, then hand out a generator whose stream runs the mixing
    // steps in the opposite order.
    CoinFlip fork()
    {
        next();
        CoinFlip ret(*this);
        ret.state ^= ret.state >> 7;
        ret.state ^= ret.state << 9;
        return ret;
    }

    std::uint64_t seed() const { return state; }
};

}

#endif
