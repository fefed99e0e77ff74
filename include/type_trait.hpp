#ifndef MASTERTREE_TYPE_TRAITS_HPP
#define MASTERTREE_TYPE_TRAITS_HPP

#include <cstddef>
#include <type_traits>
#include <utility>
#include <boost/optional.hpp>

namespace mastertree
{

template <typename...> using void_type = void;

template <typename From, typename To>
using require_convertible = typename std::enable_if<std::is_convertible<From, To>::value>::type;

/**
   is_master_manager<M> holds when M provides the types
   ValueType, InfoType, ProdType, LazyType and the static members

     make_info(optional<const Info&>, size_t, const Value&, optional<const Info&>, size_t) -> Info
     rev(Info&, size_t)
     apply_info(Info&, size_t, const Lazy&)
     apply_val(Value&, const Lazy&)
     propagate(Info&, optional<Info&>, size_t, Value&, optional<Info&>, size_t)
     info2prod(const Info&) -> Prod
     val2prod(const Value&) -> Prod
     e() -> Prod
     op(Prod, Prod) -> Prod

   propagate must clear whatever lazy part of Info it pushed down; nothing here can check that.
 */
template <typename M, typename=void> struct is_master_manager : std::false_type {};
template <typename M>
struct is_master_manager <M, void_type<
    typename M::ValueType, typename M::InfoType, typename M::ProdType, typename M::LazyType,
    require_convertible<decltype(M::make_info(std::declval<boost::optional<const typename M::InfoType&> >(), std::size_t(),
                                              std::declval<const typename M::ValueType&>(),
                                              std::declval<boost::optional<const typename M::InfoType&> >(), std::size_t())),
                        typename M::InfoType>,
    decltype(M::rev(std::declval<typename M::InfoType&>(), std::size_t())),
    decltype(M::apply_info(std::declval<typename M::InfoType&>(), std::size_t(), std::declval<const typename M::LazyType&>())),
    decltype(M::apply_val(std::declval<typename M::ValueType&>(), std::declval<const typename M::LazyType&>())),
    decltype(M::propagate(std::declval<typename M::InfoType&>(),
                          std::declval<boost::optional<typename M::InfoType&> >(), std::size_t(),
                          std::declval<typename M::ValueType&>(),
                          std::declval<boost::optional<typename M::InfoType&> >(), std::size_t())),
    require_convertible<decltype(M::info2prod(std::declval<const typename M::InfoType&>())), typename M::ProdType>,
    require_convertible<decltype(M::val2prod(std::declval<const typename M::ValueType&>())), typename M::ProdType>,
    require_convertible<decltype(M::e()), typename M::ProdType>,
    require_convertible<decltype(M::op(std::declval<typename M::ProdType>(), std::declval<typename M::ProdType>())),
                        typename M::ProdType>
    > > : std::true_type {};

}

#endif
