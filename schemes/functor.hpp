#ifndef SCHEMES_FUNCTOR_HPP
#define SCHEMES_FUNCTOR_HPP

#include <type_traits>
#include <utility>

namespace schemes {

// pattern functors, comonads and monads expose their operations as free
// functions found by ADL:
//
//   map(self, func)   structure-preserving map over the recursive positions
//   extract(self)     comonad counit
//   duplicate(self)   comonad comultiplication
//   T::pure(value)    monad unit
//   join(self)        monad multiplication
//
// map must not alter the shape of its argument: mapping the identity is a
// no-op, and mapping a composition is the composition of the maps. nothing
// checks this.

// calls map from contexts where a member named map would hide it
template<class Self, class Func>
static auto fmap(const Self& self, Func func) -> decltype(map(self, func)) {
  return map(self, func);
}


struct functor {
  template<class Derived, class Func,
           class=std::enable_if_t<std::is_base_of<functor, std::decay_t<Derived>>::value>>
  friend auto operator|=(Derived&& self, Func func) {
    return map(std::forward<Derived>(self), func);
  }
};


struct monad {
  template<class Derived, class Func,
           class=std::enable_if_t<std::is_base_of<monad, std::decay_t<Derived>>::value>>
  friend auto operator>>=(Derived&& self, Func func) {
    return join(map(std::forward<Derived>(self), func));
  }
};


struct comonad {
  template<class Derived, class Func,
           class=std::enable_if_t<std::is_base_of<comonad, std::decay_t<Derived>>::value>>
  friend auto extend(const Derived& self, Func func) {
    return map(duplicate(self), func);
  }
};


} // namespace schemes

#endif
