#ifndef SCHEMES_ENV_HPP
#define SCHEMES_ENV_HPP

#include "functor.hpp"

#include <ostream>
#include <type_traits>
#include <utility>

namespace schemes {

// environment comonad: a value paired with a read-only context. first is the
// context, second the value.
template<class E, class A>
struct env: std::pair<E, A>, functor, comonad {
  using value_type = A;

  env(E first, A second): std::pair<E, A>(std::move(first), std::move(second)) { }

  template<class Func>
  friend auto map(const env& self, Func func) {
    using type = std::decay_t<std::result_of_t<Func(const A&)>>;
    return env<E, type>(self.first, func(self.second));
  }

  friend A extract(const env& self) { return self.second; }

  friend env<E, env> duplicate(const env& self) {
    return {self.first, self};
  }

  friend const E& ask(const env& self) { return self.first; }

  friend std::ostream& operator<<(std::ostream& out, const env& self) {
    return out << "(env " << self.first << " " << self.second << ")";
  }
};


// environment transformer: a context paired with a value of an underlying
// comonad W
template<class E, class W>
struct env_t: functor, comonad {
  using lower_type = W;

  E first;
  W lower;

  env_t(E first, W lower): first(std::move(first)), lower(std::move(lower)) { }

  template<class Func>
  friend auto map(const env_t& self, Func func) {
    auto lower = map(self.lower, func);
    return env_t<E, decltype(lower)>(self.first, std::move(lower));
  }

  friend auto extract(const env_t& self) { return extract(self.lower); }

  friend auto duplicate(const env_t& self) {
    const E first = self.first;
    auto lower = map(duplicate(self.lower), [first](const W& w) {
      return env_t(first, w);
    });
    return env_t<E, decltype(lower)>(first, std::move(lower));
  }

  friend const E& ask(const env_t& self) { return self.first; }
};

} // namespace schemes

#endif
