#ifndef SCHEMES_IDENTITY_HPP
#define SCHEMES_IDENTITY_HPP

#include "functor.hpp"

#include <ostream>
#include <type_traits>

namespace schemes {

// identity (co)monad
template<class A>
struct identity: functor, monad, comonad {
  using value_type = A;
  A value;

  explicit identity(A value): value(std::move(value)) { }

  static identity pure(A value) { return identity(std::move(value)); }

  template<class Func>
  friend auto map(const identity& self, Func func) {
    using type = std::decay_t<std::result_of_t<Func(const A&)>>;
    return identity<type>(func(self.value));
  }

  friend A extract(const identity& self) { return self.value; }

  friend identity<identity> duplicate(const identity& self) {
    return identity<identity>(self);
  }

  friend bool operator==(const identity& lhs, const identity& rhs) {
    return lhs.value == rhs.value;
  }

  friend std::ostream& operator<<(std::ostream& out, const identity& self) {
    return out << "(identity " << self.value << ")";
  }
};


template<class A>
static identity<A> join(const identity<identity<A>>& self) {
  return self.value;
}

} // namespace schemes

#endif
