#ifndef SCHEMES_MAYBE_HPP
#define SCHEMES_MAYBE_HPP

#include "variant.hpp"
#include "functor.hpp"

#include <ostream>
#include <type_traits>

namespace schemes {

struct nothing {
  friend bool operator==(nothing, nothing) { return true; }
  friend bool operator<(nothing, nothing) { return false; }

  friend std::ostream& operator<<(std::ostream& out, nothing) {
    return out << "nothing";
  }
};

template<class T>
struct just {
  T value;

  friend bool operator==(const just& lhs, const just& rhs) { return lhs.value == rhs.value; }
  friend bool operator<(const just& lhs, const just& rhs) { return lhs.value < rhs.value; }

  friend std::ostream& operator<<(std::ostream& out, const just& self) {
    return out << "(just " << self.value << ")";
  }
};


// maybe monad. the value is boxed, so maybe<X> is also usable as the pattern
// functor of natural numbers.
template<class T>
struct maybe: variant<nothing, just<T>>, functor, monad {
  using value_type = T;
  using variant_type = variant<nothing, just<T>>;
  using maybe::variant::variant;

  maybe(): variant_type(nothing{}) { }

  static maybe pure(T value) { return just<T>{std::move(value)}; }

  explicit operator bool() const { return this->type() == 1; }

  const T& get() const { return this->variant_type::template get<just<T>>().value; }

  template<class Func>
  friend auto map(const maybe& self, Func func) {
    using type = std::decay_t<std::result_of_t<Func(const T&)>>;
    using result_type = maybe<type>;
    return match(self,
                 [](nothing) -> result_type { return nothing{}; },
                 [&](const just<T>& self) -> result_type {
                   return just<type>{func(self.value)};
                 });
  }
};


template<class T>
static maybe<std::decay_t<T>> some(T&& value) {
  return just<std::decay_t<T>>{std::forward<T>(value)};
}


template<class T>
static maybe<T> join(const maybe<maybe<T>>& self) {
  if(!self) return {};
  return self.get();
}

} // namespace schemes

#endif
