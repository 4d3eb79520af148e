#ifndef SCHEMES_CONSTANT_HPP
#define SCHEMES_CONSTANT_HPP

#include "recursive.hpp"
#include "functor.hpp"
#include "maybe.hpp"
#include "either.hpp"

#include <ostream>
#include <type_traits>
#include <utility>

namespace schemes {

// constant pattern functor: no recursive position at all. lets non-recursive
// types take part in generic code written against recursive<T>.
template<class C, class X>
struct const_f: functor {
  C value;

  explicit const_f(C value): value(std::move(value)) { }

  template<class Func>
  friend auto map(const const_f& self, Func) {
    using type = std::decay_t<std::result_of_t<Func(const X&)>>;
    return const_f<C, type>(self.value);
  }

  friend bool operator==(const const_f& lhs, const const_f& rhs) {
    return lhs.value == rhs.value;
  }

  friend std::ostream& operator<<(std::ostream& out, const const_f& self) {
    return out << "(const " << self.value << ")";
  }
};

template<class C>
struct const_pattern {
  template<class X> using base = const_f<C, X>;
};


template<class T>
struct recursive<maybe<T>>: const_pattern<maybe<T>> {
  static const_f<maybe<T>, maybe<T>> project(const maybe<T>& self) {
    return const_f<maybe<T>, maybe<T>>(self);
  }
};

template<class T>
struct corecursive<maybe<T>>: const_pattern<maybe<T>> {
  static maybe<T> embed(const const_f<maybe<T>, maybe<T>>& layer) { return layer.value; }
};


template<class Left, class Right>
struct recursive<either<Left, Right>>: const_pattern<either<Left, Right>> {
  static const_f<either<Left, Right>, either<Left, Right>> project(const either<Left, Right>& self) {
    return const_f<either<Left, Right>, either<Left, Right>>(self);
  }
};

template<class Left, class Right>
struct corecursive<either<Left, Right>>: const_pattern<either<Left, Right>> {
  static either<Left, Right> embed(const const_f<either<Left, Right>, either<Left, Right>>& layer) {
    return layer.value;
  }
};

} // namespace schemes

#endif
