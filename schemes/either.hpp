#ifndef SCHEMES_EITHER_HPP
#define SCHEMES_EITHER_HPP

#include "functor.hpp"
#include "error.hpp"

#include <ostream>
#include <type_traits>
#include <new>
#include <utility>

namespace schemes {

// tagged constructors, so that either<T, T> stays unambiguous
template<class T>
struct left_value {
  T value;
};

template<class T>
struct right_value {
  T value;
};

template<class T>
static left_value<std::decay_t<T>> left(T&& value) { return {std::forward<T>(value)}; }

template<class T>
static right_value<std::decay_t<T>> right(T&& value) { return {std::forward<T>(value)}; }


// either monad. right is the success/continue case.
template<class Left, class Right>
class either: public functor,
              public monad {
  typename std::aligned_union<0, Left, Right>::type storage;
  bool ok;

  template<class T>
  T& cast() {
    return *reinterpret_cast<T*>(&storage);
  }

  template<class T>
  const T& cast() const {
    return *reinterpret_cast<const T*>(&storage);
  }

  void reset() {
    if(ok) {
      cast<Right>().~Right();
    } else {
      cast<Left>().~Left();
    }
  }

  void assign(const either& other) {
    ok = other.ok;
    if(ok) {
      new (&storage) Right(other.cast<Right>());
    } else {
      new (&storage) Left(other.cast<Left>());
    }
  }

  void assign(either&& other) {
    ok = other.ok;
    if(ok) {
      new (&storage) Right(std::move(other.cast<Right>()));
    } else {
      new (&storage) Left(std::move(other.cast<Left>()));
    }
  }

public:
  using left_type = Left;
  using value_type = Right;

  template<class T, class=std::enable_if_t<std::is_convertible<T, Left>::value>>
  either(left_value<T> left): ok(false) {
    new (&storage) Left(std::move(left.value));
  }

  template<class T, class=std::enable_if_t<std::is_convertible<T, Right>::value>>
  either(right_value<T> right): ok(true) {
    new (&storage) Right(std::move(right.value));
  }

  either(const either& other) { assign(other); }
  either(either&& other) { assign(std::move(other)); }

  // copy first: a throwing copy leaves *this untouched
  either& operator=(const either& other) {
    if(this == &other) return *this;
    either tmp(other);
    return *this = std::move(tmp);
  }

  // a throwing move terminates rather than leaving storage empty
  either& operator=(either&& other) noexcept {
    if(this == &other) return *this;
    reset();
    assign(std::move(other));
    return *this;
  }

  ~either() { reset(); }

  // monadic return
  static either pure(Right value) { return right_value<Right>{std::move(value)}; }

  explicit operator bool() const { return ok; }

  const Right* get() const {
    if(!ok) return nullptr;
    return &cast<Right>();
  }

  const Right& right() const {
    if(!ok) throw bad_access("either: right value expected");
    return cast<Right>();
  }

  const Left& left() const {
    if(ok) throw bad_access("either: left value expected");
    return cast<Left>();
  }

  template<class OnLeft, class OnRight>
  friend auto match(const either& self, OnLeft on_left, OnRight on_right) {
    using result_type = std::common_type_t<std::result_of_t<OnLeft(const Left&)>,
                                           std::result_of_t<OnRight(const Right&)>>;
    if(self.ok) {
      return result_type(on_right(self.cast<Right>()));
    } else {
      return result_type(on_left(self.cast<Left>()));
    }
  }

  template<class Func>
  friend auto map(const either& self, Func func) {
    using value_type = std::decay_t<std::result_of_t<Func(const Right&)>>;
    using result_type = either<Left, value_type>;

    return match(self,
                 [](const Left& left) -> result_type {
                   return left_value<Left>{left};
                 },
                 [&](const Right& right) -> result_type {
                   return right_value<value_type>{func(right)};
                 });
  }

  friend bool operator==(const either& lhs, const either& rhs) {
    if(lhs.ok != rhs.ok) return false;
    return lhs.ok ? lhs.cast<Right>() == rhs.cast<Right>()
                  : lhs.cast<Left>() == rhs.cast<Left>();
  }

  friend bool operator!=(const either& lhs, const either& rhs) {
    return !(lhs == rhs);
  }

  friend std::ostream& operator<<(std::ostream& out, const either& self) {
    if(self.ok) {
      return out << "(right " << self.cast<Right>() << ")";
    }
    return out << "(left " << self.cast<Left>() << ")";
  }
};


template<class Left, class Right>
static either<Left, Right> join(const either<Left, either<Left, Right>>& self) {
  return match(self,
               [](const Left& left) -> either<Left, Right> {
                 return left_value<Left>{left};
               },
               [](const either<Left, Right>& right) {
                 return right;
               });
}

} // namespace schemes

#endif
