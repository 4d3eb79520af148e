#ifndef SCHEMES_LIST_HPP
#define SCHEMES_LIST_HPP

#include "variant.hpp"
#include "recursive.hpp"
#include "fold.hpp"

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ostream>
#include <type_traits>
#include <vector>

namespace schemes {

////////////////////////////////////////////////////////////////////////////////
// list pattern functor: nil | cons(head, tail)

struct nil {
  friend bool operator==(nil, nil) { return true; }
  friend bool operator<(nil, nil) { return false; }

  friend std::ostream& operator<<(std::ostream& out, nil) {
    return out << "nil";
  }
};

template<class A, class X>
struct cons_f {
  A head;
  X tail;

  friend bool operator==(const cons_f& lhs, const cons_f& rhs) {
    return lhs.head == rhs.head && lhs.tail == rhs.tail;
  }

  friend bool operator<(const cons_f& lhs, const cons_f& rhs) {
    if(lhs.head < rhs.head) return true;
    if(rhs.head < lhs.head) return false;
    return lhs.tail < rhs.tail;
  }

  friend std::ostream& operator<<(std::ostream& out, const cons_f& self) {
    return out << "(cons " << self.head << " " << self.tail << ")";
  }
};

template<class A, class X>
struct list_f: variant<nil, cons_f<A, X>> {
  using list_f::variant::variant;

  template<class Func>
  friend auto map(const list_f& self, Func func) {
    using type = std::decay_t<std::result_of_t<Func(const X&)>>;
    using result_type = list_f<A, type>;
    return match(self,
                 [](nil) -> result_type { return nil{}; },
                 [&](const cons_f<A, X>& self) -> result_type {
                   return cons_f<A, type>{self.head, func(self.tail)};
                 });
  }
};


template<class A>
struct list_pattern {
  template<class X> using base = list_f<A, X>;
};


////////////////////////////////////////////////////////////////////////////////
// persistent list

template<class T>
struct cons;

template<class T>
using list = std::shared_ptr<cons<T>>;

template<class T>
struct cons {
  const T head;
  const list<T> tail;
  cons(T head, list<T> tail): head(std::move(head)), tail(std::move(tail)) { }

  friend list<T> operator%=(T head, list<T> tail) {
    return std::make_shared<cons>(std::move(head), std::move(tail));
  }

  struct iterator {
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T*;
    using reference = const T&;

    list<T> data;
    iterator& operator++() { data = data->tail; return *this; }
    bool operator==(const iterator& other) const { return data == other.data; }
    bool operator!=(const iterator& other) const { return data != other.data; }
    const T& operator*() const { return data->head; }
  };

  friend iterator begin(list<T> self) { return {self}; }
  friend iterator end(list<T>) { return {nullptr}; }

  // element-wise equality
  friend bool equal(list<T> lhs, list<T> rhs) {
    for(; lhs && rhs; lhs = lhs->tail, rhs = rhs->tail) {
      if(lhs == rhs) return true;
      if(!(lhs->head == rhs->head)) return false;
    }
    return !lhs && !rhs;
  }

  friend std::size_t length(list<T> self) {
    std::size_t res = 0;
    for(; self; self = self->tail) ++res;
    return res;
  }
};


template<class A>
struct recursive<list<A>>: list_pattern<A> {
  static list_f<A, list<A>> project(const list<A>& self) {
    if(!self) return nil{};
    return cons_f<A, list<A>>{self->head, self->tail};
  }
};

template<class A>
struct corecursive<list<A>>: list_pattern<A> {
  static list<A> embed(const list_f<A, list<A>>& layer) {
    return match(layer,
                 [](nil) { return list<A>(); },
                 [](const cons_f<A, list<A>>& self) { return self.head %= self.tail; });
  }
};


template<class T, class X, class Func>
static X foldr(const list<T>& self, X x, const Func& func) {
  return cata<X>(self, [&](const list_f<T, X>& layer) {
    return match(layer,
                 [&](nil) -> X { return x; },
                 [&](const cons_f<T, X>& self) -> X { return func(self.head, self.tail); });
  });
}

template<class T, class X, class Func>
static X foldl(X x, list<T> self, const Func& func) {
  for(; self; self = self->tail) {
    x = func(std::move(x), self->head);
  }
  return x;
}


template<class Iterator>
static list<typename std::iterator_traits<Iterator>::value_type> make_list(Iterator first, Iterator last) {
  if(first == last) {
    return {};
  } else {
    auto head = *first++;
    return head %= make_list(first, last);
  }
}

template<class T>
static list<T> make_list(std::initializer_list<T> values) {
  return make_list(values.begin(), values.end());
}

template<class T>
static std::vector<T> to_vector(const list<T>& self) {
  return std::vector<T>(begin(self), end(self));
}

} // namespace schemes

#endif
