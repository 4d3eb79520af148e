#ifndef SCHEMES_HISTORY_HPP
#define SCHEMES_HISTORY_HPP

#include "fold.hpp"
#include "either.hpp"

#include <ostream>
#include <type_traits>

namespace schemes {

////////////////////////////////////////////////////////////////////////////////
// cofree comonad: every node carries a value (head) and one layer of further
// nodes (tail). histo uses it to keep every intermediate result.

template<template<class> class F, class A>
struct cofree: functor, comonad {
  using value_type = A;
  using layer_type = F<cofree>;

  A head;
  layer_type tail;

  cofree(A head, layer_type tail): head(std::move(head)), tail(std::move(tail)) { }

  template<class Func>
  friend cofree<F, std::decay_t<std::result_of_t<Func(const A&)>>> map(const cofree& self, Func func) {
    return {func(self.head), map(self.tail, [&](const cofree& child) {
          return map(child, func);
        })};
  }

  friend A extract(const cofree& self) { return self.head; }

  friend cofree<F, cofree> duplicate(const cofree& self) {
    return {self, map(self.tail, [](const cofree& child) {
          return duplicate(child);
        })};
  }

  friend bool operator==(const cofree& lhs, const cofree& rhs) {
    return lhs.head == rhs.head && lhs.tail == rhs.tail;
  }

  friend std::ostream& operator<<(std::ostream& out, const cofree& self) {
    return out << "(" << self.head << " :< " << self.tail << ")";
  }
};


// pattern functor of cofree<F, A>
template<template<class> class F, class A, class X>
struct cofree_f: functor {
  A head;
  F<X> tail;

  cofree_f(A head, F<X> tail): head(std::move(head)), tail(std::move(tail)) { }

  template<class Func>
  friend auto map(const cofree_f& self, Func func) {
    auto tail = map(self.tail, func);
    using type = std::decay_t<std::result_of_t<Func(const X&)>>;
    return cofree_f<F, A, type>(self.head, std::move(tail));
  }

  friend bool operator==(const cofree_f& lhs, const cofree_f& rhs) {
    return lhs.head == rhs.head && lhs.tail == rhs.tail;
  }
};

template<template<class> class F, class A>
struct cofree_pattern {
  template<class X> using base = cofree_f<F, A, X>;
};

template<template<class> class F, class A>
struct recursive<cofree<F, A>>: cofree_pattern<F, A> {
  static cofree_f<F, A, cofree<F, A>> project(const cofree<F, A>& self) {
    return {self.head, self.tail};
  }
};

template<template<class> class F, class A>
struct corecursive<cofree<F, A>>: cofree_pattern<F, A> {
  static cofree<F, A> embed(const cofree_f<F, A, cofree<F, A>>& layer) {
    return {layer.head, layer.tail};
  }
};


////////////////////////////////////////////////////////////////////////////////
// free monad: either a plain value (pure) or one layer of further free values
// (wrap). futu uses it to emit several layers in a single step.

template<template<class> class F, class A>
class free_monad: public functor,
                  public monad {
public:
  using value_type = A;
  using layer_type = F<free_monad>;

private:
  either<A, layer_type> data;

  explicit free_monad(either<A, layer_type> data): data(std::move(data)) { }

public:
  static free_monad pure(A value) { return free_monad(left(std::move(value))); }
  static free_monad wrap(layer_type layer) { return free_monad(right(std::move(layer))); }

  const either<A, layer_type>& get() const { return data; }

  template<class OnPure, class OnLayer>
  friend auto match(const free_monad& self, OnPure on_pure, OnLayer on_layer) {
    return match(self.data, on_pure, on_layer);
  }

  template<class Func>
  friend free_monad<F, std::decay_t<std::result_of_t<Func(const A&)>>> map(const free_monad& self, Func func) {
    using result_type = free_monad<F, std::decay_t<std::result_of_t<Func(const A&)>>>;
    return match(self,
                 [&](const A& value) {
                   return result_type::pure(func(value));
                 },
                 [&](const layer_type& layer) {
                   return result_type::wrap(map(layer, [&](const free_monad& child) {
                         return map(child, func);
                       }));
                 });
  }

  friend bool operator==(const free_monad& lhs, const free_monad& rhs) {
    return lhs.data == rhs.data;
  }

  friend std::ostream& operator<<(std::ostream& out, const free_monad& self) {
    return out << self.data;
  }
};


template<template<class> class F, class A>
static free_monad<F, A> join(const free_monad<F, free_monad<F, A>>& self) {
  using outer_type = free_monad<F, free_monad<F, A>>;
  return match(self,
               [](const free_monad<F, A>& inner) {
                 return inner;
               },
               [](const typename outer_type::layer_type& layer) {
                 return free_monad<F, A>::wrap(map(layer, [](const outer_type& child) {
                       return join(child);
                     }));
               });
}


// pattern functor of free_monad<F, A>, also the node type of free_t
template<template<class> class F, class A, class X>
class free_f: public functor {
  either<A, F<X>> data;

  explicit free_f(either<A, F<X>> data): data(std::move(data)) { }

public:
  static free_f pure(A value) { return free_f(left(std::move(value))); }
  static free_f wrap(F<X> layer) { return free_f(right(std::move(layer))); }

  const either<A, F<X>>& get() const { return data; }

  template<class OnPure, class OnLayer>
  friend auto match(const free_f& self, OnPure on_pure, OnLayer on_layer) {
    return match(self.data, on_pure, on_layer);
  }

  template<class Func>
  friend auto map(const free_f& self, Func func) {
    using result_type = free_f<F, A, std::decay_t<std::result_of_t<Func(const X&)>>>;
    return match(self,
                 [](const A& value) { return result_type::pure(value); },
                 [&](const F<X>& layer) { return result_type::wrap(map(layer, func)); });
  }

  friend bool operator==(const free_f& lhs, const free_f& rhs) {
    return lhs.data == rhs.data;
  }
};

template<template<class> class F, class A>
struct free_pattern {
  template<class X> using base = free_f<F, A, X>;
};

template<template<class> class F, class A>
struct recursive<free_monad<F, A>>: free_pattern<F, A> {
  static free_f<F, A, free_monad<F, A>> project(const free_monad<F, A>& self) {
    using result_type = free_f<F, A, free_monad<F, A>>;
    return match(self,
                 [](const A& value) { return result_type::pure(value); },
                 [](const F<free_monad<F, A>>& layer) { return result_type::wrap(layer); });
  }
};

template<template<class> class F, class A>
struct corecursive<free_monad<F, A>>: free_pattern<F, A> {
  static free_monad<F, A> embed(const free_f<F, A, free_monad<F, A>>& layer) {
    return match(layer,
                 [](const A& value) { return free_monad<F, A>::pure(value); },
                 [](const F<free_monad<F, A>>& layer) { return free_monad<F, A>::wrap(layer); });
  }
};


////////////////////////////////////////////////////////////////////////////////
// histomorphism / futumorphism / chronomorphism

// annotated history of the results computed below a T
template<class T, class A>
using history = cofree<recursive<T>::template base, A>;

// seed, or layers of T still to be unfolded
template<class T, class Seed>
using future = free_monad<corecursive<T>::template base, Seed>;


namespace detail {

template<class A, class T, class Alg>
static history<T, A> histo(const T& self, const Alg& alg) {
  auto layer = map(project(self), [&](const T& x) {
    return detail::histo<A>(x, alg);
  });

  A head = alg(layer);
  return history<T, A>(std::move(head), std::move(layer));
}


template<class T, class Seed, class Coalg>
struct futu_step {
  const Coalg& coalg;

  T unfold(const Seed& seed) const {
    return embed<T>(map(coalg(seed), *this));
  }

  T operator()(const future<T, Seed>& self) const {
    return match(self,
                 [&](const Seed& seed) { return unfold(seed); },
                 [&](const typename future<T, Seed>::layer_type& layer) {
                   return embed<T>(map(layer, *this));
                 });
  }
};


template<template<class> class F, class B, class A, class Alg, class Coalg>
struct chrono_step {
  const Alg& alg;
  const Coalg& coalg;

  cofree<F, B> node(const F<cofree<F, B>>& layer) const {
    B head = alg(layer);
    return cofree<F, B>(std::move(head), layer);
  }

  cofree<F, B> unfold(const A& seed) const {
    return node(map(coalg(seed), *this));
  }

  cofree<F, B> operator()(const free_monad<F, A>& self) const {
    return match(self,
                 [&](const A& seed) { return unfold(seed); },
                 [&](const F<free_monad<F, A>>& layer) { return node(map(layer, *this)); });
  }
};

} // namespace detail


// fold where alg sees, at every position, the result for that subterm and
// (through its tail) the results of all of its own subterms
template<class A = deduce, class T, class Alg>
static result_t<A, Alg> histo(const T& self, const Alg& alg) {
  return detail::histo<result_t<A, Alg>>(self, alg).head;
}


// unfold where coalg may emit several layers at once: every position holds
// either a seed to continue from (pure) or ready-made layers (wrap)
template<class T, class Seed, class Coalg>
static T futu(const Seed& seed, const Coalg& coalg) {
  return detail::futu_step<T, Seed, Coalg>{coalg}.unfold(seed);
}


// futu followed by histo over the pattern functor F, fused
template<template<class> class F, class B = deduce, class A, class Alg, class Coalg>
static result_t<B, Alg> chrono(const A& seed, const Alg& alg, const Coalg& coalg) {
  using result_type = result_t<B, Alg>;
  return detail::chrono_step<F, result_type, A, Alg, Coalg>{alg, coalg}.unfold(seed).head;
}

} // namespace schemes

#endif
