#ifndef SCHEMES_RECURSIVE_HPP
#define SCHEMES_RECURSIVE_HPP

#include "functor.hpp"

#include <type_traits>
#include <utility>

namespace schemes {

// recursive<T> witnesses that T can be unrolled one layer at a time. a
// specialization provides:
//
//   template<class X> using base = F<X>;        // the pattern functor of T
//   static base<T> project(const T& self);
//
// and may override the generic fold with
//
//   template<class A, class Alg> static A cata(const T& self, const Alg& alg);
//
// corecursive<T> is the dual: the same base alias and
//
//   static T embed(const base<T>& layer);
//
// optionally overriding the generic unfold with
//
//   template<class Seed, class Coalg> static T ana(const Seed& seed, const Coalg& coalg);
//
// when both exist, project and embed must be mutually inverse.
template<class T, class=void> struct recursive;
template<class T, class=void> struct corecursive;


// shared base declaration, so that recursive<T> and corecursive<T> name the
// very same pattern template
template<template<class> class F>
struct pattern {
  template<class X> using base = F<X>;
};


template<class T, class X>
using base_t = typename recursive<T>::template base<X>;

template<class T, class X>
using cobase_t = typename corecursive<T>::template base<X>;


template<class T>
static auto project(const T& self) -> decltype(recursive<T>::project(self)) {
  return recursive<T>::project(self);
}

template<class T>
static T embed(const cobase_t<T, T>& layer) {
  return corecursive<T>::embed(layer);
}


////////////////////////////////////////////////////////////////////////////////
// algebra result types

// placeholder template argument: deduce the carrier from the algebra
struct deduce { };

namespace detail {

template<class Ret, class C, class ... Args>
static Ret call_result(Ret (C::*)(Args...) const);

template<class Ret, class C, class ... Args>
static Ret call_result(Ret (C::*)(Args...));

template<class Ret, class C, class Arg, class ... Args>
static Arg call_argument(Ret (C::*)(Arg, Args...) const);

template<class Ret, class C, class Arg, class ... Args>
static Arg call_argument(Ret (C::*)(Arg, Args...));

template<class Func>
struct callable {
  using result_type = decltype(call_result(&Func::operator()));
  using argument_type = decltype(call_argument(&Func::operator()));
};

template<class Ret, class Arg, class ... Args>
struct callable<Ret (*)(Arg, Args...)> {
  using result_type = Ret;
  using argument_type = Arg;
};

template<class Ret, class Arg, class ... Args>
struct callable<Ret (Arg, Args...)>: callable<Ret (*)(Arg, Args...)> { };

template<class A, class Alg>
struct result {
  using type = A;
};

template<class Alg>
struct result<deduce, Alg> {
  using type = std::decay_t<typename callable<std::decay_t<Alg>>::result_type>;
};

} // namespace detail

// carrier of an algebra with a unique, non-template call operator (lambdas
// with explicit parameter types, function pointers, std::function)
template<class Alg>
using algebra_result = typename detail::result<deduce, Alg>::type;

template<class Alg>
using algebra_argument = std::decay_t<typename detail::callable<std::decay_t<Alg>>::argument_type>;

// explicit carrier A, or the algebra's own when A is deduce
template<class A, class Alg>
using result_t = typename detail::result<A, Alg>::type;

} // namespace schemes

#endif
