#ifndef SCHEMES_FOLD_HPP
#define SCHEMES_FOLD_HPP

#include "recursive.hpp"
#include "either.hpp"
#include "env.hpp"

namespace schemes {

////////////////////////////////////////////////////////////////////////////////
// catamorphism

namespace detail {

template<class A, class T, class Alg>
static auto cata(const T& self, const Alg& alg, int)
    -> decltype(recursive<T>::template cata<A>(self, alg)) {
  return recursive<T>::template cata<A>(self, alg);
}

template<class A, class T, class Alg>
static A cata(const T& self, const Alg& alg, long) {
  return alg(map(project(self), [&](const T& x) {
    return detail::cata<A>(x, alg, 0);
  }));
}

} // namespace detail


// bottom-up fold: alg receives a layer whose positions are already folded.
// the carrier is deduced from alg unless given explicitly.
template<class A = deduce, class T, class Alg>
static result_t<A, Alg> cata(const T& self, const Alg& alg) {
  return detail::cata<result_t<A, Alg>>(self, alg, 0);
}


////////////////////////////////////////////////////////////////////////////////
// anamorphism

namespace detail {

template<class T, class Seed, class Coalg>
static auto ana(const Seed& seed, const Coalg& coalg, int)
    -> decltype(corecursive<T>::ana(seed, coalg)) {
  return corecursive<T>::ana(seed, coalg);
}

template<class T, class Seed, class Coalg>
static T ana(const Seed& seed, const Coalg& coalg, long) {
  return embed<T>(map(coalg(seed), [&](const Seed& next) -> T {
    return detail::ana<T>(next, coalg, 0);
  }));
}

} // namespace detail

// top-down unfold of a seed into a T
template<class T, class Seed, class Coalg>
static T ana(const Seed& seed, const Coalg& coalg) {
  return detail::ana<T>(seed, coalg, 0);
}


////////////////////////////////////////////////////////////////////////////////
// hylomorphism: ana followed by cata, without the intermediate structure

template<class B = deduce, class A, class Alg, class Coalg>
static result_t<B, Alg> hylo(const A& seed, const Alg& alg, const Coalg& coalg) {
  using result_type = result_t<B, Alg>;
  return alg(map(coalg(seed), [&](const A& next) {
    return hylo<result_type>(next, alg, coalg);
  }));
}


// common names
template<class A = deduce, class T, class Alg>
static result_t<A, Alg> fold(const T& self, const Alg& alg) {
  return cata<A>(self, alg);
}

template<class T, class Seed, class Coalg>
static T unfold(const Seed& seed, const Coalg& coalg) {
  return ana<T>(seed, coalg);
}

template<class B = deduce, class A, class Alg, class Coalg>
static result_t<B, Alg> refold(const A& seed, const Alg& alg, const Coalg& coalg) {
  return hylo<B>(seed, alg, coalg);
}


////////////////////////////////////////////////////////////////////////////////
// paramorphism: each position holds the original subterm with its fold

template<class A = deduce, class T, class Alg>
static result_t<A, Alg> para(const T& self, const Alg& alg) {
  using result_type = result_t<A, Alg>;
  return alg(map(project(self), [&](const T& x) {
    return env<T, result_type>(x, para<result_type>(x, alg));
  }));
}


// apomorphism: coalg either stops a branch with a finished T (left) or
// continues with a new seed (right)
template<class T, class Seed, class Coalg>
static T apo(const Seed& seed, const Coalg& coalg) {
  return embed<T>(map(coalg(seed), [&](const either<T, Seed>& next) {
    return match(next,
                 [](const T& done) { return done; },
                 [&](const Seed& seed) { return apo<T>(seed, coalg); });
  }));
}


////////////////////////////////////////////////////////////////////////////////
// changing representation

// rebuild a S as a T, applying a natural transformation nat: base_t<S, X> ->
// cobase_t<T, X> at every layer
template<class T, class S, class Nat>
static T hoist(const S& self, const Nat& nat) {
  return cata<T>(self, [&](const base_t<S, T>& layer) {
    return embed<T>(nat(layer));
  });
}

// hoist with the identity transformation: S and T share their pattern functor
template<class T, class S>
static T refix(const S& self) {
  return cata<T>(self, [](const base_t<S, T>& layer) {
    return embed<T>(layer);
  });
}

// project computed by a fold
template<class T>
static base_t<T, T> lambek(const T& self) {
  return cata<base_t<T, T>>(self, [](const base_t<T, base_t<T, T>>& layer) {
    return map(layer, [](const base_t<T, T>& x) { return embed<T>(x); });
  });
}

// embed computed by an unfold
template<class T>
static T colambek(const cobase_t<T, T>& layer) {
  return ana<T>(layer, [](const cobase_t<T, T>& x) {
    return map(x, [](const T& t) { return project(t); });
  });
}


////////////////////////////////////////////////////////////////////////////////
// prepromorphism / postpromorphism

// fold, applying nat to every subterm before it is folded
template<class A = deduce, class T, class Nat, class Alg>
static result_t<A, Alg> prepro(const T& self, const Nat& nat, const Alg& alg) {
  using result_type = result_t<A, Alg>;
  return alg(map(project(self), [&](const T& x) {
    return prepro<result_type>(hoist<T>(x, nat), nat, alg);
  }));
}

// unfold, applying nat to every subterm after it is built
template<class T, class Seed, class Nat, class Coalg>
static T postpro(const Seed& seed, const Nat& nat, const Coalg& coalg) {
  return embed<T>(map(coalg(seed), [&](const Seed& next) {
    return hoist<T>(postpro<T>(next, nat, coalg), nat);
  }));
}



////////////////////////////////////////////////////////////////////////////////
// effects

// fold into an effectful carrier M<A>. alg may be generic, the carrier is
// always explicit.
template<template<class> class M, class A, class T, class Alg>
static M<A> cata_effect(const T& self, const Alg& alg) {
  return cata<M<A>>(self, alg);
}

// hoist under a functor M: nat sequences the effects of one layer,
// base_t<S, M<X>> -> M<cobase_t<T, X>>
template<class T, template<class> class M, class S, class Nat>
static M<T> transverse(const S& self, const Nat& nat) {
  return cata<M<T>>(self, [&](const base_t<S, M<T>>& layer) {
      return map(nat(layer), [](const cobase_t<T, T>& inner) {
          return embed<T>(inner);
        });
    });
}

// unfold of a seed held in a functor M: nat pushes M through one layer,
// M<base_t<S, X>> -> cobase_t<T, M<X>>
template<class T, class Seed, class Nat>
static T cotransverse(const Seed& seed, const Nat& nat) {
  return ana<T>(seed, [&](const Seed& self) {
      return nat(map(self, [](const auto& x) { return project(x); }));
    });
}

} // namespace schemes

#endif
