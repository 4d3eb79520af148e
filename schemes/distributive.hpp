#ifndef SCHEMES_DISTRIBUTIVE_HPP
#define SCHEMES_DISTRIBUTIVE_HPP

#include "fold.hpp"
#include "history.hpp"
#include "identity.hpp"
#include "env.hpp"
#include "either.hpp"

#include <type_traits>

namespace schemes {

// a distributive law is an object with a member alias template naming its
// auxiliary structure and a call operator commuting that structure with one
// layer of pattern functor:
//
//   template<class X> using comonad = W<X>;   // F<W<X>> -> W<F<X>>, for folds
//   template<class X> using monad = M<X>;     // M<F<X>> -> F<M<X>>, for unfolds
//
// laws must act uniformly on whatever the structures hold.

////////////////////////////////////////////////////////////////////////////////
// transformers

// cofree comonad transformer: a W-computation producing a node of annotated
// history
template<template<class> class F, template<class> class W, class A>
struct cofree_t: functor, comonad {
  using value_type = A;
  using node_type = cofree_f<F, A, cofree_t>;

  W<node_type> run;

  explicit cofree_t(W<node_type> run): run(std::move(run)) { }

  template<class Func>
  friend cofree_t<F, W, std::decay_t<std::result_of_t<Func(const A&)>>> map(const cofree_t& self, Func func) {
    using result_type = cofree_t<F, W, std::decay_t<std::result_of_t<Func(const A&)>>>;
    using result_node = typename result_type::node_type;

    return result_type(map(self.run, [&](const node_type& node) {
          return result_node(func(node.head), map(node.tail, [&](const cofree_t& child) {
                return map(child, func);
              }));
        }));
  }

  friend A extract(const cofree_t& self) { return extract(self.run).head; }

  friend cofree_t<F, W, cofree_t> duplicate(const cofree_t& self) {
    using result_type = cofree_t<F, W, cofree_t>;
    using result_node = typename result_type::node_type;

    return result_type(map(duplicate(self.run), [](const W<node_type>& run) {
          return result_node(cofree_t(run), map(extract(run).tail, [](const cofree_t& child) {
                return duplicate(child);
              }));
        }));
  }
};


// free monad transformer: an M-computation producing either a value or a layer
template<template<class> class F, template<class> class M, class A>
struct free_t: functor, monad {
  using value_type = A;
  using node_type = free_f<F, A, free_t>;

  M<node_type> run;

  explicit free_t(M<node_type> run): run(std::move(run)) { }

  static free_t pure(A value) {
    return free_t(M<node_type>::pure(node_type::pure(std::move(value))));
  }

  static free_t wrap(F<free_t> layer) {
    return free_t(M<node_type>::pure(node_type::wrap(std::move(layer))));
  }

  template<class Func>
  friend free_t<F, M, std::decay_t<std::result_of_t<Func(const A&)>>> map(const free_t& self, Func func) {
    using result_type = free_t<F, M, std::decay_t<std::result_of_t<Func(const A&)>>>;
    using result_node = typename result_type::node_type;

    return result_type(map(self.run, [&](const node_type& node) {
          return match(node,
                       [&](const A& value) { return result_node::pure(func(value)); },
                       [&](const F<free_t>& layer) {
                         return result_node::wrap(map(layer, [&](const free_t& child) {
                               return map(child, func);
                             }));
                       });
        }));
  }
};


template<template<class> class F, template<class> class M, class A>
static free_t<F, M, A> join(const free_t<F, M, free_t<F, M, A>>& self) {
  using inner_type = free_t<F, M, A>;
  using outer_type = free_t<F, M, inner_type>;
  using node_type = typename inner_type::node_type;

  return inner_type(join(map(self.run, [](const typename outer_type::node_type& node) {
          return match(node,
                       [](const inner_type& inner) {
                         return inner.run;
                       },
                       [](const F<outer_type>& layer) {
                         return M<node_type>::pure(node_type::wrap(map(layer, [](const outer_type& child) {
                                 return join(child);
                               })));
                       });
        })));
}


////////////////////////////////////////////////////////////////////////////////
// comonadic laws (folds)

struct cata_law {
  template<class X> using comonad = identity<X>;

  template<class Layer>
  auto operator()(const Layer& layer) const {
    auto inner = map(layer, [](const auto& x) { return extract(x); });
    return identity<decltype(inner)>(std::move(inner));
  }
};


// pairs every position with the result of an auxiliary algebra
template<class B, class Alg>
struct zygo_law {
  template<class X> using comonad = env<B, X>;

  Alg alg;

  template<class Layer>
  auto operator()(const Layer& layer) const {
    B aux = alg(map(layer, [](const auto& x) { return x.first; }));
    auto inner = map(layer, [](const auto& x) { return x.second; });
    return env<B, decltype(inner)>(std::move(aux), std::move(inner));
  }
};


template<class B, class Alg, class Law>
struct zygo_t_law {
  template<class X> using comonad = env_t<B, typename Law::template comonad<X>>;

  Alg alg;
  Law law;

  template<class Layer>
  auto operator()(const Layer& layer) const {
    B aux = alg(map(layer, [](const auto& x) { return x.first; }));
    auto inner = law(map(layer, [](const auto& x) { return x.lower; }));
    return env_t<B, decltype(inner)>(std::move(aux), std::move(inner));
  }
};


template<template<class> class F>
struct histo_law {
  template<class X> using comonad = cofree<F, X>;

  template<class A>
  cofree<F, F<A>> operator()(const F<cofree<F, A>>& layer) const {
    return cofree<F, F<A>>(map(layer, [](const cofree<F, A>& x) { return x.head; }),
                           map(layer, [this](const cofree<F, A>& x) { return (*this)(x.tail); }));
  }
};


template<template<class> class F, class Law>
struct ghisto_law {
  template<class X> using comonad = cofree_t<F, Law::template comonad, X>;

  Law law;

  template<class A>
  comonad<F<A>> operator()(const F<comonad<A>>& layer) const {
    using node_type = typename comonad<A>::node_type;
    using result_node = typename comonad<F<A>>::node_type;

    auto lowered = law(map(layer, [](const comonad<A>& x) { return x.run; }));
    return comonad<F<A>>(map(lowered, [this](const F<node_type>& nodes) {
          return result_node(map(nodes, [](const node_type& x) { return x.head; }),
                             map(nodes, [this](const node_type& x) { return (*this)(x.tail); }));
        }));
  }
};


////////////////////////////////////////////////////////////////////////////////
// monadic laws (unfolds)

struct ana_law {
  template<class X> using monad = identity<X>;

  template<class Layer>
  auto operator()(const identity<Layer>& self) const {
    return map(self.value, [](const auto& x) {
        return identity<std::decay_t<decltype(x)>>(x);
      });
  }
};


template<template<class> class F>
struct futu_law {
  template<class X> using monad = free_monad<F, X>;

  template<class A>
  F<free_monad<F, A>> operator()(const free_monad<F, F<A>>& self) const {
    return match(self,
                 [](const F<A>& layer) {
                   return map(layer, [](const A& x) { return free_monad<F, A>::pure(x); });
                 },
                 [this](const F<free_monad<F, F<A>>>& layer) {
                   return map(layer, [this](const free_monad<F, F<A>>& x) {
                       return free_monad<F, A>::wrap((*this)(x));
                     });
                 });
  }
};


template<template<class> class F, class Law>
struct gfutu_law {
  template<class X> using monad = free_t<F, Law::template monad, X>;

  Law law;

  template<class A>
  F<monad<A>> operator()(const monad<F<A>>& self) const {
    using node_type = typename monad<A>::node_type;
    using source_node = typename monad<F<A>>::node_type;
    using lower_type = typename Law::template monad<node_type>;

    auto inner = map(self.run, [this](const source_node& node) {
        return match(node,
                     [](const F<A>& layer) {
                       return map(layer, [](const A& x) { return node_type::pure(x); });
                     },
                     [this](const F<monad<F<A>>>& layer) {
                       return map(layer, [this](const monad<F<A>>& x) {
                           return node_type::wrap((*this)(x));
                         });
                     });
      });

    return map(law(inner), [](const lower_type& x) { return monad<A>(x); });
  }
};


// either stops with a finished B, unrolled one layer at a time by coalg, or
// continues
template<template<class> class F, class B, class Coalg>
struct gapo_law {
  template<class X> using monad = either<B, X>;

  Coalg coalg;

  template<class A>
  F<either<B, A>> operator()(const either<B, F<A>>& self) const {
    return match(self,
                 [this](const B& done) {
                   return map(coalg(done), [](const B& x) { return either<B, A>(left(x)); });
                 },
                 [](const F<A>& layer) {
                   return map(layer, [](const A& x) { return either<B, A>(right(x)); });
                 });
  }
};


////////////////////////////////////////////////////////////////////////////////
// canonical laws

template<class T>
struct embedder {
  T operator()(const cobase_t<T, T>& layer) const { return embed<T>(layer); }
};

template<class T>
struct projector {
  base_t<T, T> operator()(const T& self) const { return project(self); }
};


namespace detail {

template<class B, class Coalg>
struct argument {
  using type = B;
};

template<class Coalg>
struct argument<deduce, Coalg> {
  using type = algebra_argument<Coalg>;
};

} // namespace detail


static cata_law dist_cata() { return {}; }

static ana_law dist_ana() { return {}; }

template<class B = deduce, class Alg>
static zygo_law<result_t<B, Alg>, Alg> dist_zygo(Alg alg) { return {alg}; }

template<class B = deduce, class Alg, class Law>
static zygo_t_law<result_t<B, Alg>, Alg, Law> dist_zygo_t(Alg alg, Law law) { return {alg, law}; }

template<class T>
static zygo_law<T, embedder<T>> dist_para() { return {{}}; }

template<class T, class Law>
static zygo_t_law<T, embedder<T>, Law> dist_para_t(Law law) { return {{}, law}; }

template<template<class> class F>
static histo_law<F> dist_histo() { return {}; }

template<template<class> class F, class Law>
static ghisto_law<F, Law> dist_ghisto(Law law) { return {law}; }

template<template<class> class F>
static futu_law<F> dist_futu() { return {}; }

template<template<class> class F, class Law>
static gfutu_law<F, Law> dist_gfutu(Law law) { return {law}; }

template<template<class> class F, class B = deduce, class Coalg>
static gapo_law<F, typename detail::argument<B, Coalg>::type, Coalg> dist_gapo(Coalg coalg) {
  return {coalg};
}

template<class T>
static gapo_law<corecursive<T>::template base, T, projector<T>> dist_apo() { return {{}}; }


////////////////////////////////////////////////////////////////////////////////
// generalized schemes

namespace detail {

// subterm transformations for the steps below: keep leaves subterms alone,
// rehoist applies a natural transformation to every layer of them
struct keep {
  template<class T>
  const T& operator()(const T& self) const { return self; }
};

template<class Nat>
struct rehoist {
  const Nat& nat;

  template<class T>
  T operator()(const T& self) const { return hoist<T>(self, nat); }
};


template<class Law, class Alg, class A, class Pre = keep>
struct gcata_step {
  template<class X> using comonad_type = typename Law::template comonad<X>;

  const Law& law;
  const Alg& alg;
  Pre pre;

  template<class T>
  comonad_type<base_t<T, comonad_type<A>>> operator()(const T& self) const {
    return law(map(project(self), [this](const T& x) {
          return duplicate(map((*this)(pre(x)), alg));
        }));
  }
};


template<class T, class Law, class Coalg, class Seed, class Post = keep>
struct gana_step {
  template<class X> using monad_type = typename Law::template monad<X>;

  const Law& law;
  const Coalg& coalg;
  Post post;

  T operator()(const monad_type<cobase_t<T, monad_type<Seed>>>& self) const {
    return embed<T>(map(law(self), [this](const monad_type<monad_type<Seed>>& x) -> T {
          return post((*this)(map(join(x), coalg)));
        }));
  }
};


template<class WLaw, class MLaw, class Alg, class Coalg, class B, class A>
struct ghylo_step {
  template<class X> using comonad_type = typename WLaw::template comonad<X>;
  template<class X> using monad_type = typename MLaw::template monad<X>;

  const WLaw& wlaw;
  const MLaw& mlaw;
  const Alg& alg;
  const Coalg& coalg;

  comonad_type<B> operator()(const monad_type<A>& self) const {
    return map(wlaw(map(mlaw(map(self, coalg)), [this](const monad_type<monad_type<A>>& x) {
            return duplicate((*this)(join(x)));
          })), alg);
  }
};

} // namespace detail


// fold whose algebra reads its subresults through the comonad of law
template<class A = deduce, class T, class Law, class Alg>
static result_t<A, Alg> gcata(const T& self, const Law& law, const Alg& alg) {
  using result_type = result_t<A, Alg>;
  return alg(extract(detail::gcata_step<Law, Alg, result_type>{law, alg}(self)));
}


// unfold whose coalgebra produces its seeds inside the monad of law
template<class T, class Seed, class Law, class Coalg>
static T gana(const Seed& seed, const Law& law, const Coalg& coalg) {
  using step_type = detail::gana_step<T, Law, Coalg, Seed>;
  using start_type = typename step_type::template monad_type<cobase_t<T, typename step_type::template monad_type<Seed>>>;
  return step_type{law, coalg}(start_type::pure(coalg(seed)));
}


// generalized refold over the pattern functor shared by both laws
template<class B = deduce, class A, class WLaw, class MLaw, class Alg, class Coalg>
static result_t<B, Alg> ghylo(const A& seed, const WLaw& wlaw, const MLaw& mlaw,
                              const Alg& alg, const Coalg& coalg) {
  using result_type = result_t<B, Alg>;
  using step_type = detail::ghylo_step<WLaw, MLaw, Alg, Coalg, result_type, A>;
  using start_type = typename step_type::template monad_type<A>;
  return extract(step_type{wlaw, mlaw, alg, coalg}(start_type::pure(seed)));
}


// generalized prepromorphism: gcata, applying nat to every subterm before it
// is folded
template<class A = deduce, class T, class Law, class Nat, class Alg>
static result_t<A, Alg> gprepro(const T& self, const Law& law, const Nat& nat, const Alg& alg) {
  using result_type = result_t<A, Alg>;
  using step_type = detail::gcata_step<Law, Alg, result_type, detail::rehoist<Nat>>;
  return alg(extract(step_type{law, alg, {nat}}(self)));
}


// generalized postpromorphism: gana, applying nat to every subterm after it
// is built
template<class T, class Seed, class Law, class Nat, class Coalg>
static T gpostpro(const Seed& seed, const Law& law, const Nat& nat, const Coalg& coalg) {
  using step_type = detail::gana_step<T, Law, Coalg, Seed, detail::rehoist<Nat>>;
  using start_type = typename step_type::template monad_type<cobase_t<T, typename step_type::template monad_type<Seed>>>;
  return step_type{law, coalg, {nat}}(start_type::pure(coalg(seed)));
}


// zygomorphism: alg sees, at every position, the result of aux paired with
// its own
template<class A = deduce, class B = deduce, class T, class Aux, class Alg>
static result_t<A, Alg> zygo(const T& self, const Aux& aux, const Alg& alg) {
  return gcata<A>(self, dist_zygo<B>(aux), alg);
}

template<class A = deduce, class B = deduce, class T, class Aux, class Law, class Alg>
static result_t<A, Alg> gzygo(const T& self, const Aux& aux, const Law& law, const Alg& alg) {
  return gcata<A>(self, dist_zygo_t<B>(aux, law), alg);
}

template<class A = deduce, class T, class Law, class Alg>
static result_t<A, Alg> gpara(const T& self, const Law& law, const Alg& alg) {
  return gcata<A>(self, dist_para_t<T>(law), alg);
}

template<class A = deduce, class T, class Law, class Alg>
static result_t<A, Alg> ghisto(const T& self, const Law& law, const Alg& alg) {
  return gcata<A>(self, dist_ghisto<recursive<T>::template base>(law), alg);
}

template<class T, class Seed, class Law, class Coalg>
static T gfutu(const Seed& seed, const Law& law, const Coalg& coalg) {
  return gana<T>(seed, dist_gfutu<corecursive<T>::template base>(law), coalg);
}

// apomorphism whose finished branches are unrolled from a B by unroll
template<class T, class B = deduce, class Seed, class Unroll, class Coalg>
static T gapo(const Seed& seed, const Unroll& unroll, const Coalg& coalg) {
  return gana<T>(seed, dist_gapo<corecursive<T>::template base, B>(unroll), coalg);
}

template<template<class> class F, class B = deduce, class A, class WLaw, class MLaw, class Alg, class Coalg>
static result_t<B, Alg> gchrono(const A& seed, const WLaw& wlaw, const MLaw& mlaw,
                                const Alg& alg, const Coalg& coalg) {
  return ghylo<B>(seed, dist_ghisto<F>(wlaw), dist_gfutu<F>(mlaw), alg, coalg);
}

} // namespace schemes

#endif
