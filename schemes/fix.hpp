#ifndef SCHEMES_FIX_HPP
#define SCHEMES_FIX_HPP

#include "recursive.hpp"
#include "fold.hpp"

#include <boost/any.hpp>

#include <functional>
#include <ostream>
#include <memory>

namespace schemes {

////////////////////////////////////////////////////////////////////////////////
// direct fixed point: one layer of F whose positions hold more fix<F>.
// equality, ordering and printing are those of F<fix<F>>.

template<template<class> class F>
struct fix: F<fix<F>> {
  using layer_type = F<fix>;

  fix(layer_type layer): layer_type(std::move(layer)) { }

  const layer_type& unfix() const { return *this; }
};


template<template<class> class F>
struct recursive<fix<F>>: pattern<F> {
  static F<fix<F>> project(const fix<F>& self) { return self.unfix(); }
};

template<template<class> class F>
struct corecursive<fix<F>>: pattern<F> {
  static fix<F> embed(const F<fix<F>>& layer) { return layer; }
};


template<class T>
using fix_t = fix<recursive<T>::template base>;

// copy any recursive value into the direct encoding
template<class T>
static fix_t<T> to_fix(const T& self) {
  return refix<fix_t<T>>(self);
}

template<class T, template<class> class F>
static T from_fix(const fix<F>& self) {
  return refix<T>(self);
}


////////////////////////////////////////////////////////////////////////////////
// church (boehm-berarducci) encoding: a value is its own fold. results travel
// through boost::any, so that one closure serves every carrier.

template<template<class> class F>
class mu {
public:
  using algebra = std::function<boost::any(const F<boost::any>&)>;
  using fold_type = std::function<boost::any(const algebra&)>;

private:
  fold_type run;

public:
  explicit mu(fold_type run): run(std::move(run)) { }

  boost::any operator()(const algebra& alg) const { return run(alg); }

  // O(1): hands alg over to the stored fold
  template<class A, class Alg>
  A fold(const Alg& alg) const {
    return boost::any_cast<A>(run([&](const F<boost::any>& layer) -> boost::any {
          return alg(map(layer, [](const boost::any& x) {
                return boost::any_cast<A>(x);
              }));
        }));
  }

  friend bool operator==(const mu& lhs, const mu& rhs) {
    return to_fix(lhs) == to_fix(rhs);
  }

  friend bool operator!=(const mu& lhs, const mu& rhs) {
    return !(lhs == rhs);
  }

  friend bool operator<(const mu& lhs, const mu& rhs) {
    return to_fix(lhs) < to_fix(rhs);
  }

  friend std::ostream& operator<<(std::ostream& out, const mu& self) {
    return out << to_fix(self);
  }
};


template<template<class> class F>
struct recursive<mu<F>>: pattern<F> {
  template<class A, class Alg>
  static A cata(const mu<F>& self, const Alg& alg) {
    return self.template fold<A>(alg);
  }

  static F<mu<F>> project(const mu<F>& self) { return lambek(self); }
};

template<template<class> class F>
struct corecursive<mu<F>>: pattern<F> {
  static mu<F> embed(const F<mu<F>>& layer) {
    return mu<F>([layer](const typename mu<F>::algebra& alg) {
        return alg(map(layer, [&](const mu<F>& x) { return x(alg); }));
      });
  }
};


// change the pattern functor of a church value through nat: F<X> -> G<X>,
// without rebuilding it
template<template<class> class G, template<class> class F, class Nat>
static mu<G> hoist_mu(const Nat& nat, const mu<F>& self) {
  return mu<G>([nat, self](const typename mu<G>::algebra& alg) {
      return self([&](const F<boost::any>& layer) { return alg(nat(layer)); });
    });
}


////////////////////////////////////////////////////////////////////////////////
// coinductive encoding: a seed and a step producing one layer of further
// seeds. layers are only computed when projected, so values may be infinite.

template<template<class> class F>
class nu {
  struct node {
    virtual ~node() { }
    virtual F<nu> project() const = 0;
  };

  template<class Seed, class Coalg>
  struct unfold_node: node {
    const Seed seed;
    const Coalg coalg;

    unfold_node(Seed seed, Coalg coalg): seed(std::move(seed)), coalg(std::move(coalg)) { }

    F<nu> project() const override {
      return map(coalg(seed), [this](const Seed& next) { return nu(next, coalg); });
    }
  };

  std::shared_ptr<const node> impl;

public:
  template<class Seed, class Coalg>
  nu(Seed seed, Coalg coalg):
    impl(std::make_shared<unfold_node<Seed, Coalg>>(std::move(seed), std::move(coalg))) { }

  // advance one step
  F<nu> step() const { return impl->project(); }

  // only meaningful on finite values
  friend bool operator==(const nu& lhs, const nu& rhs) {
    return to_fix(lhs) == to_fix(rhs);
  }

  friend bool operator!=(const nu& lhs, const nu& rhs) {
    return !(lhs == rhs);
  }

  friend bool operator<(const nu& lhs, const nu& rhs) {
    return to_fix(lhs) < to_fix(rhs);
  }

  friend std::ostream& operator<<(std::ostream& out, const nu& self) {
    return out << to_fix(self);
  }
};


template<template<class> class F>
struct recursive<nu<F>>: pattern<F> {
  static F<nu<F>> project(const nu<F>& self) { return self.step(); }
};

template<template<class> class F>
struct corecursive<nu<F>>: pattern<F> {
  template<class Seed, class Coalg>
  static nu<F> ana(const Seed& seed, const Coalg& coalg) { return nu<F>(seed, coalg); }

  static nu<F> embed(const F<nu<F>>& layer) { return colambek<nu<F>>(layer); }
};


template<template<class> class G, template<class> class F, class Nat>
static nu<G> hoist_nu(const Nat& nat, const nu<F>& self) {
  return nu<G>(self, [nat](const nu<F>& x) { return nat(x.step()); });
}

} // namespace schemes

#endif
