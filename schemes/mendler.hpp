#ifndef SCHEMES_MENDLER_HPP
#define SCHEMES_MENDLER_HPP

#include "fix.hpp"

namespace schemes {

// mendler-style iteration works on fix<F> directly, without going through
// recursive<T>. psi receives the recursive call as a value and must only use
// it on the positions of the layer it is given.

// psi(rec, layer) where rec: fix<F> -> C
template<class C, template<class> class F, class Psi>
static C mcata(const fix<F>& self, const Psi& psi) {
  const auto rec = [&](const fix<F>& x) { return mcata<C>(x, psi); };
  return psi(rec, self.unfix());
}


// psi(rec, out, layer) where out: fix<F> -> F<fix<F>> lets psi look further
// down than one layer
template<class C, template<class> class F, class Psi>
static C mhisto(const fix<F>& self, const Psi& psi) {
  const auto rec = [&](const fix<F>& x) { return mhisto<C>(x, psi); };
  const auto out = [](const fix<F>& x) { return x.unfix(); };
  return psi(rec, out, self.unfix());
}

} // namespace schemes

#endif
