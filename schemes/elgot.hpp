#ifndef SCHEMES_ELGOT_HPP
#define SCHEMES_ELGOT_HPP

#include "recursive.hpp"
#include "either.hpp"

#include <type_traits>

namespace schemes {

// refold whose coalgebra may answer directly (left) instead of producing a
// layer (right)
template<class B = deduce, class A, class Alg, class Coalg>
static result_t<B, Alg> elgot(const A& seed, const Alg& alg, const Coalg& coalg) {
  using result_type = result_t<B, Alg>;
  using step_type = std::decay_t<decltype(coalg(seed))>;
  using layer_type = typename step_type::value_type;

  return match(coalg(seed),
               [](const result_type& done) { return done; },
               [&](const layer_type& layer) -> result_type {
                 return alg(map(layer, [&](const A& next) {
                       return elgot<result_type>(next, alg, coalg);
                     }));
               });
}


// refold whose algebra also sees the seed the layer was produced from:
// alg(seed, layer)
template<class B = deduce, class A, class Alg, class Coalg>
static result_t<B, Alg> coelgot(const A& seed, const Alg& alg, const Coalg& coalg) {
  using result_type = result_t<B, Alg>;
  return alg(seed, map(coalg(seed), [&](const A& next) {
        return coelgot<result_type>(next, alg, coalg);
      }));
}

} // namespace schemes

#endif
