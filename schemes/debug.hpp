#ifndef SCHEMES_DEBUG_HPP
#define SCHEMES_DEBUG_HPP

#include "recursive.hpp"
#include "log.hpp"

#include <ostream>
#include <string>
#include <utility>

namespace schemes {

// algebra wrapper logging every layer it folds, and the result, on the debug
// stream
template<class Alg>
struct debug_algebra {
  using argument_type = algebra_argument<Alg>;
  using result_type = algebra_result<Alg>;

  std::string name;
  Alg alg;

  result_type operator()(const argument_type& layer) const {
    result_type result = alg(layer);

    if(log::enabled(log::debug)) {
      log::stream(log::debug) << log::emitter{name} << " " << layer
                              << " -> " << result << std::endl;
    }

    return result;
  }
};


// alg must have a single, non-template call operator
template<class Alg>
static debug_algebra<Alg> debug(std::string name, Alg alg) {
  return {std::move(name), std::move(alg)};
}

} // namespace schemes

#endif
