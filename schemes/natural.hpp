#ifndef SCHEMES_NATURAL_HPP
#define SCHEMES_NATURAL_HPP

#include "recursive.hpp"
#include "maybe.hpp"

#include <cstddef>

namespace schemes {

// peano view of unsigned integers: 0 is nothing, n + 1 is just(n)
using natural = std::size_t;

template<>
struct recursive<natural>: pattern<maybe> {
  static maybe<natural> project(natural self) {
    if(!self) return {};
    return some(self - 1);
  }
};

template<>
struct corecursive<natural>: pattern<maybe> {
  static natural embed(const maybe<natural>& layer) {
    if(!layer) return 0;
    return layer.get() + 1;
  }
};

} // namespace schemes

#endif
