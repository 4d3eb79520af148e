#ifndef CALC_COMMAND_HPP
#define CALC_COMMAND_HPP

#include "expr.hpp"

#include <string>

namespace calc {

// one prefix expression spanning the whole text, e.g. (+ 1 (* 2 3)). throws
// parse_error
expr read(const std::string& text);

// handle one line of input:
//
//   EXPR             value of EXPR
//   :show EXPR       EXPR in normal form
//   :depth EXPR      depth of EXPR
//   :size EXPR       node count of EXPR
//   :live EXPR       literals contributing to the value of EXPR
//   :unfold N        expression of value N built by divide
//
// returns the text to print, empty for blank lines. throws parse_error or
// eval_error
std::string process(const std::string& line);

} // namespace calc

#endif
