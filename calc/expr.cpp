#include "expr.hpp"

#include <schemes/fold.hpp>
#include <schemes/distributive.hpp>
#include <schemes/debug.hpp>

#include <algorithm>
#include <limits>
#include <numeric>
#include <sstream>

namespace calc {

expr make_lit(long value) {
  return expr_f<expr>(lit{value});
}

expr make_add(expr lhs, expr rhs) {
  return expr_f<expr>(add_f<expr>{std::move(lhs), std::move(rhs)});
}

expr make_mul(expr lhs, std::vector<expr> rest) {
  return expr_f<expr>(mul_f<expr>{std::move(lhs), std::move(rest)});
}


namespace {

using limits = std::numeric_limits<long>;

long checked_add(long lhs, long rhs) {
  if((rhs > 0 && lhs > limits::max() - rhs) ||
     (rhs < 0 && lhs < limits::min() - rhs)) {
    throw eval_error("overflow");
  }
  return lhs + rhs;
}

long checked_mul(long lhs, long rhs) {
  const bool overflow = lhs > 0
    ? (rhs > 0 ? lhs > limits::max() / rhs : rhs < limits::min() / lhs)
    : (rhs > 0 ? lhs < limits::min() / rhs : lhs != 0 && rhs < limits::max() / lhs);

  if(overflow) {
    throw eval_error("overflow");
  }
  return lhs * rhs;
}

const auto eval_layer = [](const expr_f<long>& layer) -> long {
  return match(layer,
               [](const lit& self) { return self.value; },
               [](const add_f<long>& self) { return checked_add(self.lhs, self.rhs); },
               [](const mul_f<long>& self) {
                 return std::accumulate(self.rest.begin(), self.rest.end(), self.lhs,
                                        checked_mul);
               });
};

}


long eval(const expr& self) {
  return schemes::cata(self, schemes::debug("eval", eval_layer));
}


std::string show(const expr& self) {
  return schemes::cata(self, [](const expr_f<std::string>& layer) {
      std::stringstream ss;
      match(layer,
            [&](const lit& self) { ss << self.value; },
            [&](const add_f<std::string>& self) {
              ss << "(+ " << self.lhs << " " << self.rhs << ")";
            },
            [&](const mul_f<std::string>& self) {
              ss << "(* " << self.lhs;
              for(const auto& x: self.rest) {
                ss << " " << x;
              }
              ss << ")";
            });
      return ss.str();
    });
}


std::size_t depth(const expr& self) {
  return schemes::cata(self, [](const expr_f<std::size_t>& layer) -> std::size_t {
      return match(layer,
                   [](const lit&) -> std::size_t { return 0; },
                   [](const add_f<std::size_t>& self) {
                     return 1 + std::max(self.lhs, self.rhs);
                   },
                   [](const mul_f<std::size_t>& self) {
                     return 1 + std::accumulate(self.rest.begin(), self.rest.end(), self.lhs,
                                                [](std::size_t x, std::size_t y) { return std::max(x, y); });
                   });
    });
}


std::size_t size(const expr& self) {
  using node = schemes::env<expr, std::size_t>;
  return schemes::para(self, [](const expr_f<node>& layer) -> std::size_t {
      return match(layer,
                   [](const lit&) -> std::size_t { return 1; },
                   [](const add_f<node>& self) {
                     return 1 + self.lhs.second + self.rhs.second;
                   },
                   [](const mul_f<node>& self) {
                     std::size_t res = 1 + self.lhs.second;
                     for(const auto& x: self.rest) {
                       res += x.second;
                     }
                     return res;
                   });
    });
}


std::size_t live(const expr& self) {
  // first: value of the subterm, second: its live literals
  using node = schemes::env<long, std::size_t>;
  return schemes::zygo(self, eval_layer, [](const expr_f<node>& layer) -> std::size_t {
      return match(layer,
                   [](const lit&) -> std::size_t { return 1; },
                   [](const add_f<node>& self) {
                     return self.lhs.second + self.rhs.second;
                   },
                   [](const mul_f<node>& self) -> std::size_t {
                     // a zero factor zeroes the product
                     bool zero = self.lhs.first == 0;
                     std::size_t res = self.lhs.second;
                     for(const auto& x: self.rest) {
                       zero = zero || x.first == 0;
                       res += x.second;
                     }

                     if(zero) return 0;
                     return res;
                   });
    });
}


expr divide(long n) {
  return schemes::ana<expr>(n, [](long x) -> expr_f<long> {
      const long half = x / 2;
      if(x < 5) return lit{x};
      if(x % 2 == 0) return mul_f<long>{2, {half}};
      return add_f<long>{half, x - half};
    });
}

} // namespace calc
