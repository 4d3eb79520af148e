#ifndef CALC_EXPR_HPP
#define CALC_EXPR_HPP

#include <schemes/variant.hpp>
#include <schemes/fix.hpp>
#include <schemes/error.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace calc {

// unknown command, operand out of range, arithmetic overflow
struct eval_error: schemes::error {
  using schemes::error::error;
};


////////////////////////////////////////////////////////////////////////////////
// expression pattern functor

struct lit {
  long value;

  friend bool operator==(const lit& lhs, const lit& rhs) { return lhs.value == rhs.value; }
  friend bool operator<(const lit& lhs, const lit& rhs) { return lhs.value < rhs.value; }

  friend std::ostream& operator<<(std::ostream& out, const lit& self) {
    return out << self.value;
  }
};

template<class X>
struct add_f {
  X lhs;
  X rhs;

  friend bool operator==(const add_f& lhs, const add_f& rhs) {
    return lhs.lhs == rhs.lhs && lhs.rhs == rhs.rhs;
  }

  friend bool operator<(const add_f& lhs, const add_f& rhs) {
    if(lhs.lhs < rhs.lhs) return true;
    if(rhs.lhs < lhs.lhs) return false;
    return lhs.rhs < rhs.rhs;
  }

  friend std::ostream& operator<<(std::ostream& out, const add_f& self) {
    return out << "(+ " << self.lhs << " " << self.rhs << ")";
  }
};

// product of lhs and every factor in rest
template<class X>
struct mul_f {
  X lhs;
  std::vector<X> rest;

  friend bool operator==(const mul_f& lhs, const mul_f& rhs) {
    return lhs.lhs == rhs.lhs && lhs.rest == rhs.rest;
  }

  friend bool operator<(const mul_f& lhs, const mul_f& rhs) {
    if(lhs.lhs < rhs.lhs) return true;
    if(rhs.lhs < lhs.lhs) return false;
    return lhs.rest < rhs.rest;
  }

  friend std::ostream& operator<<(std::ostream& out, const mul_f& self) {
    out << "(* " << self.lhs;
    for(const auto& x: self.rest) {
      out << " " << x;
    }
    return out << ")";
  }
};


template<class X>
struct expr_f: schemes::variant<lit, add_f<X>, mul_f<X>> {
  using expr_f::variant::variant;

  template<class Func>
  friend auto map(const expr_f& self, Func func) {
    using type = std::decay_t<std::result_of_t<Func(const X&)>>;
    using result_type = expr_f<type>;
    return match(self,
                 [](const lit& self) -> result_type { return self; },
                 [&](const add_f<X>& self) -> result_type {
                   return add_f<type>{func(self.lhs), func(self.rhs)};
                 },
                 [&](const mul_f<X>& self) -> result_type {
                   std::vector<type> rest;
                   rest.reserve(self.rest.size());
                   for(const auto& x: self.rest) {
                     rest.emplace_back(func(x));
                   }
                   return mul_f<type>{func(self.lhs), std::move(rest)};
                 });
  }
};


using expr = schemes::fix<expr_f>;

expr make_lit(long value);
expr make_add(expr lhs, expr rhs);
expr make_mul(expr lhs, std::vector<expr> rest);


////////////////////////////////////////////////////////////////////////////////
// folds

// value of the expression. throws eval_error when it does not fit a long
long eval(const expr& self);

// prefix form, as accepted by the parser
std::string show(const expr& self);

// length of the longest path to a literal
std::size_t depth(const expr& self);

// number of nodes
std::size_t size(const expr& self);

// number of literals that contribute to the value: factors of a product that
// evaluates to zero do not
std::size_t live(const expr& self);


////////////////////////////////////////////////////////////////////////////////
// unfolds

// expression of value n: even numbers are halved into a product, odd numbers
// split into a sum, until below 5
expr divide(long n);

} // namespace calc

#endif
