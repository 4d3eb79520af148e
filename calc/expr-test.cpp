#include <gtest/gtest.h>

#include "expr.hpp"

#include <limits>
#include <sstream>

using namespace calc;

namespace {

// (+ 2 (* 3 4))
const expr expr1 = make_add(make_lit(2), make_mul(make_lit(3), {make_lit(4)}));

}


TEST(expr, eval) {
  ASSERT_EQ(eval(expr1), 14);
  ASSERT_EQ(eval(make_lit(-3)), -3);
  ASSERT_EQ(eval(make_mul(make_lit(7), {})), 7);
  ASSERT_EQ(eval(make_mul(make_lit(2), {make_lit(3), make_lit(4)})), 24);
}


TEST(expr, show) {
  ASSERT_EQ(show(expr1), "(+ 2 (* 3 4))");
  ASSERT_EQ(show(make_lit(5)), "5");

  std::stringstream ss;
  ss << expr1;
  ASSERT_EQ(ss.str(), show(expr1));
}


TEST(expr, measures) {
  ASSERT_EQ(depth(expr1), 2u);
  ASSERT_EQ(depth(make_lit(1)), 0u);

  ASSERT_EQ(size(expr1), 5u);
  ASSERT_EQ(size(make_mul(make_lit(1), {make_lit(2), make_lit(3)})), 4u);
}


TEST(expr, live) {
  ASSERT_EQ(live(expr1), 3u);

  // (+ 1 (* 0 5))
  ASSERT_EQ(live(make_add(make_lit(1), make_mul(make_lit(0), {make_lit(5)}))), 1u);

  // (* 2 (+ 1 -1) 3)
  ASSERT_EQ(live(make_mul(make_lit(2), {make_add(make_lit(1), make_lit(-1)), make_lit(3)})), 0u);
}


TEST(expr, compare) {
  ASSERT_EQ(expr1, make_add(make_lit(2), make_mul(make_lit(3), {make_lit(4)})));
  ASSERT_NE(expr1, make_add(make_lit(2), make_mul(make_lit(4), {make_lit(3)})));
  ASSERT_LT(make_lit(1), make_lit(2));
}


TEST(expr, divide) {
  ASSERT_EQ(show(divide(4)), "4");
  ASSERT_EQ(show(divide(8)), "(* 2 4)");
  ASSERT_EQ(show(divide(7)), "(+ 3 4)");

  for(long n = 1; n < 200; ++n) {
    ASSERT_EQ(eval(divide(n)), n) << n;
  }

  ASSERT_EQ(eval(divide(55)), 55);
}


TEST(expr, overflow) {
  const long max = std::numeric_limits<long>::max();
  const long min = std::numeric_limits<long>::min();

  ASSERT_THROW(eval(make_add(make_lit(max), make_lit(1))), eval_error);
  ASSERT_THROW(eval(make_add(make_lit(min), make_lit(-1))), eval_error);
  ASSERT_THROW(eval(make_mul(make_lit(max), {make_lit(2)})), eval_error);
  ASSERT_THROW(eval(make_mul(make_lit(min), {make_lit(-1)})), eval_error);
  ASSERT_THROW(eval(make_mul(make_lit(-2), {make_lit(max)})), eval_error);

  ASSERT_EQ(eval(make_add(make_lit(max), make_lit(min))), -1);
  ASSERT_EQ(eval(make_mul(make_lit(min), {make_lit(1)})), min);
  ASSERT_EQ(eval(make_mul(make_lit(-1), {make_lit(max)})), -max);
  ASSERT_EQ(eval(make_mul(make_lit(max), {make_lit(0)})), 0);

  // the value is computed alongside the count
  ASSERT_THROW(live(make_mul(make_lit(max), {make_lit(2)})), eval_error);
  ASSERT_EQ(live(make_mul(make_lit(max), {make_lit(0), make_lit(3)})), 0u);
}
