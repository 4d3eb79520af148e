#include <gtest/gtest.h>

#include "command.hpp"
#include "parse.hpp"

#include <deque>
#include <limits>
#include <string>

using namespace calc;

TEST(parser, combinators) {
  using namespace parser;

  const auto digits = plus(pred(std::isdigit)) |= [](const std::deque<char>& xs) {
    return std::string(xs.begin(), xs.end());
  };

  ASSERT_EQ(run(digits, std::string("123")), "123");
  ASSERT_THROW(run(digits, std::string("abc")), parse_error);

  const auto word = token(digits) >>= drop(token(single(';')));
  ASSERT_EQ(run(word, std::string("  42 ;")), "42");

  const auto number = token(_long);
  ASSERT_EQ(run(number, std::string(" -17")), -17);

  const auto choice = (token(single('a')) >> pure(1)) | (token(single('b')) >> pure(2));
  ASSERT_EQ(run(choice, std::string(" b")), 2);
}


TEST(parser, read) {
  const expr three = make_add(make_add(make_lit(1), make_lit(2)), make_lit(3));

  ASSERT_EQ(read("42"), make_lit(42));
  ASSERT_EQ(read("  -5  "), make_lit(-5));
  ASSERT_EQ(read("(+ 1 2 3)"), three);
  ASSERT_EQ(read("( +  1\t2 3 )"), three);
  ASSERT_EQ(read("(* 7)"), make_mul(make_lit(7), {}));
  ASSERT_EQ(read("(+ 2 (* 3 4))"),
            make_add(make_lit(2), make_mul(make_lit(3), {make_lit(4)})));
}


TEST(parser, errors) {
  ASSERT_THROW(read(""), parse_error);
  ASSERT_THROW(read("(+ 1"), parse_error);
  ASSERT_THROW(read("(+ 1)"), parse_error);
  ASSERT_THROW(read("(*)"), parse_error);
  ASSERT_THROW(read("(- 1 2)"), parse_error);
  ASSERT_THROW(read("1 2"), parse_error);

  ASSERT_THROW(read("99999999999999999999"), parse_error);
  ASSERT_THROW(read("(+ 1 -99999999999999999999)"), parse_error);
  ASSERT_EQ(read("-9223372036854775808"), make_lit(std::numeric_limits<long>::min()));

  // bytes outside ascii
  ASSERT_THROW(read("(+ 1 \xe9)"), parse_error);
  ASSERT_THROW(read("\xa0 1"), parse_error);
  ASSERT_EQ(read("\t 1 \n"), make_lit(1));

  try {
    read("(+ 1 x)");
    FAIL() << "parse error expected";
  } catch(parse_error& e) {
    ASSERT_EQ(std::string(e.what()).find("parse error near"), 0u);
  }
}


TEST(command, process) {
  ASSERT_EQ(process(""), "");
  ASSERT_EQ(process("   "), "");

  ASSERT_EQ(process("(+ 1 2)"), "3");
  ASSERT_EQ(process("(* 2 (+ 3 4) 5)"), "70");

  ASSERT_EQ(process(":show (+ 1 2 3)"), "(+ (+ 1 2) 3)");
  ASSERT_EQ(process(":depth (+ 1 (* 2 3))"), "2");
  ASSERT_EQ(process(":size (+ 1 (* 2 3))"), "5");
  ASSERT_EQ(process(":live (+ 1 (* 0 5))"), "1");
  ASSERT_EQ(process(":unfold 6"), "(* 2 3) = 6");
}


TEST(command, errors) {
  ASSERT_THROW(process(":unfold 0"), eval_error);
  ASSERT_THROW(process(":unfold x"), parse_error);
  ASSERT_THROW(process(":bogus 1"), eval_error);
  ASSERT_THROW(process(":show"), parse_error);
  ASSERT_THROW(process("(+ 1"), parse_error);

  ASSERT_THROW(process("(* 9223372036854775807 2)"), eval_error);
  ASSERT_THROW(process("99999999999999999999"), parse_error);
  ASSERT_THROW(process(":unfold 99999999999999999999"), parse_error);

  // both derive from the library error
  ASSERT_THROW(process(":bogus"), schemes::error);
  ASSERT_THROW(process("("), schemes::error);
}
