#include "command.hpp"
#include "parse.hpp"

#include <deque>
#include <sstream>

namespace calc {

namespace {

auto expression() {
  using namespace parser;

  const auto open = token(single('('));
  const auto close = token(single(')'));

  const auto literal = token(_long) |= [](long value) {
    return make_lit(value);
  };

  return fix<expr>([=](auto self) {
      const auto operands = plus(self);

      // (+ a b c) is (+ (+ a b) c)
      const auto sum = token(single('+')) >>
        ((operands >>= guard([](const std::deque<expr>& xs) { return xs.size() >= 2; }))
         |= [](const std::deque<expr>& xs) {
           expr res = xs.front();
           for(auto it = xs.begin() + 1, end = xs.end(); it != end; ++it) {
             res = make_add(res, *it);
           }
           return res;
         });

      const auto product = token(single('*')) >>
        (operands |= [](const std::deque<expr>& xs) {
          return make_mul(xs.front(), std::vector<expr>(xs.begin() + 1, xs.end()));
        });

      return literal | ((open >> (sum | product)) >>= drop(close));
    });
}


template<class Parser>
static auto whole(Parser body) {
  using namespace parser;
  return body >>= drop(skip(pred(std::isspace)) >> eos);
}

}


expr read(const std::string& text) {
  return parser::run(whole(expression()), text);
}


std::string process(const std::string& line) {
  std::stringstream in(line);

  std::string word;
  if(!(in >> word)) {
    return {};
  }

  if(word[0] != ':') {
    return std::to_string(eval(read(line)));
  }

  std::string rest;
  std::getline(in, rest);

  if(word == ":show") {
    return show(read(rest));
  }

  if(word == ":depth") {
    return std::to_string(depth(read(rest)));
  }

  if(word == ":size") {
    return std::to_string(size(read(rest)));
  }

  if(word == ":live") {
    return std::to_string(live(read(rest)));
  }

  if(word == ":unfold") {
    const long n = parser::run(whole(parser::token(parser::_long)), rest);
    if(n < 1) {
      throw eval_error("operand out of range: " + std::to_string(n));
    }

    const expr res = divide(n);
    return show(res) + " = " + std::to_string(eval(res));
  }

  throw eval_error("unknown command: " + word);
}

} // namespace calc
