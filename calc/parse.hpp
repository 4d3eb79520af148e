#ifndef CALC_PARSE_HPP
#define CALC_PARSE_HPP

#include <schemes/either.hpp>
#include <schemes/error.hpp>

#include <deque>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>

#include <cassert>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace calc {

// malformed input, with the text near the failure
struct parse_error: schemes::error {
  using schemes::error::error;
};

namespace parser {

struct unit { };

// character range
struct range {
  const char* first;
  const char* last;

  explicit operator bool() const { return first != last; }

  std::size_t size() const { return last - first; }

  char get() const {
    assert(bool(*this));
    return *first;
  }

  range next() const {
    assert(bool(*this));
    return {first + 1, last};
  }
};


static void peek(range self, std::ostream& out, std::size_t count=42) {
  for(std::size_t i = 0; self && (i < count);
      ++i, self = self.next()) {
    out << self.get();
  }
}


// successful parse
template<class T>
struct success: range {
  using value_type = T;
  T value;
  success(T value, range rest): range(rest), value(std::move(value)) {}
};


// parse error
struct error: range {
  error(range at): range(at) {}
};


// parse result
template<class T>
using result = schemes::either<error, success<T>>;

template<class T>
static schemes::right_value<success<T>> make_success(T value, range rest) {
  return schemes::right(success<T>(std::move(value), rest));
}

static schemes::left_value<error> make_error(range at) {
  return schemes::left(error(at));
}


// parser value type
template<class Parser>
using value = typename std::result_of_t<Parser(range)>::value_type::value_type;


////////////////////////////////////////////////////////////////////////////////
// combinators

// monad unit
template<class T>
static auto pure(T value) {
  return [value = std::move(value)](range in) -> result<T> {
    return make_success(value, in);
  };
}

// functor map
template<class Parser, class Func, class=value<Parser>>
static auto map(Parser parser, Func func) {
  return [parser = std::move(parser), func = std::move(func)](range in) {
    using value_type = std::decay_t<std::result_of_t<const Func&(value<Parser>)>>;
    return map(parser(in), [&](const success<value<Parser>>& self) {
        return success<value_type>(func(self.value), self);
      });
  };
}

template<class Parser, class Func, class=value<Parser>>
static auto operator|=(Parser parser, Func func) {
  return map(parser, func);
}


// monad bind
template<class Parser, class Func, class=value<Parser>>
static auto bind(Parser parser, Func func) {
  return [parser = std::move(parser), func = std::move(func)](range in) {
    using parser_type = std::result_of_t<const Func&(value<Parser>)>;
    using value_type = value<parser_type>;
    using result_type = result<value_type>;
    return parser(in) >>= [&](const success<value<Parser>>& self) -> result_type {
      const range in = self;
      auto res = func(self.value)(in);
      if(res) {
        return res;
      }
      return make_error(in);
    };
  };
}

template<class Parser, class Func, class=value<Parser>>
static auto operator>>=(Parser parser, Func func) {
  return bind(parser, func);
}

// sequence parser
template<class LHS, class RHS, class=value<LHS>, class=value<RHS>>
static auto operator>>(LHS lhs, RHS rhs) {
  return lhs >>= [rhs = std::move(rhs)](auto) { return rhs; };
}

// guarded continuation
template<class Pred>
static auto guard(Pred pred) {
  return [pred = std::move(pred)](auto value) {
    using value_type = decltype(value);

    return [pred, value = std::move(value)](range in) -> result<value_type> {
      if(pred(value)) {
        return make_success(value, in);
      }
      return make_error(in);
    };
  };
}

// drop continuation
template<class Parser>
static auto drop(Parser parser) {
  return [parser = std::move(parser)](auto value) {
    return parser >> pure(std::move(value));
  };
}

// kleene star parser (zero-or-more). note: always succeeds
template<class Parser>
static auto kleene(Parser parser) {
  return [parser = std::move(parser)](range in) -> result<std::deque<value<Parser>>> {
    std::deque<value<Parser>> values;
    while(auto res = parser(in)) {
      values.emplace_back(res.get()->value);
      in = *res.get();
    }

    return make_success(std::move(values), in);
  };
}

// one-or-more parser
template<class Parser>
static auto plus(Parser parser) {
  return parser >>= [parser](auto first) {
    return kleene(parser) >>= [first](auto rest) {
      rest.emplace_front(first);
      return pure(rest);
    };
  };
}


// coproduct parser (alternative). note: rhs is only called if lhs fails
template<class LHS, class RHS>
static auto coproduct(LHS lhs, RHS rhs) {
  return [lhs = std::move(lhs), rhs = std::move(rhs)](range in) {
    if(auto res = lhs(in)) {
      return res;
    } else
      return rhs(in);
  };
}


template<class LHS, class RHS, class=value<LHS>, class=value<RHS>>
static auto operator|(LHS lhs, RHS rhs) {
  return coproduct(std::move(lhs), std::move(rhs));
}


// skip parser: parse zero-or-more without collecting
template<class Parser>
static auto skip(Parser parser) {
  return [parser = std::move(parser)](range in) -> result<unit> {
    while(auto res = parser(in)) {
      in = *res.get();
    }
    return make_success(unit{}, in);
  };
}


// fixpoint (result type needs to be given because c++)
template<class T, class Def>
struct fixpoint {
  const Def def;

  result<T> operator()(range in) const {
    return def(*this)(in);
  }
};

template<class T, class Def>
static fixpoint<T, Def> fix(Def def) {
  return {def};
}


////////////////////////////////////////////////////////////////////////////////
// concrete parsers

// char parser
static result<char> _char(range in) {
  if(!in) {
    return make_error(in);
  }

  return make_success(in.get(), in.next());
}

// parse char matching a predicate
template<class Pred>
static auto pred(Pred pred) {
  return _char >>= guard(pred);
}

// <cctype> classifiers are only defined on unsigned char values
static auto pred(int (*pred)(int)) {
  return _char >>= guard([pred](char c) {
      return pred(static_cast<unsigned char>(c)) != 0;
    });
}

// parse a given char
static auto single(char c) {
  return pred([c](char x) { return x == c; });
}

// parse integers. note: leading whitespaces (as per std::isspace) are consumed
static result<long> _long(range in) {
  if(!in)
    return make_error(in);

  // strtol needs a terminated buffer
  const std::string text(in.first, in.last);
  char* end;
  errno = 0;
  const long res = std::strtol(text.c_str(), &end, 10);
  if(end == text.c_str() || errno == ERANGE)
    return make_error(in);
  return make_success(res, range{in.first + (end - text.c_str()), in.last});
}

// convenience tokenizer
template<class Parser>
static auto token(Parser parser) {
  return skip(pred(std::isspace)) >> parser;
}

// end of stream parser
static result<unit> eos(range in) {
  if(in.first == in.last) {
    return make_success(unit{}, in);
  }

  return make_error(in);
}

////////////////////////////////////////////////////////////////////////////////
template<class Parser>
static value<Parser> run(Parser parser, range in) {
  return match(
      parser(in),
      [=](const error& err) -> value<Parser> {
        std::stringstream ss;
        ss << "parse error near \"";
        peek(err, ss);
        ss << "\"";
        throw parse_error(ss.str());
      },
      [](const success<value<Parser>>& ok) { return ok.value; });
}

template<class Parser>
static value<Parser> run(Parser parser, const std::string& in) {
  return run(parser, range{in.data(), in.data() + in.size()});
}

} // namespace parser
} // namespace calc

#endif
