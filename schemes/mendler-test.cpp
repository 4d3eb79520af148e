#include <gtest/gtest.h>

#include "mendler.hpp"
#include "list.hpp"
#include "natural.hpp"

using namespace schemes;

namespace {

using flist = fix_t<list<int>>;
using fnat = fix_t<natural>;

const auto sum_alg = [](const list_f<int, int>& layer) -> int {
  return match(layer,
               [](nil) { return 0; },
               [](const cons_f<int, int>& self) { return self.head + self.tail; });
};

}


TEST(mcata, length) {
  const auto length = [](const auto& rec, const list_f<int, flist>& layer) -> std::size_t {
    return match(layer,
                 [](nil) -> std::size_t { return 0; },
                 [&](const cons_f<int, flist>& self) { return 1 + rec(self.tail); });
  };

  ASSERT_EQ(mcata<std::size_t>(to_fix(make_list({1, 2, 3})), length), 3u);
  ASSERT_EQ(mcata<std::size_t>(to_fix(list<int>()), length), 0u);
}


TEST(mcata, agrees_with_cata) {
  const auto xs = to_fix(make_list({4, 5, 6}));

  const auto sum = [](const auto& rec, const list_f<int, flist>& layer) {
    return sum_alg(map(layer, rec));
  };

  ASSERT_EQ(mcata<int>(xs, sum), cata(xs, sum_alg));
}


TEST(mhisto, fibonacci) {
  const auto fib = [](const auto& rec, const auto& out, const maybe<fnat>& layer) -> natural {
    if(!layer) return 0;

    const auto prev = out(layer.get());
    if(!prev) return 1;

    return rec(layer.get()) + rec(prev.get());
  };

  ASSERT_EQ(mhisto<natural>(to_fix(natural(0)), fib), 0u);
  ASSERT_EQ(mhisto<natural>(to_fix(natural(1)), fib), 1u);
  ASSERT_EQ(mhisto<natural>(to_fix(natural(10)), fib), 55u);
}
