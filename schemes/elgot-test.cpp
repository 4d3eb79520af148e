#include <gtest/gtest.h>

#include "elgot.hpp"
#include "fold.hpp"
#include "list.hpp"
#include "maybe.hpp"

using namespace schemes;

namespace {

const auto sum_alg = [](const list_f<int, int>& layer) -> int {
  return match(layer,
               [](nil) { return 0; },
               [](const cons_f<int, int>& self) { return self.head + self.tail; });
};

const auto countdown = [](int n) -> list_f<int, int> {
  if(n <= 0) return nil{};
  return cons_f<int, int>{n, n - 1};
};

}


TEST(elgot, short_circuit) {
  // number of decimal digits, stopping as soon as a single digit remains
  const auto alg = [](const maybe<int>& layer) -> int {
    return layer ? layer.get() + 1 : 0;
  };

  const auto coalg = [](long n) -> either<int, maybe<long>> {
    if(n < 10) return left(1);
    return right(some(n / 10));
  };

  ASSERT_EQ(elgot(12345l, alg, coalg), 5);
  ASSERT_EQ(elgot(7l, alg, coalg), 1);
}


TEST(elgot, agrees_with_hylo) {
  const auto coalg = [](int n) -> either<int, list_f<int, int>> {
    return right(countdown(n));
  };

  for(int n = 0; n < 6; ++n) {
    ASSERT_EQ(elgot(n, sum_alg, coalg), hylo(n, sum_alg, countdown)) << n;
  }
}


TEST(coelgot, sees_seed) {
  // every step adds its own seed, whatever the layer holds
  const auto alg = [](int seed, const list_f<int, int>& layer) -> int {
    return match(layer,
                 [&](nil) { return seed; },
                 [&](const cons_f<int, int>& self) { return seed + self.tail; });
  };

  ASSERT_EQ(coelgot(4, alg, countdown), 4 + 3 + 2 + 1);
  ASSERT_EQ(coelgot(0, alg, countdown), 0);
}
