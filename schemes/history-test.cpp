#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "history.hpp"
#include "distributive.hpp"
#include "list.hpp"
#include "natural.hpp"
#include "maybe.hpp"

using namespace schemes;

namespace {

const auto fib = [](const maybe<history<natural, natural>>& layer) -> natural {
  if(!layer) return 0;

  const auto& prev = layer.get();
  if(!prev.tail) return 1;

  return prev.head + prev.tail.get().head;
};


// sum of the elements at even positions
const auto even_sum = [](const list_f<int, history<list<int>, int>>& layer) -> int {
  return match(layer,
               [](nil) { return 0; },
               [](const cons_f<int, history<list<int>, int>>& self) {
                 return match(self.tail.tail,
                              [&](nil) { return self.head; },
                              [&](const cons_f<int, history<list<int>, int>>& next) {
                                return self.head + next.tail.head;
                              });
               });
};


using stutter_future = future<list<int>, list<int>>;

// every element twice
const auto stutter = [](const list<int>& self) -> list_f<int, stutter_future> {
  if(!self) return nil{};
  return cons_f<int, stutter_future>{
    self->head,
    stutter_future::wrap(cons_f<int, stutter_future>{self->head, stutter_future::pure(self->tail)})
  };
};

}


TEST(cofree, comonad) {
  using stream = cofree<maybe, int>;

  const stream xs(1, some(stream(2, {})));

  ASSERT_EQ(extract(xs), 1);
  ASSERT_EQ(xs.tail.get().head, 2);
  ASSERT_EQ(extract(duplicate(xs)), xs);

  const auto ys = map(xs, [](int x) { return 10 * x; });
  ASSERT_EQ(ys.head, 10);
  ASSERT_EQ(ys.tail.get().head, 20);

  // every position sees its own subtree
  const auto sizes = extend(xs, [](const stream& self) {
      return 1 + (self.tail ? 1 : 0);
    });
  ASSERT_EQ(sizes.head, 2);
  ASSERT_EQ(sizes.tail.get().head, 1);

  ASSERT_EQ(embed<stream>(project(xs)), xs);

  std::stringstream ss;
  ss << xs;
  ASSERT_EQ(ss.str(), "(1 :< (just (2 :< nothing)))");
}


TEST(free_monad, monad) {
  using free = free_monad<maybe, int>;

  const free x = free::wrap(some(free::pure(3)));

  ASSERT_EQ(map(x, [](int v) { return v + 1; }), free::wrap(some(free::pure(4))));
  ASSERT_EQ(join(free_monad<maybe, free>::pure(x)), x);
  ASSERT_EQ(join(free_monad<maybe, free>::wrap({})), free::wrap({}));

  const auto twice = [](int v) { return free::wrap(some(free::pure(2 * v))); };
  ASSERT_EQ(free::pure(5) >>= twice, free::wrap(some(free::pure(10))));
  ASSERT_EQ(x >>= twice, free::wrap(some(free::wrap(some(free::pure(6))))));

  ASSERT_EQ(embed<free>(project(x)), x);
}


TEST(histo, fibonacci) {
  const std::vector<natural> expected = {0, 1, 1, 2, 3, 5, 8, 13, 21};

  for(natural n = 0; n < expected.size(); ++n) {
    ASSERT_EQ(histo(n, fib), expected[n]) << n;
  }

  ASSERT_EQ(histo(natural(50), fib), 12586269025u);
}


TEST(histo, lookback) {
  ASSERT_EQ(histo(make_list({1, 2, 3, 4, 5}), even_sum), 9);
  ASSERT_EQ(histo(make_list({7}), even_sum), 7);
  ASSERT_EQ(histo(list<int>(), even_sum), 0);
}


TEST(histo, generalized) {
  ASSERT_EQ(gcata(natural(10), dist_histo<recursive<natural>::base>(), fib), 55u);
  ASSERT_EQ(gcata(make_list({1, 2, 3, 4, 5}), dist_histo<recursive<list<int>>::base>(), even_sum),
            histo(make_list({1, 2, 3, 4, 5}), even_sum));
}


TEST(futu, stutter) {
  const auto res = futu<list<int>>(make_list({2, 1}), stutter);
  ASSERT_EQ(to_vector(res), (std::vector<int>{2, 2, 1, 1}));

  ASSERT_FALSE(futu<list<int>>(list<int>(), stutter));
}


TEST(futu, generalized) {
  const auto xs = make_list({3, 1, 2});
  const auto res = gana<list<int>>(xs, dist_futu<recursive<list<int>>::base>(), stutter);

  ASSERT_TRUE(equal(res, futu<list<int>>(xs, stutter)));
}


TEST(chrono, fibonacci) {
  using node = cofree<maybe, natural>;
  using seed = free_monad<maybe, natural>;

  const auto alg = [](const maybe<node>& layer) -> natural {
    if(!layer) return 0;
    if(!layer.get().tail) return 1;
    return layer.get().head + layer.get().tail.get().head;
  };

  // counts down two steps at a time, emitting the intermediate layer directly
  const auto coalg = [](natural n) -> maybe<seed> {
    if(n == 0) return {};
    if(n == 1) return some(seed::pure(0));
    return some(seed::wrap(some(seed::pure(n - 2))));
  };

  ASSERT_EQ(chrono<maybe>(natural(10), alg, coalg), 55u);
  ASSERT_EQ(chrono<maybe>(natural(1), alg, coalg), 1u);
  ASSERT_EQ(chrono<maybe>(natural(0), alg, coalg), 0u);
}


TEST(chrono, generalized) {
  using node = cofree_t<maybe, cata_law::comonad, natural>;
  using seed = free_t<maybe, ana_law::monad, natural>;

  const auto alg = [](const maybe<node>& layer) -> natural {
    if(!layer) return 0;

    const auto& prev = extract(layer.get().run);
    if(!prev.tail) return 1;
    return prev.head + extract(prev.tail.get());
  };

  const auto coalg = [](natural n) -> maybe<seed> {
    if(n == 0) return {};
    return some(seed::pure(n - 1));
  };

  ASSERT_EQ(gchrono<maybe>(natural(10), dist_cata(), dist_ana(), alg, coalg), 55u);
  ASSERT_EQ(gchrono<maybe>(natural(0), dist_cata(), dist_ana(), alg, coalg), 0u);
}
