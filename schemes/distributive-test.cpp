#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "schemes.hpp"

using namespace schemes;

namespace {

const auto sum_alg = [](const list_f<int, int>& layer) -> int {
  return match(layer,
               [](nil) { return 0; },
               [](const cons_f<int, int>& self) { return self.head + self.tail; });
};

const auto length_alg = [](const list_f<int, std::size_t>& layer) -> std::size_t {
  return match(layer,
               [](nil) -> std::size_t { return 0; },
               [](const cons_f<int, std::size_t>& self) { return self.tail + 1; });
};

const auto countdown = [](int n) -> list_f<int, int> {
  if(n <= 0) return nil{};
  return cons_f<int, int>{n, n - 1};
};


// x0 * n + x1 * (n - 1) + ... + x(n-1) * 1
const auto weighted = [](const list_f<int, env<std::size_t, int>>& layer) -> int {
  return match(layer,
               [](nil) { return 0; },
               [](const cons_f<int, env<std::size_t, int>>& self) {
                 return self.head * int(self.tail.first + 1) + self.tail.second;
               });
};


// doubles the head of a layer
const auto double_heads = [](const list_f<int, list<int>>& layer) -> list_f<int, list<int>> {
  return match(layer,
               [](nil) -> list_f<int, list<int>> { return nil{}; },
               [](const cons_f<int, list<int>>& self) -> list_f<int, list<int>> {
                 return cons_f<int, list<int>>{2 * self.head, self.tail};
               });
};


// sequences one layer of optional positions, failing on negative heads
struct non_negative {
  template<class X>
  maybe<list_f<int, X>> operator()(const list_f<int, maybe<X>>& layer) const {
    return match(layer,
                 [](nil) { return some(list_f<int, X>(nil{})); },
                 [](const cons_f<int, maybe<X>>& self) -> maybe<list_f<int, X>> {
                   if(self.head < 0 || !self.tail) return {};
                   return some(list_f<int, X>(cons_f<int, X>{self.head, self.tail.get()}));
                 });
  }
};


// number of elements greater than everything after them
const auto leaders = [](const list_f<int, env<list<int>, int>>& layer) -> int {
  return match(layer,
               [](nil) { return 0; },
               [](const cons_f<int, env<list<int>, int>>& self) {
                 for(int x: self.tail.first) {
                   if(x >= self.head) return self.tail.second;
                 }
                 return self.tail.second + 1;
               });
};

}


TEST(gcata, identity_law) {
  const auto xs = make_list({1, 2, 3, 4});

  const auto res = gcata(xs, dist_cata(), [](const list_f<int, identity<int>>& layer) {
      return sum_alg(map(layer, [](const identity<int>& x) { return extract(x); }));
    });

  ASSERT_EQ(res, cata(xs, sum_alg));
  ASSERT_EQ(res, 10);
}


TEST(zygo, weighted_sum) {
  ASSERT_EQ(zygo(make_list({1, 2, 3}), length_alg, weighted), 1 * 3 + 2 * 2 + 3 * 1);
  ASSERT_EQ(zygo(list<int>(), length_alg, weighted), 0);

  ASSERT_EQ(gcata(make_list({4, 5}), dist_zygo(length_alg), weighted), 4 * 2 + 5);
}


TEST(zygo, transformer) {
  const auto xs = make_list({1, 2, 3});

  const auto res = gzygo(xs, length_alg, dist_cata(), [](const list_f<int, env_t<std::size_t, identity<int>>>& layer) {
      return match(layer,
                   [](nil) { return 0; },
                   [](const cons_f<int, env_t<std::size_t, identity<int>>>& self) {
                     return self.head * int(ask(self.tail) + 1) + extract(self.tail);
                   });
    });

  ASSERT_EQ(res, zygo(xs, length_alg, weighted));
}


TEST(para, distributive) {
  const auto xs = make_list({5, 1, 4, 2, 3});

  ASSERT_EQ(para(xs, leaders), 3);
  ASSERT_EQ(gcata(xs, dist_para<list<int>>(), leaders), para(xs, leaders));
}


TEST(para, transformer) {
  const auto xs = make_list({5, 1, 4, 2, 3});

  const auto res = gpara(xs, dist_cata(), [](const list_f<int, env_t<list<int>, identity<int>>>& layer) {
      return leaders(map(layer, [](const env_t<list<int>, identity<int>>& x) {
            return env<list<int>, int>(ask(x), extract(x));
          }));
    });

  ASSERT_EQ(res, para(xs, leaders));
}


TEST(histo, transformer) {
  using node = cofree_t<recursive<list<int>>::base, cata_law::comonad, int>;

  // sum of the elements at even positions
  const auto even_sum = [](const list_f<int, node>& layer) -> int {
    return match(layer,
                 [](nil) { return 0; },
                 [](const cons_f<int, node>& self) {
                   return match(extract(self.tail.run).tail,
                                [&](nil) { return self.head; },
                                [&](const cons_f<int, node>& next) {
                                  return self.head + extract(next.tail);
                                });
                 });
  };

  ASSERT_EQ(ghisto(make_list({1, 2, 3, 4, 5}), dist_cata(), even_sum), 9);
  ASSERT_EQ(ghisto(make_list({1, 2}), dist_cata(), even_sum), 1);
}


TEST(gana, identity_law) {
  const auto res = gana<list<int>>(3, dist_ana(), [](int n) {
      return map(countdown(n), [](int x) { return identity<int>(x); });
    });

  ASSERT_EQ(to_vector(res), (std::vector<int>{3, 2, 1}));
}


TEST(gapo, unroll) {
  // counts up from the seed, then hands over to countdown once past 3
  const auto res = gapo<list<int>>(1, countdown, [](int n) -> list_f<int, either<int, int>> {
      if(n > 3) return cons_f<int, either<int, int>>{n, left(2)};
      return cons_f<int, either<int, int>>{n, right(n + 1)};
    });

  ASSERT_EQ(to_vector(res), (std::vector<int>{1, 2, 3, 4, 2, 1}));
}


TEST(gapo, apo) {
  using seed = std::pair<list<int>, list<int>>;
  using layer = list_f<int, either<list<int>, seed>>;

  const auto zip = [](const seed& self) -> layer {
    if(!self.first || !self.second) return nil{};
    return cons_f<int, either<list<int>, seed>>{
      self.first->head * self.second->head,
      right(seed(self.first->tail, self.second->tail))
    };
  };

  const seed start(make_list({1, 2, 3}), make_list({4, 5, 6, 7}));
  const auto res = gana<list<int>>(start, dist_apo<list<int>>(), zip);

  ASSERT_EQ(to_vector(res), (std::vector<int>{4, 10, 18}));
  ASSERT_TRUE(equal(res, apo<list<int>>(start, zip)));
}


TEST(gfutu, stutter) {
  using step = free_t<recursive<list<int>>::base, ana_law::monad, list<int>>;

  const auto stutter = [](const list<int>& self) -> list_f<int, step> {
    if(!self) return nil{};
    return cons_f<int, step>{self->head, step::wrap(cons_f<int, step>{self->head, step::pure(self->tail)})};
  };

  const auto res = gfutu<list<int>>(make_list({3, 1}), dist_ana(), stutter);
  ASSERT_EQ(to_vector(res), (std::vector<int>{3, 3, 1, 1}));
}


TEST(ghylo, identity_laws) {
  const auto alg = [](const list_f<int, identity<int>>& layer) {
    return sum_alg(map(layer, [](const identity<int>& x) { return extract(x); }));
  };

  const auto coalg = [](int n) {
    return map(countdown(n), [](int x) { return identity<int>(x); });
  };

  ASSERT_EQ(ghylo(4, dist_cata(), dist_ana(), alg, coalg), hylo(4, sum_alg, countdown));
  ASSERT_EQ(ghylo(0, dist_cata(), dist_ana(), alg, coalg), 0);
}


TEST(ghylo, natural) {
  // 1 + 2 + ... + n, unfolding n into peano form
  const auto alg = [](const maybe<env<natural, natural>>& layer) -> natural {
    if(!layer) return 0;
    return layer.get().first + 1 + layer.get().second;
  };

  const auto coalg = [](natural n) -> maybe<identity<natural>> {
    if(n == 0) return {};
    return some(identity<natural>(n - 1));
  };

  const auto count = [](const maybe<natural>& layer) -> natural {
    return layer ? layer.get() + 1 : 0;
  };

  ASSERT_EQ(ghylo(natural(4), dist_zygo(count), dist_ana(), alg, coalg), 10u);
}


TEST(gprepro, identity_law) {
  const auto xs = make_list({1, 1, 1});

  const auto res = gprepro(xs, dist_cata(), double_heads, [](const list_f<int, identity<int>>& layer) {
      return sum_alg(map(layer, [](const identity<int>& x) { return extract(x); }));
    });

  ASSERT_EQ(res, prepro(xs, double_heads, sum_alg));
  ASSERT_EQ(res, 1 + 2 + 4);
}


TEST(gprepro, zygo) {
  // weighted sum where the element at depth k is doubled k times: lengths
  // are unaffected
  ASSERT_EQ(gprepro(make_list({1, 1, 1}), dist_zygo(length_alg), double_heads, weighted),
            1 * 3 + 2 * 2 + 4 * 1);
  ASSERT_EQ(gprepro(list<int>(), dist_zygo(length_alg), double_heads, weighted), 0);
}


TEST(gpostpro, identity_law) {
  const auto res = gpostpro<list<int>>(3, dist_ana(), double_heads, [](int n) {
      return map(countdown(n), [](int x) { return identity<int>(x); });
    });

  ASSERT_EQ(to_vector(res), (std::vector<int>{3, 4, 4}));
  ASSERT_TRUE(equal(res, postpro<list<int>>(3, double_heads, countdown)));
}


TEST(gpostpro, apo) {
  // counts down, handing over to a finished list at 2. finished parts are
  // transformed like the rest.
  const auto coalg = [](int n) -> list_f<int, either<list<int>, int>> {
    if(n <= 0) return nil{};
    if(n == 2) return cons_f<int, either<list<int>, int>>{n, left(make_list({9}))};
    return cons_f<int, either<list<int>, int>>{n, right(n - 1)};
  };

  ASSERT_EQ(to_vector(apo<list<int>>(4, coalg)), (std::vector<int>{4, 3, 2, 9}));

  const auto res = gpostpro<list<int>>(4, dist_apo<list<int>>(), double_heads, coalg);
  ASSERT_EQ(to_vector(res), (std::vector<int>{4, 6, 8, 72}));
}


TEST(cata_effect, short_circuit) {
  // sum, failing on negative elements
  const auto checked_sum = [](const auto& layer) {
    return match(layer,
                 [](nil) { return some(0); },
                 [](const cons_f<int, maybe<int>>& self) -> maybe<int> {
                   if(self.head < 0 || !self.tail) return {};
                   return some(self.head + self.tail.get());
                 });
  };

  ASSERT_EQ((cata_effect<maybe, int>(make_list({1, 2, 3}), checked_sum).get()), 6);
  ASSERT_FALSE(bool(cata_effect<maybe, int>(make_list({1, -2, 3}), checked_sum)));
  ASSERT_EQ((cata_effect<maybe, int>(list<int>(), checked_sum).get()), 0);
}


TEST(transverse, maybe) {
  const auto xs = make_list({1, 2, 3});

  // sequencing without failure is pure
  const auto res = transverse<list<int>, maybe>(xs, non_negative());
  ASSERT_TRUE(bool(res));
  ASSERT_TRUE(equal(res.get(), xs));

  ASSERT_FALSE(bool(transverse<list<int>, maybe>(make_list({1, -2, 3}), non_negative())));
  ASSERT_TRUE(bool(transverse<list<int>, maybe>(list<int>(), non_negative())));
}


TEST(cotransverse, zip) {
  using seeds = env<list<int>, list<int>>;

  // the context list is walked alongside the projected one
  const auto zip = [](const env<list<int>, list_f<int, list<int>>>& self) -> list_f<int, seeds> {
    const list<int>& xs = self.first;
    return match(self.second,
                 [](nil) -> list_f<int, seeds> { return nil{}; },
                 [&](const cons_f<int, list<int>>& ys) -> list_f<int, seeds> {
                   if(!xs) return nil{};
                   return cons_f<int, seeds>{xs->head * ys.head, seeds(xs->tail, ys.tail)};
                 });
  };

  const auto res = cotransverse<list<int>>(seeds(make_list({1, 2, 3}), make_list({4, 5, 6})), zip);
  ASSERT_EQ(to_vector(res), (std::vector<int>{4, 10, 18}));

  const auto longer = cotransverse<list<int>>(seeds(make_list({1, 2, 3}), make_list({4, 5, 6, 8})), zip);
  ASSERT_EQ(to_vector(longer), (std::vector<int>{4, 10, 18}));

  const auto shorter = cotransverse<list<int>>(seeds(make_list({1, 2, 3, 3}), make_list({4, 5, 6})), zip);
  ASSERT_EQ(to_vector(shorter), (std::vector<int>{4, 10, 18}));
}


TEST(cotransverse, identity_law) {
  const auto xs = make_list({7, 8, 9});
  ASSERT_TRUE(equal(cotransverse<list<int>>(identity<list<int>>(xs), dist_ana()), xs));
}
