#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "fold.hpp"
#include "list.hpp"
#include "natural.hpp"
#include "fix.hpp"
#include "constant.hpp"

using namespace schemes;

namespace {

// binary tree pattern functor: leaf(value) | branch(lhs, rhs)
struct leaf {
  long value;

  friend bool operator==(const leaf& lhs, const leaf& rhs) { return lhs.value == rhs.value; }
  friend bool operator<(const leaf& lhs, const leaf& rhs) { return lhs.value < rhs.value; }

  friend std::ostream& operator<<(std::ostream& out, const leaf& self) {
    return out << "(leaf " << self.value << ")";
  }
};

template<class X>
struct branch {
  X lhs;
  X rhs;

  friend bool operator==(const branch& lhs, const branch& rhs) {
    return lhs.lhs == rhs.lhs && lhs.rhs == rhs.rhs;
  }

  friend std::ostream& operator<<(std::ostream& out, const branch& self) {
    return out << "(branch " << self.lhs << " " << self.rhs << ")";
  }
};

template<class X>
struct tree_f: variant<leaf, branch<X>> {
  using tree_f::variant::variant;

  template<class Func>
  friend auto map(const tree_f& self, Func func) {
    using type = std::decay_t<std::result_of_t<Func(const X&)>>;
    using result_type = tree_f<type>;
    return match(self,
                 [](const leaf& self) -> result_type { return self; },
                 [&](const branch<X>& self) -> result_type {
                   return branch<type>{func(self.lhs), func(self.rhs)};
                 });
  }
};

using tree = fix<tree_f>;


const auto fib_coalg = [](long n) -> tree_f<long> {
  if(n < 2) return leaf{n};
  return branch<long>{n - 1, n - 2};
};

const auto fib_alg = [](const tree_f<long>& layer) -> long {
  return match(layer,
               [](const leaf& self) { return self.value; },
               [](const branch<long>& self) { return self.lhs + self.rhs; });
};


const auto length_alg = [](const list_f<int, std::size_t>& layer) -> std::size_t {
  return match(layer,
               [](nil) -> std::size_t { return 0; },
               [](const cons_f<int, std::size_t>& self) { return self.tail + 1; });
};

const auto sum_alg = [](const list_f<int, int>& layer) -> int {
  return match(layer,
               [](nil) { return 0; },
               [](const cons_f<int, int>& self) { return self.head + self.tail; });
};

// n, n - 1, ..., 1
const auto countdown = [](int n) -> list_f<int, int> {
  if(n <= 0) return nil{};
  return cons_f<int, int>{n, n - 1};
};

const auto double_heads = [](const list_f<int, list<int>>& layer) -> list_f<int, list<int>> {
  return match(layer,
               [](nil) -> list_f<int, list<int>> { return nil{}; },
               [](const cons_f<int, list<int>>& self) -> list_f<int, list<int>> {
                 return cons_f<int, list<int>>{2 * self.head, self.tail};
               });
};

}


TEST(cata, list_length) {
  ASSERT_EQ(cata(make_list({1, 2, 3}), length_alg), 3u);
  ASSERT_EQ(cata(list<int>(), length_alg), 0u);
  ASSERT_EQ(fold(make_list({1, 2, 3, 4}), sum_alg), 10);
}


TEST(cata, explicit_carrier) {
  const auto xs = make_list({1, 2, 3});
  const std::string res = cata<std::string>(xs, [](const auto& layer) {
      return match(layer,
                   [](nil) { return std::string(); },
                   [](const cons_f<int, std::string>& self) {
                     return std::to_string(self.head) + self.tail;
                   });
    });

  ASSERT_EQ(res, "123");
}


TEST(hylo, fibonacci) {
  ASSERT_EQ(hylo(5l, fib_alg, fib_coalg), 5);
  ASSERT_EQ(hylo(10l, fib_alg, fib_coalg), 55);
  ASSERT_EQ(refold(1l, fib_alg, fib_coalg), 1);
}


TEST(hylo, fusion) {
  for(long n = 0; n < 12; ++n) {
    ASSERT_EQ(hylo(n, fib_alg, fib_coalg), cata(ana<tree>(n, fib_coalg), fib_alg)) << n;
  }

  ASSERT_EQ(hylo(4, sum_alg, countdown), cata(unfold<list<int>>(4, countdown), sum_alg));
}


TEST(ana, countdown) {
  ASSERT_EQ(to_vector(ana<list<int>>(3, countdown)), (std::vector<int>{3, 2, 1}));
  ASSERT_FALSE(ana<list<int>>(0, countdown));
}


TEST(laws, round_trip) {
  const auto xs = make_list({1, 2, 3});

  ASSERT_TRUE(equal(embed<list<int>>(project(xs)), xs));

  const list_f<int, list<int>> layer = cons_f<int, list<int>>{0, xs};
  ASSERT_EQ(project(embed<list<int>>(layer)), layer);

  const list_f<int, list<int>> empty = nil{};
  ASSERT_EQ(project(embed<list<int>>(empty)), empty);

  for(natural n = 0; n < 4; ++n) {
    ASSERT_EQ(embed<natural>(project(n)), n);
  }
}


TEST(laws, identity_folds) {
  const auto xs = make_list({4, 5, 6});

  const auto copy = cata<list<int>>(xs, [](const list_f<int, list<int>>& layer) {
      return embed<list<int>>(layer);
    });
  ASSERT_TRUE(equal(copy, xs));

  const auto same = ana<list<int>>(xs, [](const list<int>& self) { return project(self); });
  ASSERT_TRUE(equal(same, xs));

  ASSERT_EQ(cata<natural>(natural(7), [](const maybe<natural>& layer) { return embed<natural>(layer); }), 7u);
}


TEST(para, generalizes_cata) {
  const auto xs = make_list({1, 2, 3, 4});

  const auto res = para(xs, [](const list_f<int, env<list<int>, int>>& layer) {
      return sum_alg(map(layer, [](const env<list<int>, int>& x) { return x.second; }));
    });

  ASSERT_EQ(res, cata(xs, sum_alg));
}


TEST(para, suffixes) {
  using suffixes = list<list<int>>;
  const auto xs = make_list({1, 2, 3});

  const suffixes res = para(xs, [](const list_f<int, env<list<int>, suffixes>>& layer) -> suffixes {
      return match(layer,
                   [](nil) { return suffixes(); },
                   [](const cons_f<int, env<list<int>, suffixes>>& self) {
                     return self.tail.first %= self.tail.second;
                   });
    });

  const auto all = to_vector(res);
  ASSERT_EQ(all.size(), 3u);
  ASSERT_EQ(to_vector(all[0]), (std::vector<int>{2, 3}));
  ASSERT_EQ(to_vector(all[1]), (std::vector<int>{3}));
  ASSERT_FALSE(all[2]);
}


TEST(apo, generalizes_ana) {
  const auto res = apo<list<int>>(5, [](int n) {
      return map(countdown(n), [](int next) { return either<list<int>, int>(right(next)); });
    });

  ASSERT_TRUE(equal(res, ana<list<int>>(5, countdown)));
}


TEST(apo, zip_multiply) {
  using seed = std::pair<list<int>, list<int>>;
  using layer = list_f<int, either<list<int>, seed>>;

  const auto zip = [](const seed& self) -> layer {
    if(!self.first || !self.second) return nil{};
    return cons_f<int, either<list<int>, seed>>{
      self.first->head * self.second->head,
      right(seed(self.first->tail, self.second->tail))
    };
  };

  const auto res = apo<list<int>>(seed(make_list({1, 2, 3}), make_list({4, 5, 6})), zip);
  ASSERT_EQ(to_vector(res), (std::vector<int>{4, 10, 18}));

  const auto longer = apo<list<int>>(seed(make_list({1, 2, 3}), make_list({4, 5, 6, 7, 8})), zip);
  ASSERT_EQ(to_vector(longer), (std::vector<int>{4, 10, 18}));

  const auto shorter = apo<list<int>>(seed(make_list({1, 2, 3}), make_list({4})), zip);
  ASSERT_EQ(to_vector(shorter), (std::vector<int>{4}));
}


TEST(apo, early_exit) {
  // append: once lhs is exhausted, rhs is reused as is
  using seed = std::pair<list<int>, list<int>>;
  using layer = list_f<int, either<list<int>, seed>>;

  const auto rhs = make_list({3, 4});
  const auto append = [](const seed& self) -> layer {
    if(!self.first) {
      if(!self.second) return nil{};
      return cons_f<int, either<list<int>, seed>>{self.second->head, left(self.second->tail)};
    }

    return cons_f<int, either<list<int>, seed>>{self.first->head, right(seed(self.first->tail, self.second))};
  };

  const auto res = apo<list<int>>(seed(make_list({1, 2}), rhs), append);
  ASSERT_EQ(to_vector(res), (std::vector<int>{1, 2, 3, 4}));

  // the tail of rhs is shared, not copied
  ASSERT_EQ(res->tail->tail->tail, rhs->tail);
}


TEST(hoist, change_functor) {
  const auto xs = make_list({1, 2, 3});

  const auto ys = hoist<list<long>>(xs, [](const list_f<int, list<long>>& layer) {
      return match(layer,
                   [](nil) -> list_f<long, list<long>> { return nil{}; },
                   [](const cons_f<int, list<long>>& self) -> list_f<long, list<long>> {
                     return cons_f<long, list<long>>{10l * self.head, self.tail};
                   });
    });

  ASSERT_EQ(to_vector(ys), (std::vector<long>{10, 20, 30}));
}


TEST(lambek, inverts_embed) {
  const auto xs = make_list({1, 2, 3});

  const auto layer = lambek(xs);
  const auto& head = layer.get<cons_f<int, list<int>>>();
  ASSERT_EQ(head.head, 1);
  ASSERT_TRUE(equal(head.tail, xs->tail));

  const auto ys = colambek<list<int>>(project(xs));
  ASSERT_TRUE(equal(ys, xs));

  ASSERT_FALSE(colambek<list<int>>(nil{}));
}


TEST(prepro, transforms_subterms) {
  const auto xs = make_list({1, 1, 1});

  // the element at depth k is transformed k times
  ASSERT_EQ(prepro(xs, double_heads, sum_alg), 1 + 2 + 4);

  const auto same = [](const list_f<int, list<int>>& layer) { return layer; };
  ASSERT_EQ(prepro(xs, same, sum_alg), cata(xs, sum_alg));
}


TEST(postpro, transforms_subterms) {
  const auto res = postpro<list<int>>(3, double_heads, countdown);
  ASSERT_EQ(to_vector(res), (std::vector<int>{3, 4, 4}));
}


TEST(list, folds) {
  const auto xs = make_list({1, 2, 3});

  ASSERT_EQ(foldr(xs, std::string(), [](int x, const std::string& rest) {
        return std::to_string(x) + rest;
      }), "123");

  ASSERT_EQ(foldl(std::string(), xs, [](std::string acc, int x) {
        return acc + std::to_string(x);
      }), "123");

  ASSERT_EQ(length(xs), 3u);

  int total = 0;
  for(int x: xs) total += x;
  ASSERT_EQ(total, 6);

  const std::vector<int> values = {1, 2, 3};
  ASSERT_TRUE(equal(make_list(values.begin(), values.end()), xs));
  ASSERT_FALSE(equal(make_list({1, 2}), xs));
}


TEST(natural, peano) {
  ASSERT_FALSE(bool(project(natural(0))));
  ASSERT_EQ(project(natural(3)).get(), 2u);

  const auto twice = [](const maybe<natural>& layer) -> natural {
    if(!layer) return 0;
    return layer.get() + 2;
  };

  ASSERT_EQ(cata(natural(4), twice), 8u);
  ASSERT_EQ(ana<natural>(3, [](int n) -> maybe<int> {
        if(n == 0) return {};
        return some(n - 1);
      }), 3u);
}


TEST(constant, non_recursive) {
  const auto value = [](const const_f<maybe<int>, int>& layer) -> int {
    return layer.value ? layer.value.get() : -1;
  };

  ASSERT_EQ(cata(some(3), value), 3);
  ASSERT_EQ(cata(maybe<int>(), value), -1);

  const either<std::string, int> ok = right(2);
  ASSERT_EQ((embed<either<std::string, int>>(project(ok))), ok);

  // no recursive position: map leaves the layer alone
  const const_f<int, int> layer(7);
  ASSERT_EQ(map(layer, [](int x) { return x + 1; }).value, 7);
}
