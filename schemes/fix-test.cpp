#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "fix.hpp"
#include "list.hpp"
#include "natural.hpp"

using namespace schemes;

namespace {

using church = mu<recursive<list<int>>::base>;
using stream = nu<recursive<list<int>>::base>;

const auto sum_alg = [](const list_f<int, int>& layer) -> int {
  return match(layer,
               [](nil) { return 0; },
               [](const cons_f<int, int>& self) { return self.head + self.tail; });
};

const auto countdown = [](int n) -> list_f<int, int> {
  if(n <= 0) return nil{};
  return cons_f<int, int>{n, n - 1};
};

const auto naturals = [](int n) -> list_f<int, int> {
  return cons_f<int, int>{n, n + 1};
};


// natural transformation, polymorphic in the recursive positions
struct double_heads {
  template<class X>
  list_f<int, X> operator()(const list_f<int, X>& layer) const {
    return match(layer,
                 [](nil) -> list_f<int, X> { return nil{}; },
                 [](const cons_f<int, X>& self) -> list_f<int, X> {
                   return cons_f<int, X>{2 * self.head, self.tail};
                 });
  }
};


template<class T>
std::string print(const T& self) {
  std::stringstream ss;
  ss << self;
  return ss.str();
}


std::vector<int> take(std::size_t n, stream self) {
  std::vector<int> res;

  while(res.size() < n) {
    const auto layer = project(self);
    const auto& node = layer.get<cons_f<int, stream>>();

    res.push_back(node.head);
    self = node.tail;
  }

  return res;
}

}


TEST(fix, conversions) {
  const auto xs = make_list({1, 2});
  const auto fx = to_fix(xs);

  ASSERT_EQ(print(fx), "(cons 1 (cons 2 nil))");
  ASSERT_TRUE(equal(from_fix<list<int>>(fx), xs));
  ASSERT_EQ(cata(fx, sum_alg), 3);

  ASSERT_EQ(print(to_fix(natural(3))), "(just (just (just nothing)))");
  ASSERT_EQ(from_fix<natural>(to_fix(natural(3))), 3u);
}


TEST(fix, compare) {
  ASSERT_EQ(to_fix(make_list({1, 2})), to_fix(make_list({1, 2})));
  ASSERT_NE(to_fix(make_list({1, 2})), to_fix(make_list({1, 3})));
  ASSERT_NE(to_fix(make_list({1, 2})), to_fix(make_list({1})));

  ASSERT_LT(to_fix(make_list({1, 2})), to_fix(make_list({1, 3})));
  ASSERT_LT(to_fix(list<int>()), to_fix(make_list({0})));
}


TEST(mu, round_trip) {
  const auto xs = make_list({1, 2, 3, 4});
  const auto m = refix<church>(xs);

  ASSERT_TRUE(equal(refix<list<int>>(m), xs));
  ASSERT_EQ(to_vector(refix<list<int>>(m)), (std::vector<int>{1, 2, 3, 4}));
  ASSERT_EQ(m, refix<church>(make_list({1, 2, 3, 4})));
  ASSERT_NE(m, refix<church>(make_list({1, 2, 3})));
  ASSERT_EQ(print(m), "(cons 1 (cons 2 (cons 3 (cons 4 nil))))");
}


TEST(mu, compare) {
  const auto m = refix<church>(make_list({1, 2}));

  ASSERT_LT(m, refix<church>(make_list({1, 3})));
  ASSERT_LT(refix<church>(list<int>()), m);
  ASSERT_FALSE(m < m);
  ASSERT_FALSE(refix<church>(make_list({2})) < m);
}


TEST(mu, fold) {
  const auto m = refix<church>(make_list({1, 2, 3, 4}));

  ASSERT_EQ(cata(m, sum_alg), 10);
  ASSERT_EQ(cata<std::string>(m, [](const list_f<int, std::string>& layer) {
        return match(layer,
                     [](nil) { return std::string(); },
                     [](const cons_f<int, std::string>& self) {
                       return std::to_string(self.head) + self.tail;
                     });
      }), "1234");

  const auto layer = project(m);
  const auto& node = layer.get<cons_f<int, church>>();
  ASSERT_EQ(node.head, 1);
  ASSERT_EQ(cata(node.tail, sum_alg), 9);

  const auto empty = embed<church>(nil{});
  ASSERT_EQ(cata(empty, sum_alg), 0);
}


TEST(mu, hoist) {
  const auto m = refix<church>(make_list({1, 2, 3}));
  const auto doubled = hoist_mu<recursive<list<int>>::base>(double_heads(), m);

  ASSERT_EQ(to_vector(refix<list<int>>(doubled)), (std::vector<int>{2, 4, 6}));
  ASSERT_EQ(cata(doubled, sum_alg), 12);
}


TEST(nu, infinite) {
  const stream nats(0, naturals);
  ASSERT_EQ(take(5, nats), (std::vector<int>{0, 1, 2, 3, 4}));

  // unfolding a nu stores the seed, nothing is computed yet
  const auto lazy = ana<stream>(10, naturals);
  ASSERT_EQ(take(3, lazy), (std::vector<int>{10, 11, 12}));
}


TEST(nu, finite) {
  const auto fin = ana<stream>(3, countdown);

  ASSERT_EQ(to_vector(refix<list<int>>(fin)), (std::vector<int>{3, 2, 1}));
  ASSERT_EQ(cata(fin, sum_alg), 6);
  ASSERT_EQ(fin, ana<stream>(3, countdown));
  ASSERT_EQ(print(fin), "(cons 3 (cons 2 (cons 1 nil)))");

  const auto same = embed<stream>(project(fin));
  ASSERT_EQ(same, fin);
}


TEST(nu, compare) {
  const auto fin = ana<stream>(3, countdown);

  ASSERT_LT(ana<stream>(2, countdown), fin);
  ASSERT_LT(ana<stream>(0, countdown), fin);
  ASSERT_FALSE(fin < ana<stream>(3, countdown));
}


TEST(nu, hoist) {
  const stream nats(1, naturals);
  const auto doubled = hoist_nu<recursive<list<int>>::base>(double_heads(), nats);

  ASSERT_EQ(take(4, doubled), (std::vector<int>{2, 4, 6, 8}));
}


TEST(mu, nu) {
  // both encodings convert into one another through their shared pattern
  const auto m = refix<church>(make_list({5, 6}));
  const auto n = refix<stream>(m);

  ASSERT_EQ(take(2, n), (std::vector<int>{5, 6}));
  ASSERT_EQ(refix<church>(n), m);
}
