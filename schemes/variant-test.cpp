#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "variant.hpp"
#include "either.hpp"
#include "maybe.hpp"
#include "identity.hpp"
#include "env.hpp"

using namespace schemes;

TEST(variant, match) {
  using value = variant<int, std::string>;

  const value x = 2;
  const value y = std::string("two");

  const auto kind = [](const value& self) {
    return match(self,
                 [](int) { return 0; },
                 [](const std::string&) { return 1; });
  };

  ASSERT_EQ(kind(x), 0);
  ASSERT_EQ(kind(y), 1);
  ASSERT_EQ(x.type(), 0u);
  ASSERT_EQ(y.get<std::string>(), "two");
  ASSERT_EQ(x.cast<std::string>(), nullptr);
}


TEST(variant, compare) {
  using value = variant<int, std::string>;

  ASSERT_EQ(value(1), value(1));
  ASSERT_NE(value(1), value(2));
  ASSERT_NE(value(1), value(std::string("1")));

  // alternatives are ordered by index first
  ASSERT_LT(value(3), value(std::string("a")));
  ASSERT_LT(value(1), value(2));

  std::stringstream ss;
  ss << value(std::string("abc"));
  ASSERT_EQ(ss.str(), "abc");
}


TEST(variant, bad_access) {
  const variant<int, std::string> x = 2;
  ASSERT_THROW(x.get<std::string>(), bad_access);
}


TEST(either, access) {
  const either<std::string, int> ok = right(2);
  const either<std::string, int> ko = left(std::string("nope"));

  ASSERT_TRUE(bool(ok));
  ASSERT_FALSE(bool(ko));

  ASSERT_EQ(ok.right(), 2);
  ASSERT_EQ(ko.left(), "nope");
  ASSERT_EQ(ko.get(), nullptr);

  ASSERT_THROW(ok.left(), bad_access);
  ASSERT_THROW(ko.right(), bad_access);
}


TEST(either, same_types) {
  const either<int, int> lhs = left(1);
  const either<int, int> rhs = right(1);

  ASSERT_NE(lhs, rhs);
  ASSERT_EQ(lhs.left(), rhs.right());
}


TEST(either, monad) {
  using result = either<std::string, int>;

  const auto half = [](int x) -> result {
    if(x % 2) return left(std::string("odd"));
    return right(x / 2);
  };

  ASSERT_EQ((result::pure(8) >>= half).right(), 4);
  ASSERT_EQ(((result::pure(8) >>= half) >>= half).right(), 2);
  ASSERT_EQ((result::pure(3) >>= half).left(), "odd");

  const result ko = left(std::string("first"));
  ASSERT_EQ((ko >>= half).left(), "first");

  ASSERT_EQ(map(result::pure(2), [](int x) { return x + 1; }).right(), 3);
}


TEST(either, copy) {
  either<std::string, int> x = left(std::string("left"));
  const either<std::string, int> y = right(1);

  x = y;
  ASSERT_EQ(x, y);

  either<std::string, int> z = x;
  z = left(std::string("again"));
  ASSERT_EQ(x.right(), 1);
  ASSERT_EQ(z.left(), "again");
}


namespace {

// counts live instances; copies throw once armed
struct fragile {
  bool armed;
  int* alive;

  fragile(bool armed, int* alive): armed(armed), alive(alive) { ++*alive; }

  fragile(const fragile& other): armed(other.armed), alive(other.alive) {
    if(armed) throw std::runtime_error("copy");
    ++*alive;
  }

  fragile(fragile&& other) noexcept: armed(other.armed), alive(other.alive) { ++*alive; }

  ~fragile() { --*alive; }
};

}


TEST(either, throwing_copy) {
  int alive = 0;

  {
    const either<int, fragile> source = right(fragile(true, &alive));

    either<int, fragile> target = left(1);
    ASSERT_THROW(target = source, std::runtime_error);
    ASSERT_EQ(target.left(), 1);

    either<int, fragile> other = right(fragile(false, &alive));
    ASSERT_THROW(other = source, std::runtime_error);
    ASSERT_TRUE(bool(other));
    ASSERT_FALSE(other.right().armed);

    other = left(2);
    ASSERT_EQ(other.left(), 2);
    ASSERT_EQ(alive, 1);
  }

  ASSERT_EQ(alive, 0);
}


TEST(maybe, monad) {
  const maybe<int> none;
  const maybe<int> two = some(2);

  ASSERT_FALSE(bool(none));
  ASSERT_TRUE(bool(two));
  ASSERT_EQ(two.get(), 2);
  ASSERT_THROW(none.get(), bad_access);

  const auto positive = [](int x) -> maybe<int> {
    if(x > 0) return some(x);
    return {};
  };

  ASSERT_EQ((two >>= positive).get(), 2);
  ASSERT_FALSE(bool(none >>= positive));
  ASSERT_FALSE(bool(maybe<int>::pure(-1) >>= positive));

  ASSERT_EQ(join(some(some(3))).get(), 3);
  ASSERT_EQ((two |= [](int x) { return x * 10; }).get(), 20);
  ASSERT_EQ(fmap(two, [](int x) { return std::to_string(x); }).get(), "2");
}


TEST(identity, laws) {
  const identity<int> x(3);

  ASSERT_EQ(extract(x), 3);
  ASSERT_EQ(extract(duplicate(x)), x);
  ASSERT_EQ(map(duplicate(x), [](const identity<int>& w) { return extract(w); }), x);
  ASSERT_EQ(join(identity<identity<int>>(x)), x);

  ASSERT_EQ(extend(x, [](const identity<int>& w) { return extract(w) + 1; }).value, 4);
}


TEST(env, laws) {
  const env<std::string, int> x("context", 3);

  ASSERT_EQ(extract(x), 3);
  ASSERT_EQ(ask(x), "context");
  ASSERT_EQ(extract(duplicate(x)), x);
  ASSERT_EQ(map(duplicate(x), [](const env<std::string, int>& w) { return extract(w); }), x);

  const auto y = extend(x, [](const env<std::string, int>& w) {
      return ask(w).size() + extract(w);
    });

  ASSERT_EQ(ask(y), "context");
  ASSERT_EQ(extract(y), 10u);
}


TEST(env, transformer) {
  const env_t<int, identity<int>> x(1, identity<int>(2));

  ASSERT_EQ(extract(x), 2);
  ASSERT_EQ(ask(x), 1);

  const auto y = duplicate(x);
  ASSERT_EQ(ask(y), 1);
  ASSERT_EQ(extract(extract(y)), 2);

  ASSERT_EQ(extract(map(x, [](int v) { return v * 2; })), 4);
}
