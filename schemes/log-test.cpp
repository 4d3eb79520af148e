#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "log.hpp"
#include "debug.hpp"
#include "fold.hpp"
#include "list.hpp"

using namespace schemes;

namespace {

// records every line reaching a level, restores the defaults on exit
struct capture {
  const log::level level;
  const log::level saved;
  std::vector<std::string> lines;

  capture(log::level level): level(level), saved(log::threshold()) {
    log::handlers(level).emplace_back([this](const std::string& line) {
        lines.push_back(line);
      });
  }

  ~capture() {
    log::handlers(level).clear();
    log::threshold(saved);
  }
};

}


TEST(log, levels) {
  for(int i = 0; i < log::size; ++i) {
    log::level res;
    ASSERT_TRUE(log::parse(log::name(log::level(i)), res));
    ASSERT_EQ(res, log::level(i));
  }

  log::level res = log::info;
  ASSERT_FALSE(log::parse("verbose", res));
  ASSERT_EQ(res, log::info);

  ASSERT_STREQ(log::name(log::warning), "warning");
}


TEST(log, emitter) {
  std::stringstream ss;
  ss << log::emitter{"parse"} << " done";
  ASSERT_EQ(ss.str(), "[parse] done");

  log::emitter em;
  ASSERT_TRUE(bool(ss >> em));
  ASSERT_EQ(em.tag, "parse");

  std::stringstream plain("no tag");
  ASSERT_FALSE(bool(plain >> em));
  ASSERT_EQ(em.tag, "parse");
}


TEST(log, lines) {
  capture cap(log::info);
  log::threshold(log::info);

  log::stream(log::info) << log::emitter{"test"} << " hello" << std::endl;
  ASSERT_EQ(cap.lines, (std::vector<std::string>{"[test] hello"}));

  // partial lines wait for their newline
  log::stream(log::info) << "one ";
  log::stream(log::info).flush();
  ASSERT_EQ(cap.lines.size(), 1u);

  log::stream(log::info) << "two\nthree" << std::endl;
  ASSERT_EQ(cap.lines, (std::vector<std::string>{"[test] hello", "one two", "three"}));
}


TEST(log, threshold) {
  capture cap(log::info);
  log::threshold(log::warning);

  ASSERT_FALSE(log::enabled(log::info));
  ASSERT_TRUE(log::enabled(log::error));

  log::stream(log::info) << "dropped" << std::endl;
  ASSERT_TRUE(cap.lines.empty());

  log::threshold(log::debug);
  log::stream(log::info) << "kept" << std::endl;
  ASSERT_EQ(cap.lines, (std::vector<std::string>{"kept"}));
}


TEST(log, debug_algebra) {
  capture cap(log::debug);

  const auto sum = debug("sum", [](const list_f<int, int>& layer) -> int {
      return match(layer,
                   [](nil) { return 0; },
                   [](const cons_f<int, int>& self) { return self.head + self.tail; });
    });

  log::threshold(log::info);
  ASSERT_EQ(cata(make_list({1, 2}), sum), 3);
  ASSERT_TRUE(cap.lines.empty());

  log::threshold(log::debug);
  ASSERT_EQ(cata(make_list({1, 2}), sum), 3);
  ASSERT_EQ(cap.lines, (std::vector<std::string>{
        "[sum] nil -> 0",
        "[sum] (cons 2 0) -> 2",
        "[sum] (cons 1 2) -> 3"
      }));
}
