#include "log.hpp"

#include <cstring>
#include <iostream>
#include <sstream>

namespace schemes {
namespace log {

static const char* names[log::level::size] = {
  "debug", "info", "warning", "error", "fatal"
};

const char* name(log::level level) {
  return names[level];
}

bool parse(const std::string& text, log::level& level) {
  for(int i = 0; i < log::level::size; ++i) {
    if(text == names[i]) {
      level = log::level(i);
      return true;
    }
  }

  return false;
}


std::vector<handler>& handlers(log::level level) {
  static std::vector<handler> table[log::level::size];
  return table[level];
}


std::ostream& operator<<(std::ostream& out, const emitter& self) {
  return out << "[" << self.tag << "]";
}

std::istream& operator>>(std::istream& in, emitter& self) {
  const auto pos = in.tellg();
  char c;
  if((in >> c) && c == '[') {
    std::string tag;
    if(std::getline(in, tag, ']')) {
      self.tag = tag;
      return in;
    }
  }

  in.clear();
  in.seekg(pos);
  in.setstate(std::ios::failbit);

  return in;
}


namespace {

struct dispatch: std::stringbuf {
  const log::level level;
  std::stringstream ss;

  dispatch(log::level level):
    level(level) { }

  int sync() override {
    // start from leftovers
    ss << str();

    // split lines
    std::string line;
    while(std::getline(ss, line, '\n') && !ss.eof()) {
      for(const auto& h: handlers(level)) {
        h(line);
      }
    }

    // reset stringstream with leftovers, if any
    ss = std::stringstream();
    ss << line;

    // clear buffer
    str("");

    return 0;
  }
};


log::level& current() {
  static log::level value = log::warning;
  return value;
}

}


void threshold(log::level level) { current() = level; }

log::level threshold() { return current(); }

bool enabled(log::level level) { return level >= current(); }


namespace {

struct channel {
  dispatch buffer;
  std::ostream stream;

  channel(log::level level):
    buffer(level),
    stream(&buffer) { }
};

}


std::ostream& stream(log::level level) {
  static channel channels[log::level::size] = {
    {log::debug}, {log::info}, {log::warning}, {log::error}, {log::fatal}
  };

  // discards everything
  static std::ostream null(nullptr);

  if(!enabled(level)) return null;
  return channels[level].stream;
}


handler default_handler(log::level level) {
  return [level](const std::string& line) {
    std::stringstream ss(line);
    std::clog << name(level);

    log::emitter em;
    if(ss >> em) {
      std::clog << " [" << em.tag << "]";
    }

    ss >> std::ws;
    std::clog << " " << ss.rdbuf() << std::endl;
  };
}

} // namespace log
} // namespace schemes
