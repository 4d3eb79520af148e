#ifndef SCHEMES_LOG_HPP
#define SCHEMES_LOG_HPP

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace schemes {
namespace log {

enum level {
  debug = 0,
  info,
  warning,
  error,
  fatal,
  size
};

const char* name(log::level level);

// false when text names no level
bool parse(const std::string& text, log::level& level);


// receives complete lines, without the trailing newline
using handler = std::function<void(const std::string& line)>;

std::vector<handler>& handlers(log::level level);


// written at the start of a line to tag it: [tag]
struct emitter {
  std::string tag;

  friend std::ostream& operator<<(std::ostream& out, const emitter& self);
  friend std::istream& operator>>(std::istream& in, emitter& self);
};


// messages below the threshold never reach handlers
void threshold(log::level level);
log::level threshold();

bool enabled(log::level level);

// line-buffered stream for level: every complete line is handed to each
// handler of the level once the stream is flushed
std::ostream& stream(log::level level);

// writes "level [tag] message" to std::clog
handler default_handler(log::level level);

} // namespace log
} // namespace schemes

#endif
