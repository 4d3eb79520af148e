#include "repl.hpp"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

namespace calc {

namespace {

// readline history bound to a file for the lifetime of a session
class history_file {
  const char* filename;
public:
  explicit history_file(const char* filename): filename(filename) {
    if(filename) read_history(filename);
  }

  history_file(const history_file&) = delete;

  ~history_file() {
    if(filename) write_history(filename);
  }
};

struct free_line {
  void operator()(char* line) const { std::free(line); }
};

}


void repl(std::function<void(const char*)> handler,
          const char* prompt,
          const char* history) {
  const history_file session(history);

  // readline mallocs a new buffer every time
  while(std::unique_ptr<char, free_line> line{readline(prompt)}) {
    if(std::strlen(line.get()) > 0) {
      add_history(line.get());
    }

    const std::string contents = line.get();
    line.reset();

    handler(contents.c_str());
  }
}

} // namespace calc
