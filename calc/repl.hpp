#ifndef CALC_REPL_HPP
#define CALC_REPL_HPP

#include <functional>

namespace calc {

// read lines with readline until end of input, handing each one to handler.
// history, when given, is loaded before and saved after the session.
void repl(std::function<void(const char*)> handler,
          const char* prompt = "> ",
          const char* history = nullptr);

} // namespace calc

#endif
