#include "command.hpp"
#include "repl.hpp"

#include <schemes/log.hpp>

#include <fstream>
#include <iostream>
#include <string>

namespace {

struct options {
  std::string history = ".calc_history";
  std::string prompt = "> ";
  schemes::log::level level = schemes::log::warning;
  std::string filename;
};


int usage(const char* self) {
  std::cerr << "usage: " << self
            << " [--history FILE] [--log LEVEL] [--prompt TEXT] [FILE]" << std::endl;
  return 2;
}


template<class Cont>
static void with_show_errors(Cont cont, std::ostream& err=std::cerr) try {
  return cont();
} catch(std::exception& e) {
  err << e.what() << std::endl;
  throw;
}


int with_repl(const options& opts) {
  calc::repl([&](const char* input) {
    try {
      with_show_errors([&] {
        const std::string output = calc::process(input);
        if(!output.empty()) {
          std::cout << output << std::endl;
        }
      });
    } catch(schemes::error& e) {
      schemes::log::stream(schemes::log::info)
        << schemes::log::emitter{"repl"} << "recovered: " << e.what() << std::endl;
    }
  }, opts.prompt.c_str(), opts.history.c_str());

  return 0;
}


int with_load(const options& opts) {
  try {
    with_show_errors([&] {
      std::ifstream ifs(opts.filename);
      if(!ifs) {
        throw schemes::error("cannot read file: " + opts.filename);
      }

      schemes::log::stream(schemes::log::info)
        << schemes::log::emitter{"load"} << opts.filename << std::endl;

      std::string line;
      while(std::getline(ifs, line)) {
        const std::string output = calc::process(line);
        if(!output.empty()) {
          std::cout << output << std::endl;
        }
      }
    });

    return 0;
  } catch(schemes::error&) {
    return 1;
  }
}

}


int main(int argc, char** argv) {
  options opts;

  for(int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if(arg == "--history" || arg == "--log" || arg == "--prompt") {
      if(i + 1 == argc) return usage(argv[0]);
      const std::string value = argv[++i];

      if(arg == "--history") {
        opts.history = value;
      } else if(arg == "--prompt") {
        opts.prompt = value;
      } else if(!schemes::log::parse(value, opts.level)) {
        return usage(argv[0]);
      }
    } else if(arg.size() > 1 && arg[0] == '-') {
      return usage(argv[0]);
    } else if(opts.filename.empty()) {
      opts.filename = arg;
    } else {
      return usage(argv[0]);
    }
  }

  namespace log = schemes::log;
  log::threshold(opts.level);
  for(int level = opts.level; level < log::size; ++level) {
    log::handlers(log::level(level)).emplace_back(log::default_handler(log::level(level)));
  }

  if(!opts.filename.empty()) {
    return with_load(opts);
  } else {
    return with_repl(opts);
  }
}
