#ifndef SCHEMES_ERROR_HPP
#define SCHEMES_ERROR_HPP

#include <stdexcept>
#include <string>

namespace schemes {

  struct error : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // wrong alternative requested from a sum type
  struct bad_access : error {
    using error::error;
  };

}

#endif
