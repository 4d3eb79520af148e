#ifndef SCHEMES_SCHEMES_HPP
#define SCHEMES_SCHEMES_HPP

#include "functor.hpp"
#include "variant.hpp"
#include "identity.hpp"
#include "env.hpp"
#include "either.hpp"
#include "maybe.hpp"

#include "recursive.hpp"
#include "fold.hpp"
#include "history.hpp"
#include "distributive.hpp"
#include "mendler.hpp"
#include "elgot.hpp"

#include "fix.hpp"
#include "list.hpp"
#include "natural.hpp"
#include "constant.hpp"

#include "debug.hpp"

#endif
