
#ifndef UTIL_RAISE_H_
#define UTIL_RAISE_H_

#include "Compiler.h"

#include <utility>

// Throws an `E` constructed from `args`, keeping the throw site out of the hot path.
template <class E, class... Args>
[[noreturn]] COLD_CODE void Raise(Args &&...args) {
	throw E(std::forward<Args>(args)...);
}

#endif
