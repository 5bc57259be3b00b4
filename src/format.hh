#pragma once

#include "str.hh"

namespace edsign {

Str f(const char *fmt, ...) __attribute__((format(printf, 1, 2)));

// Prefix each line with `spaces` spaces.
Str IndentString(StrView in, int spaces = 2);

} // namespace edsign
