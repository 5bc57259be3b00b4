#include "format.hh"

#include <cstdarg>
#include <cstdio>

namespace edsign {

Str f(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  va_list args2;
  va_copy(args2, args);
  int n = vsnprintf(nullptr, 0, fmt, args);
  va_end(args);
  if (n < 0) {
    va_end(args2);
    return {};
  }
  Str ret(n, '\0');
  vsnprintf(ret.data(), n + 1, fmt, args2);
  va_end(args2);
  return ret;
}

Str IndentString(StrView in, int spaces) {
  Str out(spaces, ' ');
  for (char c : in) {
    out += c;
    if (c == '\n') {
      out.append(spaces, ' ');
    }
  }
  return out;
}

} // namespace edsign
