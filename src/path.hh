#pragma once

// Class for working with paths. Based on python's pathlib.

#include "str.hh"

namespace edsign {

struct Path {
  constexpr static char kSeparator = '/';

  Str str;

  Path(const char *str) : str(str) {}
  Path(Str str) : str(std::move(str)) {}
  Path(StrView path) : str(path) {}
  Path() = default;
  Path(const Path &other) = default;
  Path &operator=(const Path &other) = default;

  // Replace initial "~" or "~user" with user's home directory.
  //
  // Paths that can't be expanded (unknown user, no home directory) are
  // returned unchanged.
  Path ExpandUser() const;

  Path operator/(StrView rhs) const;

  bool operator==(const Path &other) const { return str == other.str; }

  Str ToStr() const { return str; }

  operator StrView() const { return str; }
  operator const char *() const { return str.c_str(); }
};

} // namespace edsign
