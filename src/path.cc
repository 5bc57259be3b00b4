#include "path.hh"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace edsign {

static const char *HomeOf(const Str &username) {
  if (username.empty()) {
    if (const char *home = getenv("HOME"); home != nullptr and *home != '\0') {
      return home;
    }
    struct passwd *pw = getpwuid(getuid());
    return pw ? pw->pw_dir : nullptr;
  }
  struct passwd *pw = getpwnam(username.c_str());
  return pw ? pw->pw_dir : nullptr;
}

Path Path::ExpandUser() const {
  StrView p = str;
  if (!p.starts_with("~")) {
    return *this;
  }
  p.remove_prefix(1);
  size_t slash_pos = p.find(kSeparator);
  Str username(p.substr(0, slash_pos));
  const char *home = HomeOf(username);
  if (home == nullptr) {
    return *this;
  }
  if (slash_pos == StrView::npos) {
    return Path(home);
  }
  return Path(Str(home) + Str(p.substr(slash_pos)));
}

Path Path::operator/(StrView rhs) const {
  Path ret(str);
  if (!ret.str.empty() and !ret.str.ends_with(kSeparator)) {
    ret.str.append(1, kSeparator);
  }
  ret.str.append(rhs);
  return ret;
}

} // namespace edsign
