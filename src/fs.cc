#include "fs.hh"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace edsign::fs {

Str Read(const Path &path, Status &status) {
  int f = open(path, O_RDONLY | O_CLOEXEC);
  if (f == -1) {
    status() += "Failed to open " + path.str;
    return "";
  }
  Str ret;
  while (true) {
    char buf[4096];
    SSize n = read(f, buf, sizeof(buf));
    if (n == -1) {
      if (errno == EINTR) {
        errno = 0;
        continue;
      }
      status() += "Failed to read " + path.str;
      close(f);
      return "";
    }
    if (n == 0) {
      break;
    }
    ret += StrView(buf, n);
  }
  close(f);
  return ret;
}

void Write(const Path &path, StrView contents, Status &status, Mode mode) {
  int f = open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (f == -1) {
    status() += "Failed to open " + path.str;
    return;
  }
  while (!contents.empty()) {
    SSize n = write(f, contents.data(), contents.size());
    if (n == -1) {
      if (errno == EINTR) {
        errno = 0;
        continue;
      }
      status() += "Failed to write " + path.str;
      close(f);
      return;
    }
    contents.remove_prefix(n);
  }
  if (close(f) == -1) {
    status() += "Failed to close " + path.str;
  }
}

bool IsRegularFile(const Path &path) {
  struct stat buffer;
  if (stat(path, &buffer) != 0) {
    errno = 0;
    return false;
  }
  return S_ISREG(buffer.st_mode);
}

Size FileSize(const Path &path, Status &status) {
  struct stat buffer;
  if (stat(path, &buffer) != 0) {
    status() += "Failed to stat " + path.str;
    return 0;
  }
  return buffer.st_size;
}

} // namespace edsign::fs
