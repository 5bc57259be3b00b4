#include "status.hh"

#include <cerrno>
#include <cstring>

#include "format.hh"

namespace edsign {

StrView ErrorName(Error error) {
  switch (error) {
  case Error::None:
    return "None";
  case Error::MissingArtifact:
    return "MissingArtifact";
  case Error::MissingKey:
    return "MissingKey";
  case Error::KeyDecode:
    return "KeyDecodeError";
  case Error::InvalidKeyLength:
    return "InvalidKeyLength";
  case Error::KeyConstruction:
    return "KeyConstructionError";
  case Error::ArtifactRead:
    return "ArtifactReadError";
  case Error::Signing:
    return "SigningError";
  }
  return "Unknown";
}

Status::Status() : error(Error::None), errsv(0) {}

Str &Status::operator()(const std::source_location location_arg) {
  if (errsv == 0) {
    errsv = errno;
    errno = 0;
  }
  entry.reset(new Entry{
      .next = std::move(entry), .location = location_arg, .message = {}});
  return entry->message;
}

Str &Status::operator()(Error kind, const std::source_location location_arg) {
  if (error == Error::None) {
    error = kind;
  }
  return (*this)(location_arg);
}

void AppendErrorAdvice(Status &status, StrView advice) {
  if (!status.advice.empty()) {
    status.advice += '\n';
  }
  status.advice += advice;
}

bool Status::Ok() const {
  return errsv == 0 && entry == nullptr && error == Error::None;
}

Str Status::ToStr() const {
  Str ret;
  for (Entry *i = entry.get(); i != nullptr; i = i->next.get()) {
    if (!ret.empty()) {
      ret += " ";
    }
    ret += i->message;
    if (!ret.empty()) {
      ret += " ";
    }
    auto &location = i->location;
    StrView file_name = location.file_name();
    if (auto slash = file_name.rfind('/'); slash != StrView::npos) {
      file_name.remove_prefix(slash + 1);
    }
    ret += f("(%.*s:%d).", (int)file_name.size(), file_name.data(),
             (int)location.line());
  }
  if (errsv) {
    if (!ret.empty()) {
      ret += " ";
    }
    ret += strerror(errsv);
    ret += '.';
  }
  return ret;
}

Str Status::Message() const {
  Str ret;
  for (Entry *i = entry.get(); i != nullptr; i = i->next.get()) {
    if (i->message.empty()) {
      continue;
    }
    if (!ret.empty()) {
      ret += ": ";
    }
    ret += i->message;
  }
  if (errsv) {
    if (!ret.empty()) {
      ret += ": ";
    }
    ret += strerror(errsv);
  }
  return ret;
}

void Status::Reset() {
  entry.reset();
  error = Error::None;
  errsv = 0;
  advice.clear();
}

} // namespace edsign
