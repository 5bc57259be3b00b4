#pragma once

#include <memory>
#include <source_location>

#include "str.hh"

namespace edsign {

// Kinds of failures that end a signing run.
enum class Error {
  None,
  MissingArtifact,
  MissingKey,
  KeyDecode,
  InvalidKeyLength,
  KeyConstruction,
  ArtifactRead,
  Signing,
};

StrView ErrorName(Error);

struct Status {
  struct Entry {
    std::unique_ptr<Entry> next;
    std::source_location location;
    Str message;
  };

  std::unique_ptr<Entry> entry;

  // Kind of the first failure recorded in this Status.
  Error error;

  int errsv; // Saved errno value

  // Guidance for the user on how to fix the problem. Printed separately from
  // the error message.
  Str advice;

  Status();

  // Append a new entry & return a reference to its message.
  Str &operator()(const std::source_location location_arg =
                      std::source_location::current());

  // Same as above but also classifies the failure (if not classified yet).
  Str &operator()(Error,
                  const std::source_location location_arg =
                      std::source_location::current());

  bool Ok() const;

  // Messages (newest first) & saved errno, with source locations. For logs.
  Str ToStr() const;

  // Messages (newest first) & saved errno, joined with ": ". For the user.
  Str Message() const;

  void Reset();
};

inline bool OK(const Status &status) { return status.Ok(); }
void AppendErrorAdvice(Status &, StrView advice);

} // namespace edsign
