#pragma once

#include "status.hh"
#include "str.hh"

namespace edsign {

// Lowercase hex representation of the given bytes.
Str BytesToHex(StrView bytes);

// Decodes pairs of hex digits (either case). Odd length or non-hex characters
// are reported through `status`.
Str HexToBytes(StrView hex, Status &status);

// Hex literal for test vectors & constants, e.g. "9d61b1"_Hex. Invalid hex
// produces an empty string.
Str operator""_Hex(const char *str, size_t len);

} // namespace edsign
