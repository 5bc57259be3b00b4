#pragma once

#include "status.hh"
#include "str.hh"

namespace edsign {

constexpr char kBase64Chars[65] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                  "abcdefghijklmnopqrstuvwxyz"
                                  "0123456789+/";

// Standard (RFC 4648) base64 with '=' padding.
Str Base64Encode(StrView bytes);

// Strict decoder. Whitespace is skipped. Any other character outside of the
// base64 alphabet, missing padding or data after the padding is an error.
Str Base64Decode(StrView encoded, Status &);

} // namespace edsign
