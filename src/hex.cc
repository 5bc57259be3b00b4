#include "hex.hh"

#include "format.hh"
#include "int.hh"

namespace edsign {

static constexpr char kHexDigits[] = "0123456789abcdef";

static int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

Str BytesToHex(StrView bytes) {
  Str result;
  result.reserve(bytes.size() * 2);
  for (U8 byte : bytes) {
    result += kHexDigits[byte >> 4];
    result += kHexDigits[byte & 0xf];
  }
  return result;
}

Str HexToBytes(StrView hex, Status &status) {
  if (hex.size() % 2) {
    status() += f("Hex string has odd length (%zu)", hex.size());
    return {};
  }
  Str bytes;
  bytes.reserve(hex.size() / 2);
  for (Size i = 0; i < hex.size(); i += 2) {
    int high = HexValue(hex[i]);
    int low = HexValue(hex[i + 1]);
    if (high < 0 or low < 0) {
      status() += f("Invalid hex digit at offset %zu", high < 0 ? i : i + 1);
      return {};
    }
    bytes += (char)((high << 4) | low);
  }
  return bytes;
}

Str operator""_Hex(const char *str, size_t len) {
  Status status;
  Str bytes = HexToBytes(StrView(str, len), status);
  return OK(status) ? bytes : Str();
}

} // namespace edsign
