#include "base64.hh"

#include <array>
#include <cctype>
#include <cerrno>

#include "format.hh"
#include "int.hh"

namespace edsign {

Str Base64Encode(StrView buf) {
  Str ret;
  ret.reserve((buf.size() + 2) / 3 * 4);
  int i = 0;
  U8 char_array_3[3];
  U8 char_array_4[4];

  for (char c : buf) {
    char_array_3[i++] = c;
    if (i == 3) {
      char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
      char_array_4[1] =
          ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
      char_array_4[2] =
          ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);
      char_array_4[3] = char_array_3[2] & 0x3f;

      for (i = 0; i < 4; i++)
        ret += kBase64Chars[char_array_4[i]];
      i = 0;
    }
  }

  if (i) {
    for (int j = i; j < 3; j++)
      char_array_3[j] = '\0';

    char_array_4[0] = (char_array_3[0] & 0xfc) >> 2;
    char_array_4[1] =
        ((char_array_3[0] & 0x03) << 4) + ((char_array_3[1] & 0xf0) >> 4);
    char_array_4[2] =
        ((char_array_3[1] & 0x0f) << 2) + ((char_array_3[2] & 0xc0) >> 6);

    for (int j = 0; j < i + 1; j++)
      ret += kBase64Chars[char_array_4[j]];

    while (i++ < 3)
      ret += '=';
  }

  return ret;
}

static constexpr U8 kInvalid = 0xff;

constexpr static std::array<U8, 256> kBase64Index = []() {
  std::array<U8, 256> arr{};
  arr.fill(kInvalid);
  for (int i = 0; i < 64; ++i) {
    arr[(U8)kBase64Chars[i]] = i;
  }
  return arr;
}();

Str Base64Decode(StrView encoded, Status &status) {
  // Nothing below touches the OS so an errno left by earlier calls would only
  // confuse the error message.
  errno = 0;
  Str ret;
  ret.reserve(encoded.size() / 4 * 3);
  U8 char_array_4[4];
  int i = 0;
  int padding = 0;

  for (Size in = 0; in < encoded.size(); ++in) {
    U8 c = encoded[in];
    if (isspace(c)) {
      continue;
    }
    if (c == '=') {
      // Padding may only fill the last one or two positions of a quad.
      if (i < 2 or i + padding >= 4) {
        status() += f("Unexpected base64 padding at offset %zu", in);
        return {};
      }
      ++padding;
      continue;
    }
    if (padding) {
      status() += f("Base64 data continues after padding at offset %zu", in);
      return {};
    }
    U8 value = kBase64Index[c];
    if (value == kInvalid) {
      if (isprint(c)) {
        status() +=
            f("Invalid base64 character '%c' at offset %zu", c, in);
      } else {
        status() +=
            f("Invalid base64 byte 0x%02x at offset %zu", c, in);
      }
      return {};
    }
    char_array_4[i++] = value;
    if (i == 4) {
      ret += (char)((char_array_4[0] << 2) + ((char_array_4[1] & 0x30) >> 4));
      ret += (char)(((char_array_4[1] & 0xf) << 4) + ((char_array_4[2] & 0x3c) >> 2));
      ret += (char)(((char_array_4[2] & 0x3) << 6) + char_array_4[3]);
      i = 0;
    }
  }

  if (i == 0) {
    return ret;
  }
  if (i + padding != 4) {
    status() += f("Incorrect base64 padding (%d trailing characters)", i + padding);
    return {};
  }
  // The final quad carries 1 (i == 2) or 2 (i == 3) bytes.
  for (int j = i; j < 4; j++)
    char_array_4[j] = 0;
  ret += (char)((char_array_4[0] << 2) + ((char_array_4[1] & 0x30) >> 4));
  if (i == 3) {
    ret += (char)(((char_array_4[1] & 0xf) << 4) + ((char_array_4[2] & 0x3c) >> 2));
  }
  return ret;
}

} // namespace edsign
