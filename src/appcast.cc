#include "appcast.hh"

namespace edsign::appcast {

Str EscapeAttribute(StrView value) {
  Str ret;
  ret.reserve(value.size());
  for (char c : value) {
    switch (c) {
    case '&':
      ret += "&amp;";
      break;
    case '<':
      ret += "&lt;";
      break;
    case '>':
      ret += "&gt;";
      break;
    case '"':
      ret += "&quot;";
      break;
    default:
      ret += c;
    }
  }
  return ret;
}

Str Enclosure::ToStr() const {
  Str ret = "<enclosure\n";
  ret += "    url=\"" + EscapeAttribute(url) + "\"\n";
  ret += "    sparkle:edSignature=\"" + EscapeAttribute(ed_signature) + "\"\n";
  ret += "    length=\"" + std::to_string(length) + "\"\n";
  ret += "    type=\"" + EscapeAttribute(type) + "\"\n";
  ret += "/>";
  return ret;
}

} // namespace edsign::appcast
