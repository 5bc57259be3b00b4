#pragma once

#include "int.hh"
#include "str.hh"

// Pieces of the Sparkle appcast (update manifest) produced by the tool.
namespace edsign::appcast {

// Escapes a value so that it can be placed within a double-quoted XML
// attribute.
Str EscapeAttribute(StrView);

// <enclosure> element describing a downloadable update.
struct Enclosure {
  StrView url;
  StrView ed_signature; // base64
  Size length;
  StrView type;

  // Multi-line XML element, without indentation or trailing newline.
  Str ToStr() const;
};

} // namespace edsign::appcast
