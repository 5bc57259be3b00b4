#pragma once

#include "str.hh"

// Fixed settings of the signing tool. There is no configuration file - those
// values are baked into the binary.
namespace edsign::config {

// Used when the key file isn't given on the command line. "~" is expanded at
// startup.
extern const StrView kDefaultKeyPath;

// Download location embedded into the appcast enclosure. Doesn't depend on the
// signed file.
extern const StrView kDownloadUrl;

extern const StrView kEnclosureType;

// Command that creates the key file, shown to the user when the key is missing.
extern const StrView kKeyGenerationCommand;

} // namespace edsign::config
