#include "config.hh"

namespace edsign::config {

const StrView kDefaultKeyPath = "~/.tibok_sparkle_key.pem";

// Hardcoded to the current release. Update together with the version bump.
const StrView kDownloadUrl = "https://github.com/sturdy-barnacle/md-editor/"
                             "releases/download/v1.0.2/Tibok-1.0.2.dmg";

const StrView kEnclosureType = "application/octet-stream";

const StrView kKeyGenerationCommand =
    "arch -arm64 ./Frameworks/generate_keys --account ed25519 -x "
    "~/.tibok_sparkle_key.pem";

} // namespace edsign::config
