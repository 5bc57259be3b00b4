#pragma once

#include <optional>

#include "appcast.hh"
#include "ed25519.hh"
#include "int.hh"
#include "path.hh"
#include "status.hh"

// Signing of update artifacts (disk images) for the Sparkle appcast.
//
// Every function reports failures through `Status`. The first failure decides
// the `Status::error` kind & nothing is attempted after it.
namespace edsign {

struct Invocation {
  Path artifact_path;
  Path key_path;

  // Parses `<artifact-path> [<key-file-path>]`. Returns nothing when the
  // artifact path is missing. Extra arguments are ignored.
  static std::optional<Invocation> FromArgs(int argc, char *argv[]);
};

struct SignedArtifact {
  ed25519::Signature signature;
  Str signature_base64;

  // Taken from the file metadata rather than from the signed content.
  Size size = 0;

  // Enclosure element that carries the signature & size of this artifact.
  appcast::Enclosure Enclosure() const;
};

// Checks that both the artifact & the key are regular files.
void CheckFiles(const Invocation &, Status &);

// Reads the base64-encoded 32-byte Ed25519 seed from the given key file.
ed25519::Private LoadKey(const Path &key_path, Status &);

// Loads the key, signs the artifact & collects the data for the appcast.
// Assumes that `CheckFiles` already passed.
SignedArtifact Sign(const Invocation &, Status &);

// CheckFiles followed by Sign.
SignedArtifact SignArtifact(const Invocation &, Status &);

} // namespace edsign
