#include "signer.hh"

#include <cerrno>

#include "base64.hh"
#include "config.hh"
#include "format.hh"
#include "fs.hh"

namespace edsign {

std::optional<Invocation> Invocation::FromArgs(int argc, char *argv[]) {
  if (argc < 2) {
    return std::nullopt;
  }
  Invocation invocation;
  invocation.artifact_path = Path(argv[1]);
  if (argc > 2) {
    invocation.key_path = Path(argv[2]);
  } else {
    invocation.key_path = Path(config::kDefaultKeyPath).ExpandUser();
  }
  return invocation;
}

appcast::Enclosure SignedArtifact::Enclosure() const {
  return appcast::Enclosure{.url = config::kDownloadUrl,
                            .ed_signature = signature_base64,
                            .length = size,
                            .type = config::kEnclosureType};
}

void CheckFiles(const Invocation &invocation, Status &status) {
  if (!fs::IsRegularFile(invocation.artifact_path)) {
    status(Error::MissingArtifact) +=
        "DMG file not found: " + invocation.artifact_path.str;
    return;
  }
  if (!fs::IsRegularFile(invocation.key_path)) {
    status(Error::MissingKey) +=
        "Private key file not found: " + invocation.key_path.str;
    AppendErrorAdvice(status, "To generate the key file, run:\n" +
                                  IndentString(config::kKeyGenerationCommand));
    return;
  }
}

namespace {

// Wipes the referenced string when going out of scope.
struct WipeOnExit {
  Str &secret;
  ~WipeOnExit() { ed25519::Wipe(secret); }
};

} // namespace

ed25519::Private LoadKey(const Path &key_path, Status &status) {
  Str key_text = fs::Read(key_path, status);
  WipeOnExit wipe_key_text{key_text};
  if (!OK(status)) {
    status(Error::MissingKey) += "Failed to read private key file";
    return {};
  }
  StripWhitespace(key_text);
  Str seed = Base64Decode(key_text, status);
  WipeOnExit wipe_seed{seed};
  if (!OK(status)) {
    status(Error::KeyDecode) += "Failed to decode private key";
    return {};
  }
  if (seed.size() != ed25519::kSeedSize) {
    errno = 0;
    status(Error::InvalidKeyLength) +=
        f("Invalid key seed length: %zu (expected %zu bytes)", seed.size(),
          ed25519::kSeedSize);
    return {};
  }
  auto key = ed25519::Private::FromSeed(seed, status);
  if (!OK(status)) {
    status(Error::KeyConstruction) += "Failed to create private key";
    return {};
  }
  return key;
}

SignedArtifact Sign(const Invocation &invocation, Status &status) {
  SignedArtifact result{};
  auto key = LoadKey(invocation.key_path, status);
  if (!OK(status)) {
    return result;
  }
  Str content = fs::Read(invocation.artifact_path, status);
  if (!OK(status)) {
    status(Error::ArtifactRead) += "Failed to read DMG";
    return result;
  }
  result.signature = ed25519::Signature(content, key, status);
  if (!OK(status)) {
    status(Error::Signing) += "Failed to sign DMG";
    return result;
  }
  result.signature_base64 = Base64Encode(result.signature.View());
  result.size = fs::FileSize(invocation.artifact_path, status);
  if (!OK(status)) {
    status(Error::ArtifactRead) += "Failed to get DMG size";
    return result;
  }
  return result;
}

SignedArtifact SignArtifact(const Invocation &invocation, Status &status) {
  CheckFiles(invocation, status);
  if (!OK(status)) {
    return {};
  }
  return Sign(invocation, status);
}

} // namespace edsign
