#pragma once

#include "status.hh"
#include "str.hh"

// Public-key signature system according to http://ed25519.cr.yp.to/.
//
// The curve arithmetic is done by OpenSSL's libcrypto. Types in this namespace
// are plain byte containers so they can be copied around freely.
namespace edsign::ed25519 {

constexpr size_t kSeedSize = 32;
constexpr size_t kPublicKeySize = 32;
constexpr size_t kSignatureSize = 64;

struct Private {
  char bytes[kSeedSize];

  // Overwrites the seed.
  ~Private();

  // Builds a private key from a raw 32-byte seed. The seed is also checked
  // by libcrypto so that a key which it can't use is rejected here.
  static Private FromSeed(StrView seed, Status &);
};

struct Public {
  char bytes[kPublicKeySize];

  static Public FromPrivate(const Private &, Status &);
};

struct Signature {
  char bytes[kSignatureSize];

  Signature() = default;
  Signature(StrView message, const Private &, Status &);
  bool Verify(StrView message, const Public &) const;

  StrView View() const { return StrView(bytes, sizeof(bytes)); }
};

// Overwrites secret material with zeros in a way that the compiler can't
// optimize away.
void Wipe(Str &secret);
void Wipe(Private &);

} // namespace edsign::ed25519
