#include "ed25519.hh"

#include <cerrno>
#include <cstring>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include "format.hh"

namespace edsign::ed25519 {

namespace {

struct PKeyDeleter {
  void operator()(EVP_PKEY *p) { EVP_PKEY_free(p); }
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *p) { EVP_MD_CTX_free(p); }
};

using PKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// Appends the oldest queued libcrypto error (if any) to `msg` and clears the
// queue.
void AppendOpenSSLError(Str &msg) {
  unsigned long err = ERR_get_error();
  if (err) {
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    msg += ": ";
    msg += buf;
  }
  ERR_clear_error();
}

const unsigned char *Bytes(StrView view) {
  // libcrypto doesn't like null pointers, even for empty messages.
  static const unsigned char kEmpty[1] = {0};
  return view.empty() ? kEmpty : (const unsigned char *)view.data();
}

PKey PrivateKey(const Private &key, Status &status) {
  PKey pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                         (const unsigned char *)key.bytes,
                                         sizeof(key.bytes)));
  if (!pkey) {
    auto &msg = status();
    msg = "libcrypto rejected the Ed25519 private key";
    AppendOpenSSLError(msg);
  }
  return pkey;
}

} // namespace

void Wipe(Str &secret) { OPENSSL_cleanse(secret.data(), secret.size()); }

void Wipe(Private &key) { OPENSSL_cleanse(key.bytes, sizeof(key.bytes)); }

Private::~Private() { Wipe(*this); }

Private Private::FromSeed(StrView seed, Status &status) {
  Private key = {};
  if (seed.size() != kSeedSize) {
    errno = 0;
    status() += f("Ed25519 seed must be %zu bytes long, got %zu", kSeedSize,
                  seed.size());
    return key;
  }
  memcpy(key.bytes, seed.data(), kSeedSize);
  PrivateKey(key, status);
  return key;
}

Public Public::FromPrivate(const Private &private_key, Status &status) {
  Public public_key = {};
  PKey pkey = PrivateKey(private_key, status);
  if (!OK(status)) {
    return public_key;
  }
  size_t len = sizeof(public_key.bytes);
  if (EVP_PKEY_get_raw_public_key(pkey.get(), (unsigned char *)public_key.bytes,
                                  &len) != 1 or
      len != sizeof(public_key.bytes)) {
    auto &msg = status();
    msg = "Couldn't derive Ed25519 public key";
    AppendOpenSSLError(msg);
  }
  return public_key;
}

Signature::Signature(StrView message, const Private &private_key,
                     Status &status)
    : bytes{} {
  PKey pkey = PrivateKey(private_key, status);
  if (!OK(status)) {
    return;
  }
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx) {
    auto &msg = status();
    msg = "EVP_MD_CTX_new failed";
    AppendOpenSSLError(msg);
    return;
  }
  // Ed25519 hashes the message internally so no digest is given here.
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
    auto &msg = status();
    msg = "EVP_DigestSignInit failed";
    AppendOpenSSLError(msg);
    return;
  }
  size_t len = sizeof(bytes);
  if (EVP_DigestSign(ctx.get(), (unsigned char *)bytes, &len, Bytes(message),
                     message.size()) != 1) {
    auto &msg = status();
    msg = "EVP_DigestSign failed";
    AppendOpenSSLError(msg);
    return;
  }
  if (len != sizeof(bytes)) {
    status() += f("Ed25519 signature has %zu bytes instead of %zu", len,
                  sizeof(bytes));
  }
}

bool Signature::Verify(StrView message, const Public &public_key) const {
  PKey pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                        (const unsigned char *)public_key.bytes,
                                        sizeof(public_key.bytes)));
  MdCtx ctx(EVP_MD_CTX_new());
  bool ok = pkey and ctx and
            EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr,
                                 pkey.get()) == 1 and
            EVP_DigestVerify(ctx.get(), (const unsigned char *)bytes,
                             sizeof(bytes), Bytes(message),
                             message.size()) == 1;
  ERR_clear_error();
  return ok;
}

} // namespace edsign::ed25519
