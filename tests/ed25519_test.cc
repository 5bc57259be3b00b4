#include "ed25519.hh"

#include <vector>

#include <gtest/gtest.h>

#include "hex.hh"

namespace edsign::ed25519 {
namespace {

// RFC 8032, section 7.1.
struct TestVector {
  StrView name;
  Str seed;
  Str public_key;
  Str message;
  Str signature;
};

std::vector<TestVector> Rfc8032Vectors() {
  return {
      {"TEST 1",
       "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"_Hex,
       "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"_Hex,
       "",
       "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
       "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b"_Hex},
      {"TEST 2",
       "4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb"_Hex,
       "3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c"_Hex,
       "72"_Hex,
       "92a009a9f0d4cab8720e820b5f642540a2b27b5416503f8fb3762223ebdb69da"
       "085ac1e43e15996e458f3613d0f11d8c387b2eaeb4302aeeb00d291612bb0c00"_Hex},
  };
}

TEST(Ed25519Test, MatchesRfc8032) {
  for (auto &v : Rfc8032Vectors()) {
    SCOPED_TRACE(v.name);
    Status status;
    auto key = Private::FromSeed(v.seed, status);
    ASSERT_TRUE(OK(status)) << status.ToStr();
    auto pub = Public::FromPrivate(key, status);
    ASSERT_TRUE(OK(status)) << status.ToStr();
    EXPECT_EQ(BytesToHex(StrView(pub.bytes, sizeof(pub.bytes))),
              BytesToHex(v.public_key));
    Signature signature(v.message, key, status);
    ASSERT_TRUE(OK(status)) << status.ToStr();
    EXPECT_EQ(BytesToHex(signature.View()), BytesToHex(v.signature));
    EXPECT_TRUE(signature.Verify(v.message, pub));
  }
}

TEST(Ed25519Test, SigningIsDeterministic) {
  Status status;
  auto key = Private::FromSeed(
      "4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb"_Hex,
      status);
  Str message(100000, '\xa5');
  Signature first(message, key, status);
  Signature second(message, key, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(first.View(), second.View());
}

TEST(Ed25519Test, VerifyRejectsTamperedMessage) {
  Status status;
  auto key = Private::FromSeed(
      "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"_Hex,
      status);
  auto pub = Public::FromPrivate(key, status);
  Signature signature("disk image", key, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_TRUE(signature.Verify("disk image", pub));
  EXPECT_FALSE(signature.Verify("disk imagE", pub));

  Signature corrupted = signature;
  corrupted.bytes[10] ^= 1;
  EXPECT_FALSE(corrupted.Verify("disk image", pub));
}

TEST(Ed25519Test, SeedMustHave32Bytes) {
  for (size_t size : {0, 16, 31, 33, 64}) {
    Status status;
    Private::FromSeed(Str(size, 'k'), status);
    EXPECT_FALSE(OK(status)) << size;
  }
}

TEST(Ed25519Test, WipeZeroesSecrets) {
  Str seed(kSeedSize, '\x9d');
  Status status;
  Private key = Private::FromSeed(seed, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();

  Wipe(seed);
  EXPECT_EQ(seed, Str(kSeedSize, '\0'));
  Wipe(key);
  EXPECT_EQ(StrView(key.bytes, sizeof(key.bytes)), Str(kSeedSize, '\0'));
}

} // namespace
} // namespace edsign::ed25519
