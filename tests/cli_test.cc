#include "cli.hh"

#include <gtest/gtest.h>

#include "config.hh"
#include "test_util.hh"

namespace edsign {
namespace {

class CliTest : public TempDirTest {
protected:
  int Run(std::vector<Str> args) {
    std::vector<char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return cli::Run((int)args.size(), argv.data());
  }

  bool Logged(StrView needle) const {
    return log.text.find(needle) != Str::npos;
  }

  CapturedLog log;
};

TEST_F(CliTest, PrintsSignatureAndEnclosure) {
  Path artifact = WriteFile("Tibok-1.0.2.dmg", "hello world");
  Path key = WriteFile("key.pem", Str(kTest1SeedBase64) + "\n", fs::RW_______);

  EXPECT_EQ(Run({"edsign", artifact.str, key.str}), 0);

  Str url(config::kDownloadUrl);
  Str sig(kHelloWorldSignatureBase64);
  Str expected = "==========================================\n"
                 "Signing DMG with EdDSA Key (Ed25519)\n"
                 "==========================================\n"
                 "DMG: " + artifact.str + "\n"
                 "Key file: " + key.str + "\n"
                 "\n"
                 "Signing DMG...\n"
                 "\n"
                 "==========================================\n"
                 "✓ Signature Generated Successfully\n"
                 "==========================================\n"
                 "\n"
                 "EdDSA Signature (for appcast.xml):\n"
                 "\n" +
                 sig + "\n"
                 "\n"
                 "File Information:\n"
                 "  Size: 11 bytes\n"
                 "  URL: " + url + "\n"
                 "\n"
                 "==========================================\n"
                 "Update appcast.xml with this signature:\n"
                 "==========================================\n"
                 "\n"
                 "Replace the enclosure element with:\n"
                 "\n"
                 "    <enclosure\n"
                 "        url=\"" + url + "\"\n"
                 "        sparkle:edSignature=\"" + sig + "\"\n"
                 "        length=\"11\"\n"
                 "        type=\"application/octet-stream\"\n"
                 "    />\n"
                 "\n";
  EXPECT_EQ(log.text, expected);
}

TEST_F(CliTest, UsageWithoutArguments) {
  EXPECT_EQ(Run({"edsign"}), 1);
  EXPECT_TRUE(Logged("Usage: edsign <path-to-dmg> [path-to-key-file]"));
  EXPECT_TRUE(Logged("~/.tibok_sparkle_key.pem"));
}

TEST_F(CliTest, MissingArtifact) {
  Path key = WriteFile("key.pem", kTest1SeedBase64);
  EXPECT_EQ(Run({"edsign", "/tmp/does-not-exist.dmg", key.str}), 1);
  EXPECT_TRUE(log.text.starts_with("Error: DMG file not found: /tmp/does-not-exist.dmg"))
      << log.text;
  EXPECT_FALSE(Logged("Signing DMG..."));
  EXPECT_FALSE(Logged("EdDSA Signature"));
  EXPECT_FALSE(Logged("<enclosure"));
}

TEST_F(CliTest, MissingKeyShowsGuidance) {
  Path artifact = WriteFile("a.dmg", "hello world");
  Path key = dir / "missing.pem";
  EXPECT_EQ(Run({"edsign", artifact.str, key.str}), 1);
  EXPECT_TRUE(log.text.starts_with("Error: Private key file not found: " + key.str))
      << log.text;
  EXPECT_TRUE(Logged("To generate the key file, run:\n  arch -arm64 ./Frameworks/generate_keys"));
  EXPECT_FALSE(Logged("EdDSA Signature"));
}

TEST_F(CliTest, BadKeyStopsBeforeSignatureBlock) {
  Path artifact = WriteFile("a.dmg", "hello world");
  Path key = WriteFile("key.pem", "not-base64-!!");
  EXPECT_EQ(Run({"edsign", artifact.str, key.str}), 1);
  EXPECT_TRUE(Logged("Signing DMG...\nError: Failed to decode private key: "
                     "Invalid base64 character '-' at offset 3\n"))
      << log.text;
  EXPECT_FALSE(Logged(".cc:")) << log.text;
  EXPECT_FALSE(Logged("EdDSA Signature"));
  EXPECT_FALSE(Logged("<enclosure"));
}

TEST_F(CliTest, ShortKeyReportsLength) {
  Path artifact = WriteFile("a.dmg", "hello world");
  Path key = WriteFile("key.pem", "AAAAAAAAAAAAAAAAAAAAAA==");
  EXPECT_EQ(Run({"edsign", artifact.str, key.str}), 1);
  EXPECT_TRUE(Logged("Error: Invalid key seed length: 16 (expected 32 bytes)")) << log.text;
  EXPECT_FALSE(Logged("EdDSA Signature"));
}

} // namespace
} // namespace edsign
