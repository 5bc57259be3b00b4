#include "cli.hh"

#include "config.hh"
#include "format.hh"
#include "log.hh"
#include "signer.hh"

namespace edsign::cli {

static const StrView kRule = "==========================================";

static void PrintUsage(const char *argv0) {
  LOG << "Usage: " << argv0 << " <path-to-dmg> [path-to-key-file]";
  LOG << "";
  LOG << "Signs a DMG file with EdDSA private key for Sparkle updates.";
  LOG << "Outputs the signature suitable for appcast.xml";
  LOG << "";
  LOG << "Arguments:";
  LOG << "  <path-to-dmg>       Path to the DMG file to sign";
  LOG << "  [path-to-key-file]  Path to EdDSA private key (default: "
      << config::kDefaultKeyPath << ")";
}

static void PrintHeader(StrView title) {
  LOG << kRule;
  LOG << title;
  LOG << kRule;
}

static void PrintFailure(const Status &status) {
  ERROR << status.Message();
  if (!status.advice.empty()) {
    LOG << "";
    LOG << status.advice;
    LOG << "";
  }
}

static void PrintResult(const SignedArtifact &signed_artifact) {
  LOG << "";
  PrintHeader("✓ Signature Generated Successfully");
  LOG << "";
  LOG << "EdDSA Signature (for appcast.xml):";
  LOG << "";
  LOG << signed_artifact.signature_base64;
  LOG << "";
  LOG << "File Information:";
  LOG_Indent();
  LOG << "Size: " << signed_artifact.size << " bytes";
  LOG << "URL: " << config::kDownloadUrl;
  LOG_Unindent();
  LOG << "";
  PrintHeader("Update appcast.xml with this signature:");
  LOG << "";
  LOG << "Replace the enclosure element with:";
  LOG << "";
  LOG << IndentString(signed_artifact.Enclosure().ToStr(), 4);
  LOG << "";
}

int Run(int argc, char *argv[]) {
  auto invocation = Invocation::FromArgs(argc, argv);
  if (!invocation) {
    PrintUsage(argc > 0 ? argv[0] : "edsign");
    return 1;
  }

  Status status;
  CheckFiles(*invocation, status);
  if (!OK(status)) {
    PrintFailure(status);
    return 1;
  }

  PrintHeader("Signing DMG with EdDSA Key (Ed25519)");
  LOG << "DMG: " << invocation->artifact_path;
  LOG << "Key file: " << invocation->key_path;
  LOG << "";
  LOG << "Signing DMG...";

  auto signed_artifact = Sign(*invocation, status);
  if (!OK(status)) {
    PrintFailure(status);
    return 1;
  }
  PrintResult(signed_artifact);
  return 0;
}

} // namespace edsign::cli
