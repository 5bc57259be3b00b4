#pragma once

// Command-line front-end of the signer.
namespace edsign::cli {

// Runs the whole program & returns its exit code. All output goes through the
// loggers.
int Run(int argc, char *argv[]);

} // namespace edsign::cli
