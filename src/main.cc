// CLI program for signing update disk images with Ed25519.

#include "cli.hh"

int main(int argc, char *argv[]) { return edsign::cli::Run(argc, argv); }
