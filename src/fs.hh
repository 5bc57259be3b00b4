#pragma once

#include "int.hh"
#include "path.hh"
#include "status.hh"
#include "str.hh"

// Blocking access to the real filesystem.
namespace edsign::fs {

using Mode = U32;

// Mode for files modifiable by owner but readable by anyone
constexpr Mode RW_R__R__{0644};

// Mode for files accessible only by their owner (private keys)
constexpr Mode RW_______{0600};

// Read the given file and return its content.
//
// The file is read sequentially so virtual filesystems like procfs will work.
Str Read(const Path &, Status &);

// Write the given file with the given contents, replacing any previous content.
void Write(const Path &, StrView contents, Status &, Mode = RW_R__R__);

// True if the path exists & (after following symlinks) is a regular file.
bool IsRegularFile(const Path &);

// Size of the file, according to its metadata.
Size FileSize(const Path &, Status &);

} // namespace edsign::fs
