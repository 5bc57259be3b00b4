#pragma once

#include <cstddef>
#include <sys/types.h>

namespace edsign {

using U8 = unsigned char;
using U32 = unsigned int;
using U64 = unsigned long;

using Size = size_t;
using SSize = ssize_t;

} // namespace edsign
