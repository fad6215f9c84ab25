#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"

#include <string>

namespace txbuild
{

// Lowercase hex of `bin`.
std::string binToHex(ByteSlice const& bin);

// Hex of the first 3 bytes, enough to tell hashes apart in a log line.
std::string hexAbbrev(ByteSlice const& bin);
}
