// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/Hex.h"
#include "crypto/CryptoError.h"

#include <sodium.h>

namespace txbuild
{

std::string
binToHex(ByteSlice const& bin)
{
    // sodium_bin2hex writes a trailing NUL
    std::string hex(bin.size() * 2 + 1, '\0');
    if (sodium_bin2hex(&hex[0], hex.size(), bin.data(), bin.size()) == nullptr)
    {
        throw CryptoError("error from sodium_bin2hex");
    }
    hex.pop_back();
    return hex;
}

std::string
hexAbbrev(ByteSlice const& bin)
{
    return binToHex(bin.prefix(3));
}
}
