#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"
#include "xdr/Txbuild-types.h"

#include <sodium/crypto_hash_sha256.h>
#include <xdrpp/marshal.h>

namespace txbuild
{

// Plain SHA256
uint256 sha256(ByteSlice const& bin);

// SHA256 in incremental mode, for large inputs.
class SHA256
{
    crypto_hash_sha256_state mState;
    bool mFinished{false};

  public:
    SHA256();
    void reset();
    void add(ByteSlice const& bin);
    uint256 finish();
};

// Equivalent to `sha256(xdr_to_opaque(args...))`: hashes the canonical XDR
// encoding of the concatenated arguments.
template <typename... Args>
uint256
xdrSha256(Args const&... args)
{
    return sha256(xdr::xdr_to_opaque(args...));
}
}
