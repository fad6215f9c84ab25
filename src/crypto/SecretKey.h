#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/KeyUtils.h"
#include "util/SecretValue.h"
#include "util/XDROperators.h"
#include "xdr/Txbuild-types.h"

namespace txbuild
{

class ByteSlice;

// Initializes libsodium. Call once before generating or using keys (the
// builder's signing path included); later calls are no-ops. Throws
// CryptoError if the library cannot be initialized.
void initSodium();

/**
 * An Ed25519 signing key. The expanded secret is wiped on destruction.
 */
class SecretKey
{
    using uint512 = xdr::opaque_array<64>;
    uint512 mSecretKey;
    PublicKey mPublicKey;

    SecretKey();

  public:
    ~SecretKey();

    PublicKey const& getPublicKey() const;

    // 'S...' text of the 32-byte seed.
    SecretValue getStrKeySeed() const;

    // 'G...' address.
    std::string getStrKeyPublic() const;

    // Detached Ed25519 signature of `bin`.
    Signature sign(ByteSlice const& bin) const;

    static SecretKey random();
    static SecretKey fromSeed(ByteSlice const& seed);
    static SecretKey fromStrKeySeed(std::string const& strKeySeed);

    bool
    operator==(SecretKey const& rh) const
    {
        return mSecretKey == rh.mSecretKey;
    }
};

namespace PubKeyUtils
{
// Return true iff `signature` is valid for `bin` under `key`.
bool verifySig(PublicKey const& key, Signature const& signature,
               ByteSlice const& bin);
}
}
