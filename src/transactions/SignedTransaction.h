#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Txbuild-transaction.h"

#include <string>
#include <vector>

namespace txbuild
{

class SecretKey;

/**
 * A transaction body together with the signatures collected so far, ready
 * to be exported. Values are immutable: sign() and addSignature() return a
 * new SignedTransaction and leave this one untouched. Signatures stay in
 * the order they were added.
 */
class SignedTransaction
{
    TransactionEnvelope mEnvelope;
    std::string mNetworkPassphrase;

  public:
    static constexpr size_t MAX_SIGNATURES = 20;

    SignedTransaction(TransactionEnvelope envelope,
                      std::string networkPassphrase);

    // Decode an exported envelope. Throws EncodingError on malformed input.
    static SignedTransaction fromBinary(std::string networkPassphrase,
                                        std::vector<uint8_t> const& bin);
    static SignedTransaction fromBase64(std::string networkPassphrase,
                                        std::string const& base64);

    TransactionEnvelope const&
    getEnvelope() const
    {
        return mEnvelope;
    }

    Transaction const&
    getTransaction() const
    {
        return mEnvelope.tx;
    }

    std::string const&
    getNetworkPassphrase() const
    {
        return mNetworkPassphrase;
    }

    size_t
    getSignatureCount() const
    {
        return mEnvelope.signatures.size();
    }

    Hash hash() const;

    SignedTransaction sign(SecretKey const& key) const;

    // Attach a signature computed elsewhere over hash(). Throws
    // ValidationError past MAX_SIGNATURES.
    SignedTransaction addSignature(DecoratedSignature const& sig) const;

    // True if one of the signatures is a valid signature of `key`.
    bool hasValidSignatureFrom(PublicKey const& key) const;

    // Canonical XDR of the envelope; throws EncodingError.
    std::vector<uint8_t> toBinary() const;
    std::string toBase64() const;

    bool operator==(SignedTransaction const& other) const;
};
}
