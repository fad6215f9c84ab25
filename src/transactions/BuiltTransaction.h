#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/SignedTransaction.h"
#include "xdr/Txbuild-transaction.h"

#include <string>

namespace txbuild
{

class SecretKey;

// A fully built, unsigned transaction body bound to the network it will be
// signed for. Produced by TransactionBuilder::build() and never modified.
class BuiltTransaction
{
    Transaction mTransaction;
    std::string mNetworkPassphrase;

  public:
    BuiltTransaction(Transaction tx, std::string networkPassphrase);

    Transaction const&
    getTransaction() const
    {
        return mTransaction;
    }

    std::string const&
    getNetworkPassphrase() const
    {
        return mNetworkPassphrase;
    }

    // SHA-256 of the network id, ENVELOPE_TYPE_TX and the body.
    Hash hash() const;

    SignedTransaction sign(SecretKey const& key) const;

    // Envelope without any signature, for handing the body to signers.
    SignedTransaction toEnvelope() const;
    std::string toBase64() const;
};
}
