// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/BuiltTransaction.h"
#include "crypto/Hex.h"
#include "crypto/SecretKey.h"
#include "transactions/NetworkUtils.h"
#include "transactions/SignatureUtils.h"
#include "util/Logging.h"

namespace txbuild
{

BuiltTransaction::BuiltTransaction(Transaction tx,
                                   std::string networkPassphrase)
    : mTransaction(std::move(tx))
    , mNetworkPassphrase(std::move(networkPassphrase))
{
}

Hash
BuiltTransaction::hash() const
{
    return NetworkUtils::transactionHash(
        NetworkUtils::networkID(mNetworkPassphrase), mTransaction);
}

SignedTransaction
BuiltTransaction::sign(SecretKey const& key) const
{
    auto h = hash();
    CLOG_DEBUG(Tx, "Signing transaction {} with {}", hexAbbrev(h),
               KeyUtils::toShortString(key.getPublicKey()));
    return toEnvelope().addSignature(SignatureUtils::sign(key, h));
}

SignedTransaction
BuiltTransaction::toEnvelope() const
{
    TransactionEnvelope envelope;
    envelope.tx = mTransaction;
    return SignedTransaction(std::move(envelope), mNetworkPassphrase);
}

std::string
BuiltTransaction::toBase64() const
{
    return toEnvelope().toBase64();
}
}
