// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/SignedTransaction.h"
#include "crypto/SecretKey.h"
#include "transactions/NetworkUtils.h"
#include "transactions/SignatureUtils.h"
#include "transactions/TxBuildError.h"
#include "util/Decoder.h"
#include "util/Logging.h"
#include "util/XDROperators.h"

#include <fmt/format.h>
#include <xdrpp/marshal.h>

namespace txbuild
{

SignedTransaction::SignedTransaction(TransactionEnvelope envelope,
                                     std::string networkPassphrase)
    : mEnvelope(std::move(envelope))
    , mNetworkPassphrase(std::move(networkPassphrase))
{
    if (mEnvelope.signatures.size() > MAX_SIGNATURES)
    {
        throw ValidationError(
            fmt::format("envelope has {} signatures, at most {} allowed",
                        mEnvelope.signatures.size(), MAX_SIGNATURES));
    }
}

SignedTransaction
SignedTransaction::fromBinary(std::string networkPassphrase,
                              std::vector<uint8_t> const& bin)
{
    TransactionEnvelope envelope;
    try
    {
        xdr::xdr_from_opaque(bin, envelope);
    }
    catch (xdr::xdr_runtime_error const& e)
    {
        throw EncodingError(
            fmt::format("malformed transaction envelope: {}", e.what()));
    }
    return SignedTransaction(std::move(envelope),
                             std::move(networkPassphrase));
}

SignedTransaction
SignedTransaction::fromBase64(std::string networkPassphrase,
                              std::string const& base64)
{
    std::vector<uint8_t> bin;
    try
    {
        bin = decoder::decode_b64(base64);
    }
    catch (std::invalid_argument const& e)
    {
        throw EncodingError(
            fmt::format("malformed base64 envelope: {}", e.what()));
    }
    return fromBinary(std::move(networkPassphrase), bin);
}

Hash
SignedTransaction::hash() const
{
    return NetworkUtils::transactionHash(
        NetworkUtils::networkID(mNetworkPassphrase), mEnvelope.tx);
}

SignedTransaction
SignedTransaction::sign(SecretKey const& key) const
{
    return addSignature(SignatureUtils::sign(key, hash()));
}

SignedTransaction
SignedTransaction::addSignature(DecoratedSignature const& sig) const
{
    if (mEnvelope.signatures.size() >= MAX_SIGNATURES)
    {
        throw ValidationError(fmt::format(
            "transaction already carries the maximum of {} signatures",
            MAX_SIGNATURES));
    }
    TransactionEnvelope envelope = mEnvelope;
    envelope.signatures.emplace_back(sig);
    CLOG_DEBUG(Tx, "Signature #{} attached", envelope.signatures.size());
    return SignedTransaction(std::move(envelope), mNetworkPassphrase);
}

bool
SignedTransaction::hasValidSignatureFrom(PublicKey const& key) const
{
    auto h = hash();
    for (auto const& sig : mEnvelope.signatures)
    {
        if (SignatureUtils::verify(sig, key, h))
        {
            return true;
        }
    }
    return false;
}

std::vector<uint8_t>
SignedTransaction::toBinary() const
{
    try
    {
        return xdr::xdr_to_opaque(mEnvelope);
    }
    catch (xdr::xdr_runtime_error const& e)
    {
        throw EncodingError(
            fmt::format("couldn't marshal transaction envelope: {}",
                        e.what()));
    }
}

std::string
SignedTransaction::toBase64() const
{
    return decoder::encode_b64(toBinary());
}

bool
SignedTransaction::operator==(SignedTransaction const& other) const
{
    return mNetworkPassphrase == other.mNetworkPassphrase &&
           mEnvelope == other.mEnvelope;
}
}
