// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/Operation.h"
#include "crypto/KeyUtils.h"
#include "transactions/TransactionUtils.h"
#include "transactions/TxBuildError.h"
#include "util/types.h"

#include <fmt/format.h>
#include <type_traits>
#include <xdrpp/types.h>

namespace txbuild
{

namespace
{
size_t constexpr MAX_HOME_DOMAIN_SIZE = 32;
size_t constexpr MAX_DATA_NAME_SIZE = 64;
size_t constexpr MAX_DATA_VALUE_SIZE = 64;
uint32_t constexpr MAX_WEIGHT = UINT8_MAX;

Operation
makeOperation(OperationType type, std::optional<std::string> const& source)
{
    Operation op;
    op.body.type(type);
    setOperationSource(op, source);
    return op;
}

void
checkPositive(int64_t amount, char const* field)
{
    if (amount <= 0)
    {
        throw ValidationError(
            fmt::format("{} must be positive, got {}", field, amount));
    }
}

void
checkNonNegative(int64_t amount, char const* field)
{
    if (amount < 0)
    {
        throw ValidationError(
            fmt::format("{} cannot be negative, got {}", field, amount));
    }
}

void
checkPrice(Price const& price)
{
    if (price.n <= 0 || price.d <= 0)
    {
        throw ValidationError(fmt::format(
            "price must have a positive numerator and denominator, got {}/{}",
            price.n, price.d));
    }
}

void
checkOfferAssets(TxAsset const& selling, TxAsset const& buying)
{
    if (selling == buying)
    {
        throw ValidationError(fmt::format(
            "selling and buying the same asset ({})", selling.toString()));
    }
}

Asset
requireAsset(std::optional<TxAsset> const& asset, char const* field)
{
    if (!asset)
    {
        throw ValidationError(fmt::format("{} required", field));
    }
    return asset->toXDR();
}

void
checkWeight(std::optional<uint32_t> const& weight, char const* field)
{
    if (weight && *weight > MAX_WEIGHT)
    {
        throw ValidationError(fmt::format("{} {} is out of range 0..{}",
                                          field, *weight, MAX_WEIGHT));
    }
}

void
checkFlags(std::optional<uint32_t> const& flags, char const* field)
{
    if (flags && (*flags & ~MASK_ACCOUNT_FLAGS) != 0)
    {
        throw ValidationError(
            fmt::format("{} {:#x} has unknown flags", field, *flags));
    }
}

SignerKey
toSignerKey(std::string const& key)
{
    try
    {
        return KeyUtils::fromStrKey<SignerKey>(key);
    }
    catch (KeyUtils::InvalidStrKey const&)
    {
        throw EncodingError(fmt::format("invalid signer key '{}'", key));
    }
}
}

Operation
CreateAccount::toWireOperation() const
{
    checkPositive(startingBalance, "starting balance");

    auto op = makeOperation(TYPE, sourceAccount);
    auto& body = op.body.createAccountOp();
    body.destination = toAccountID(destination, "destination");
    body.startingBalance = startingBalance;
    return op;
}

Operation
Payment::toWireOperation() const
{
    auto op = makeOperation(TYPE, sourceAccount);
    auto& body = op.body.paymentOp();
    body.asset = requireAsset(asset, "asset");
    checkPositive(amount, "amount");
    body.destination = toAccountID(destination, "destination");
    body.amount = amount;
    return op;
}

Operation
PathPayment::toWireOperation() const
{
    auto op = makeOperation(TYPE, sourceAccount);
    auto& body = op.body.pathPaymentOp();
    body.sendAsset = requireAsset(sendAsset, "send asset");
    body.destAsset = requireAsset(destAsset, "destination asset");
    checkPositive(sendMax, "send max");
    checkPositive(destAmount, "destination amount");
    if (path.size() > MAX_PATH_LENGTH)
    {
        throw ValidationError(fmt::format("path has {} hops, at most {}",
                                          path.size(), MAX_PATH_LENGTH));
    }
    body.destination = toAccountID(destination, "destination");
    body.sendMax = sendMax;
    body.destAmount = destAmount;
    for (auto const& hop : path)
    {
        body.path.emplace_back(hop.toXDR());
    }
    return op;
}

Operation
ManageOffer::toWireOperation() const
{
    checkOfferAssets(selling, buying);
    checkNonNegative(amount, "amount");
    checkPrice(price);
    checkNonNegative(offerID, "offer id");

    auto op = makeOperation(TYPE, sourceAccount);
    auto& body = op.body.manageOfferOp();
    body.selling = selling.toXDR();
    body.buying = buying.toXDR();
    body.amount = amount;
    body.price = price;
    body.offerID = offerID;
    return op;
}

Operation
CreatePassiveOffer::toWireOperation() const
{
    checkOfferAssets(selling, buying);
    checkPositive(amount, "amount");
    checkPrice(price);

    auto op = makeOperation(TYPE, sourceAccount);
    auto& body = op.body.createPassiveOfferOp();
    body.selling = selling.toXDR();
    body.buying = buying.toXDR();
    body.amount = amount;
    body.price = price;
    return op;
}

Operation
SetOptions::toWireOperation() const
{
    checkFlags(setFlags, "set flags");
    checkFlags(clearFlags, "clear flags");
    if (setFlags && clearFlags && (*setFlags & *clearFlags) != 0)
    {
        throw ValidationError("the same flag is both set and cleared");
    }
    checkWeight(masterWeight, "master weight");
    checkWeight(lowThreshold, "low threshold");
    checkWeight(medThreshold, "medium threshold");
    checkWeight(highThreshold, "high threshold");
    if (homeDomain && (homeDomain->size() > MAX_HOME_DOMAIN_SIZE ||
                       !isStringValid(*homeDomain)))
    {
        throw ValidationError(fmt::format(
            "home domain must be at most {} printable characters",
            MAX_HOME_DOMAIN_SIZE));
    }
    if (signer)
    {
        checkWeight(signer->weight, "signer weight");
    }

    auto op = makeOperation(TYPE, sourceAccount);
    auto& body = op.body.setOptionsOp();
    if (inflationDest)
    {
        body.inflationDest.activate() =
            toAccountID(*inflationDest, "inflation destination");
    }
    if (clearFlags)
    {
        body.clearFlags.activate() = *clearFlags;
    }
    if (setFlags)
    {
        body.setFlags.activate() = *setFlags;
    }
    if (masterWeight)
    {
        body.masterWeight.activate() = *masterWeight;
    }
    if (lowThreshold)
    {
        body.lowThreshold.activate() = *lowThreshold;
    }
    if (medThreshold)
    {
        body.medThreshold.activate() = *medThreshold;
    }
    if (highThreshold)
    {
        body.highThreshold.activate() = *highThreshold;
    }
    if (homeDomain)
    {
        body.homeDomain.activate() = *homeDomain;
    }
    if (signer)
    {
        auto& s = body.signer.activate();
        s.key = toSignerKey(signer->key);
        s.weight = signer->weight;
    }
    return op;
}

Operation
ChangeTrust::toWireOperation() const
{
    if (line.isNative())
    {
        throw ValidationError("trustline can't be changed for the native asset");
    }
    checkNonNegative(limit, "limit");

    auto op = makeOperation(TYPE, sourceAccount);
    auto& body = op.body.changeTrustOp();
    body.line = line.toXDR();
    body.limit = limit;
    return op;
}

Operation
AllowTrust::toWireOperation() const
{
    auto op = makeOperation(TYPE, sourceAccount);
    auto& body = op.body.allowTrustOp();
    body.trustor = toAccountID(trustor, "trustor");
    body.asset = asset.toAllowTrustAsset();
    body.authorize = authorize;
    return op;
}

Operation
AccountMerge::toWireOperation() const
{
    auto op = makeOperation(TYPE, sourceAccount);
    op.body.destination() = toAccountID(destination, "destination");
    return op;
}

Operation
Inflation::toWireOperation() const
{
    return makeOperation(TYPE, sourceAccount);
}

Operation
ManageData::toWireOperation() const
{
    if (name.empty() || name.size() > MAX_DATA_NAME_SIZE ||
        !isStringValid(name))
    {
        throw ValidationError(
            fmt::format("data name must be 1 to {} printable characters",
                        MAX_DATA_NAME_SIZE));
    }
    if (value && value->size() > MAX_DATA_VALUE_SIZE)
    {
        throw ValidationError(
            fmt::format("data value is {} bytes, at most {} allowed",
                        value->size(), MAX_DATA_VALUE_SIZE));
    }

    auto op = makeOperation(TYPE, sourceAccount);
    auto& body = op.body.manageDataOp();
    body.dataName = name;
    if (value)
    {
        body.dataValue.activate().assign(value->begin(), value->end());
    }
    return op;
}

Operation
BumpSequence::toWireOperation() const
{
    checkNonNegative(bumpTo, "bump to");

    auto op = makeOperation(TYPE, sourceAccount);
    op.body.bumpSequenceOp().bumpTo = bumpTo;
    return op;
}

Operation
toWireOperation(TxOperation const& op)
{
    return std::visit([](auto const& o) { return o.toWireOperation(); }, op);
}

OperationType
getOperationType(TxOperation const& op)
{
    return std::visit(
        [](auto const& o) { return std::decay_t<decltype(o)>::TYPE; }, op);
}

std::string
getOperationName(OperationType type)
{
    auto name = xdr::xdr_traits<OperationType>::enum_name(type);
    return name ? name : fmt::format("UNKNOWN({})", static_cast<int>(type));
}

std::string
getOperationName(TxOperation const& op)
{
    return getOperationName(getOperationType(op));
}
}
