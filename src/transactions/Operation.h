#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/Asset.h"
#include "xdr/Txbuild-transaction.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace txbuild
{

// Operations as the caller describes them. Each one carries its own typed
// fields plus an optional source account overriding the transaction's, and
// turns itself into a wire Operation with toWireOperation(), checking its
// own rules first. Amounts are in stroops.
//
// toWireOperation() throws ValidationError when a business rule does not
// hold and EncodingError when an address or asset code is malformed.

struct CreateAccount
{
    static constexpr OperationType TYPE = CREATE_ACCOUNT;

    std::string destination;
    int64_t startingBalance{0};
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

struct Payment
{
    static constexpr OperationType TYPE = PAYMENT;

    std::string destination;
    std::optional<TxAsset> asset;
    int64_t amount{0};
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

struct PathPayment
{
    static constexpr OperationType TYPE = PATH_PAYMENT;
    static constexpr size_t MAX_PATH_LENGTH = 5;

    std::optional<TxAsset> sendAsset;
    int64_t sendMax{0};
    std::string destination;
    std::optional<TxAsset> destAsset;
    int64_t destAmount{0};
    std::vector<TxAsset> path;
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

// Creates (offerID 0), updates or deletes (amount 0) an offer.
struct ManageOffer
{
    static constexpr OperationType TYPE = MANAGE_OFFER;

    TxAsset selling;
    TxAsset buying;
    int64_t amount{0};
    Price price;
    int64_t offerID{0};
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

struct CreatePassiveOffer
{
    static constexpr OperationType TYPE = CREATE_PASSIVE_OFFER;

    TxAsset selling;
    TxAsset buying;
    int64_t amount{0};
    Price price;
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

// Signer added, updated, or removed (weight 0). `key` is a StrKey of an
// ed25519 public key, a pre-authorized transaction hash or a hash(x).
struct TxSigner
{
    std::string key;
    uint32_t weight{0};
};

struct SetOptions
{
    static constexpr OperationType TYPE = SET_OPTIONS;

    std::optional<std::string> inflationDest;
    std::optional<uint32_t> clearFlags;
    std::optional<uint32_t> setFlags;
    std::optional<uint32_t> masterWeight;
    std::optional<uint32_t> lowThreshold;
    std::optional<uint32_t> medThreshold;
    std::optional<uint32_t> highThreshold;
    std::optional<std::string> homeDomain;
    std::optional<TxSigner> signer;
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

// A limit of 0 removes the trustline.
struct ChangeTrust
{
    static constexpr OperationType TYPE = CHANGE_TRUST;

    TxAsset line;
    int64_t limit{0};
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

struct AllowTrust
{
    static constexpr OperationType TYPE = ALLOW_TRUST;

    std::string trustor;
    TxAsset asset;
    bool authorize{false};
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

struct AccountMerge
{
    static constexpr OperationType TYPE = ACCOUNT_MERGE;

    std::string destination;
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

struct Inflation
{
    static constexpr OperationType TYPE = INFLATION;

    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

// An absent value removes the entry.
struct ManageData
{
    static constexpr OperationType TYPE = MANAGE_DATA;

    std::string name;
    std::optional<std::vector<uint8_t>> value;
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

struct BumpSequence
{
    static constexpr OperationType TYPE = BUMP_SEQUENCE;

    SequenceNumber bumpTo{0};
    std::optional<std::string> sourceAccount;

    Operation toWireOperation() const;
};

using TxOperation =
    std::variant<CreateAccount, Payment, PathPayment, ManageOffer,
                 CreatePassiveOffer, SetOptions, ChangeTrust, AllowTrust,
                 AccountMerge, Inflation, ManageData, BumpSequence>;

Operation toWireOperation(TxOperation const& op);

OperationType getOperationType(TxOperation const& op);

// Wire name of the operation kind, for example "PAYMENT".
std::string getOperationName(TxOperation const& op);
std::string getOperationName(OperationType type);
}
