#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/BuiltTransaction.h"
#include "transactions/FeePolicy.h"
#include "transactions/Memo.h"
#include "transactions/Operation.h"
#include "transactions/Timebounds.h"

#include <optional>
#include <string>
#include <vector>

namespace txbuild
{

class Account;
class Config;
class SecretKey;

/**
 * Collects the parts of a transaction and assembles the wire body.
 *
 * build() runs the whole pipeline on a fresh body each time: it checks the
 * shape of the transaction and the timebounds choice, consumes one sequence
 * number from the source account, converts the operations in order, then
 * attaches timebounds, memo and fee. It returns only complete bodies; on
 * failure nothing but the account's sequence number may have changed, and
 * the builder can be fixed and reused.
 *
 * Callers must either set explicit timebounds or call withoutTimebounds().
 * Hashing and signing go through libsodium, so the process must call
 * initSodium() (crypto/SecretKey.h) before the first build.
 */
class TransactionBuilder
{
    Account& mSourceAccount;
    std::string mNetworkPassphrase;
    FeePolicy mFeePolicy;

    std::vector<TxOperation> mOperations;
    std::optional<uint32_t> mFee;
    std::optional<TxMemo> mMemo;
    std::optional<Timebounds> mTimebounds;
    bool mWithoutTimebounds{false};

  public:
    TransactionBuilder(Account& sourceAccount, std::string networkPassphrase,
                       FeePolicy feePolicy = FeePolicy());

    // Builder for the configured network and base fee. A non-zero
    // DEFAULT_TIMEOUT presets timebounds expiring that many seconds from
    // now.
    static TransactionBuilder fromConfig(Account& sourceAccount,
                                         Config const& config);

    TransactionBuilder& addOperation(TxOperation op);

    // Total fee for the transaction. 0 restores the fee policy default.
    TransactionBuilder& setFee(uint32_t fee);
    TransactionBuilder& setMemo(TxMemo memo);
    TransactionBuilder& setTimebounds(Timebounds timebounds);
    TransactionBuilder& withoutTimebounds();

    std::vector<TxOperation> const&
    getOperations() const
    {
        return mOperations;
    }

    std::string const&
    getNetworkPassphrase() const
    {
        return mNetworkPassphrase;
    }

    FeePolicy const&
    getFeePolicy() const
    {
        return mFeePolicy;
    }

    BuiltTransaction build() const;
};

// Builds, signs with `key` and returns the base64 envelope. Errors keep
// their category and are prefixed with the failing stage.
std::string buildSignEncode(TransactionBuilder const& builder,
                            SecretKey const& key);
}
