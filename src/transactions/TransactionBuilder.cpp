// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/TransactionBuilder.h"
#include "crypto/Hex.h"
#include "crypto/SecretKey.h"
#include "main/Config.h"
#include "transactions/Account.h"
#include "transactions/TransactionUtils.h"
#include "transactions/TxBuildError.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <fmt/format.h>

namespace txbuild
{

TransactionBuilder::TransactionBuilder(Account& sourceAccount,
                                       std::string networkPassphrase,
                                       FeePolicy feePolicy)
    : mSourceAccount(sourceAccount)
    , mNetworkPassphrase(std::move(networkPassphrase))
    , mFeePolicy(feePolicy)
{
    if (mNetworkPassphrase.empty())
    {
        throw ConfigError("network passphrase cannot be empty");
    }
}

TransactionBuilder
TransactionBuilder::fromConfig(Account& sourceAccount, Config const& config)
{
    TransactionBuilder builder(sourceAccount, config.NETWORK_PASSPHRASE,
                               FeePolicy(config.BASE_FEE));
    if (config.DEFAULT_TIMEOUT > 0)
    {
        builder.setTimebounds(Timebounds::timeout(0, config.DEFAULT_TIMEOUT));
    }
    return builder;
}

TransactionBuilder&
TransactionBuilder::addOperation(TxOperation op)
{
    mOperations.emplace_back(std::move(op));
    return *this;
}

TransactionBuilder&
TransactionBuilder::setFee(uint32_t fee)
{
    mFee = fee;
    return *this;
}

TransactionBuilder&
TransactionBuilder::setMemo(TxMemo memo)
{
    mMemo = std::move(memo);
    return *this;
}

TransactionBuilder&
TransactionBuilder::setTimebounds(Timebounds timebounds)
{
    mTimebounds = timebounds;
    mWithoutTimebounds = false;
    return *this;
}

TransactionBuilder&
TransactionBuilder::withoutTimebounds()
{
    mTimebounds.reset();
    mWithoutTimebounds = true;
    return *this;
}

BuiltTransaction
TransactionBuilder::build() const
{
    try
    {
        if (mOperations.empty())
        {
            throw ValidationError("transaction has no operations");
        }
        if (mOperations.size() > MAX_OPERATIONS)
        {
            throw ValidationError(
                fmt::format("transaction has {} operations, at most {}",
                            mOperations.size(), MAX_OPERATIONS));
        }
        if (mTimebounds)
        {
            mTimebounds->validate();
        }
        else if (!mWithoutTimebounds)
        {
            throw ConfigError("timebounds must be set with setTimebounds() "
                              "or declined with withoutTimebounds()");
        }

        Transaction tx;
        tx.sourceAccount =
            toAccountID(mSourceAccount.getAccountID(), "source account");
        tx.seqNum = mSourceAccount.incrementSequenceNumber();

        for (size_t i = 0; i < mOperations.size(); ++i)
        {
            auto const& op = mOperations[i];
            try
            {
                tx.operations.emplace_back(toWireOperation(op));
                CLOG_TRACE(Tx, "Operation #{} ({}) converted", i,
                           getOperationName(op));
            }
            catch (std::exception const&)
            {
                rethrowWithContext(
                    fmt::format("failed to build operation #{} ({})", i,
                                getOperationName(op)));
            }
        }

        releaseAssert(tx.operations.size() == mOperations.size());

        if (mTimebounds)
        {
            tx.timeBounds.activate() = mTimebounds->toXDR();
        }

        tx.memo = mMemo ? mMemo->toXDR() : TxMemo::none().toXDR();

        tx.fee = mFeePolicy.computeFee(tx.operations.size(), mFee);

        BuiltTransaction built(std::move(tx), mNetworkPassphrase);
        CLOG_DEBUG(Tx, "Built transaction {} for {} seq={} ops={} fee={}",
                   hexAbbrev(built.hash()),
                   KeyUtils::toShortString(built.getTransaction().sourceAccount),
                   built.getTransaction().seqNum,
                   built.getTransaction().operations.size(),
                   built.getTransaction().fee);
        return built;
    }
    catch (std::exception const& e)
    {
        CLOG_DEBUG(Tx, "Build failed: {}", e.what());
        throw;
    }
}

std::string
buildSignEncode(TransactionBuilder const& builder, SecretKey const& key)
{
    std::optional<BuiltTransaction> built;
    try
    {
        built.emplace(builder.build());
    }
    catch (std::exception const&)
    {
        rethrowWithContext("couldn't build transaction");
    }

    std::optional<SignedTransaction> signedTx;
    try
    {
        signedTx.emplace(built->sign(key));
    }
    catch (std::exception const&)
    {
        rethrowWithContext("couldn't sign transaction");
    }

    try
    {
        return signedTx->toBase64();
    }
    catch (std::exception const&)
    {
        rethrowWithContext("couldn't encode transaction");
    }
}
}
