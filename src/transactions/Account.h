#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Txbuild-ledger-entries.h"

#include <string>

namespace txbuild
{

// The account a transaction is built for, as seen by the builder: an
// address, and the source of sequence numbers.
class Account
{
  public:
    virtual ~Account() = default;

    // StrKey address ("G...") of the account.
    virtual std::string getAccountID() const = 0;

    // Returns the sequence number the next transaction must carry and
    // records it as consumed. Throws SequenceError if none is available.
    virtual SequenceNumber incrementSequenceNumber() = 0;
};

// In-memory account whose sequence number was obtained elsewhere (for
// example from an account-state service).
class SimpleAccount : public Account
{
    std::string mAccountID;
    SequenceNumber mSequence;

  public:
    SimpleAccount(std::string accountID, SequenceNumber sequence);

    // `sequence` is a decimal string, as account-state services report it.
    SimpleAccount(std::string accountID, std::string const& sequence);

    std::string getAccountID() const override;
    SequenceNumber incrementSequenceNumber() override;

    // Last consumed (or initially reported) sequence number.
    SequenceNumber
    getSequenceNumber() const
    {
        return mSequence;
    }
};
}
