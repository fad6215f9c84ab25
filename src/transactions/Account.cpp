// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/Account.h"
#include "transactions/TxBuildError.h"

#include <fmt/format.h>
#include <limits>

namespace txbuild
{

namespace
{
SequenceNumber
parseSequence(std::string const& sequence)
{
    if (sequence.empty() ||
        sequence.find_first_not_of("0123456789") != std::string::npos)
    {
        throw SequenceError(
            fmt::format("invalid sequence number '{}'", sequence));
    }
    try
    {
        return std::stoll(sequence);
    }
    catch (std::out_of_range const&)
    {
        throw SequenceError(
            fmt::format("sequence number '{}' is out of range", sequence));
    }
}
}

SimpleAccount::SimpleAccount(std::string accountID, SequenceNumber sequence)
    : mAccountID(std::move(accountID)), mSequence(sequence)
{
    if (mSequence < 0)
    {
        throw SequenceError(
            fmt::format("sequence number {} cannot be negative", mSequence));
    }
}

SimpleAccount::SimpleAccount(std::string accountID,
                             std::string const& sequence)
    : SimpleAccount(std::move(accountID), parseSequence(sequence))
{
}

std::string
SimpleAccount::getAccountID() const
{
    return mAccountID;
}

SequenceNumber
SimpleAccount::incrementSequenceNumber()
{
    if (mSequence == std::numeric_limits<SequenceNumber>::max())
    {
        throw SequenceError(fmt::format(
            "sequence number of {} is exhausted", mAccountID));
    }
    return ++mSequence;
}
}
