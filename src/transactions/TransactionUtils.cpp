// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/TransactionUtils.h"
#include "crypto/SecretKey.h"
#include "transactions/TxBuildError.h"

#include <fmt/format.h>

namespace txbuild
{

AccountID
toAccountID(std::string const& address, std::string const& field)
{
    try
    {
        return KeyUtils::fromStrKey<PublicKey>(address);
    }
    catch (KeyUtils::InvalidStrKey const&)
    {
        throw EncodingError(
            fmt::format("invalid {} address '{}'", field, address));
    }
}

std::string
toAddress(AccountID const& accountID)
{
    return KeyUtils::toStrKey(accountID);
}

void
setOperationSource(Operation& op,
                   std::optional<std::string> const& sourceAccount)
{
    if (sourceAccount)
    {
        op.sourceAccount.activate() =
            toAccountID(*sourceAccount, "operation source");
    }
    else
    {
        op.sourceAccount.reset();
    }
}
}
