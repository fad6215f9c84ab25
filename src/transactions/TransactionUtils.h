#pragma once

// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Txbuild-transaction.h"

#include <optional>
#include <string>

namespace txbuild
{

// Parses a StrKey account address ("G...") into its wire identity. `field`
// names the address in the error message. Throws EncodingError.
AccountID toAccountID(std::string const& address,
                      std::string const& field = "account");

std::string toAddress(AccountID const& accountID);

// Fills the optional per-operation source account of `op`.
void setOperationSource(Operation& op,
                        std::optional<std::string> const& sourceAccount);

// Number of operations a transaction body may carry.
size_t constexpr MAX_OPERATIONS = MAX_OPS_PER_TX;
}
