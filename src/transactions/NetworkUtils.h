#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Txbuild-transaction.h"

#include <string>

namespace txbuild
{

namespace NetworkUtils
{
extern char const* const PUBLIC_NETWORK_PASSPHRASE;
extern char const* const TEST_NETWORK_PASSPHRASE;

// Identity of a network: SHA-256 of its passphrase. Throws ConfigError on an
// empty passphrase.
Hash networkID(std::string const& passphrase);

// Hash signed by every signer of `tx` on the network `networkID`.
Hash transactionHash(Hash const& networkID, Transaction const& tx);
}
}
