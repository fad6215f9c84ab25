// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/NetworkUtils.h"
#include "crypto/SHA.h"
#include "transactions/TxBuildError.h"

namespace txbuild
{

namespace NetworkUtils
{
char const* const PUBLIC_NETWORK_PASSPHRASE =
    "Public Global Stellar Network ; September 2015";
char const* const TEST_NETWORK_PASSPHRASE =
    "Test SDF Network ; September 2015";

Hash
networkID(std::string const& passphrase)
{
    if (passphrase.empty())
    {
        throw ConfigError("network passphrase cannot be empty");
    }
    return sha256(passphrase);
}

Hash
transactionHash(Hash const& networkID, Transaction const& tx)
{
    return xdrSha256(networkID, ENVELOPE_TYPE_TX, tx);
}
}
}
