// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/FeePolicy.h"
#include "transactions/TxBuildError.h"

#include <fmt/format.h>
#include <limits>

namespace txbuild
{

FeePolicy::FeePolicy(uint32_t baseFee) : mBaseFee(baseFee)
{
    if (mBaseFee == 0)
    {
        throw ConfigError("base fee must be positive");
    }
}

uint32_t
FeePolicy::computeFee(size_t operationCount,
                      std::optional<uint32_t> explicitFee) const
{
    if (explicitFee && *explicitFee != 0)
    {
        return *explicitFee;
    }

    uint64_t fee = static_cast<uint64_t>(mBaseFee) * operationCount;
    if (fee > std::numeric_limits<uint32_t>::max())
    {
        throw ValidationError(
            fmt::format("fee of {} stroops for {} operations overflows", fee,
                        operationCount));
    }
    return static_cast<uint32_t>(fee);
}
}
