#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstddef>
#include <cstdint>
#include <optional>

namespace txbuild
{

// Fee charged for a transaction: baseFee stroops per operation, unless the
// caller asked for a specific non-zero fee.
class FeePolicy
{
    uint32_t mBaseFee;

  public:
    static constexpr uint32_t DEFAULT_BASE_FEE = 100;

    // Throws ConfigError for a zero base fee.
    explicit FeePolicy(uint32_t baseFee = DEFAULT_BASE_FEE);

    uint32_t
    getBaseFee() const
    {
        return mBaseFee;
    }

    // Throws ValidationError if baseFee * operationCount does not fit the
    // 32-bit wire field.
    uint32_t computeFee(size_t operationCount,
                        std::optional<uint32_t> explicitFee) const;
};
}
