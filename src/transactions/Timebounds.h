#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Txbuild-transaction.h"

#include <cstdint>
#include <optional>

namespace txbuild
{

/**
 * Validity window of a transaction, in unix seconds. A maxTime of 0 means
 * the window has no upper bound.
 *
 * Instances only pass validate() when they come from one of the three
 * factories; a default-constructed value is a caller who forgot to choose.
 */
class Timebounds
{
    int64_t mMinTime{0};
    int64_t mMaxTime{0};
    bool mExplicitlyConstructed{false};

    Timebounds(int64_t minTime, int64_t maxTime);

  public:
    // Value for maxTime meaning "no upper bound".
    static constexpr int64_t TIMEOUT_INFINITE = 0;

    Timebounds() = default;

    // [minTime, maxTime]
    static Timebounds fixed(int64_t minTime, int64_t maxTime);

    // [minTime, now + timeoutSeconds]; now is read from the system clock
    // unless given. Throws ValidationError if timeoutSeconds is negative or
    // the sum does not fit in int64_t.
    static Timebounds timeout(int64_t minTime, int64_t timeoutSeconds);
    static Timebounds timeout(int64_t minTime, int64_t timeoutSeconds,
                              int64_t now);

    // [minTime, unbounded]
    static Timebounds noTimeout(int64_t minTime);

    int64_t
    getMinTime() const
    {
        return mMinTime;
    }

    int64_t
    getMaxTime() const
    {
        return mMaxTime;
    }

    bool
    isExplicitlyConstructed() const
    {
        return mExplicitlyConstructed;
    }

    // Throws ConfigError if the value did not come from a factory, and
    // ValidationError if the window is malformed.
    void validate() const;

    // Validates, then produces the wire form.
    TimeBounds toXDR() const;

    bool operator==(Timebounds const& other) const;
    bool operator!=(Timebounds const& other) const;
};
}
