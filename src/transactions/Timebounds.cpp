// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/Timebounds.h"
#include "transactions/TxBuildError.h"

#include <chrono>
#include <fmt/format.h>
#include <limits>

namespace txbuild
{

Timebounds::Timebounds(int64_t minTime, int64_t maxTime)
    : mMinTime(minTime), mMaxTime(maxTime), mExplicitlyConstructed(true)
{
}

Timebounds
Timebounds::fixed(int64_t minTime, int64_t maxTime)
{
    return Timebounds(minTime, maxTime);
}

Timebounds
Timebounds::timeout(int64_t minTime, int64_t timeoutSeconds)
{
    using namespace std::chrono;
    auto now =
        duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    return timeout(minTime, timeoutSeconds, static_cast<int64_t>(now));
}

Timebounds
Timebounds::timeout(int64_t minTime, int64_t timeoutSeconds, int64_t now)
{
    if (timeoutSeconds < 0)
    {
        throw ValidationError(fmt::format(
            "invalid timeout: {} seconds is negative", timeoutSeconds));
    }
    if (now > 0 && timeoutSeconds > std::numeric_limits<int64_t>::max() - now)
    {
        throw ValidationError(
            fmt::format("invalid timeout: {} seconds from {} is out of range",
                        timeoutSeconds, now));
    }
    return Timebounds(minTime, now + timeoutSeconds);
}

Timebounds
Timebounds::noTimeout(int64_t minTime)
{
    return Timebounds(minTime, TIMEOUT_INFINITE);
}

void
Timebounds::validate() const
{
    if (!mExplicitlyConstructed)
    {
        throw ConfigError("timebounds must be constructed using fixed(), "
                          "timeout(), or noTimeout()");
    }
    if (mMinTime < 0)
    {
        throw ValidationError("invalid timebound: minTime cannot be negative");
    }
    if (mMaxTime < 0)
    {
        throw ValidationError("invalid timebound: maxTime cannot be negative");
    }
    if (mMaxTime != TIMEOUT_INFINITE && mMaxTime < mMinTime)
    {
        throw ValidationError("invalid timebound: maxTime < minTime");
    }
}

TimeBounds
Timebounds::toXDR() const
{
    validate();
    TimeBounds tb;
    tb.minTime = static_cast<uint64>(mMinTime);
    tb.maxTime = static_cast<uint64>(mMaxTime);
    return tb;
}

bool
Timebounds::operator==(Timebounds const& other) const
{
    return mMinTime == other.mMinTime && mMaxTime == other.mMaxTime &&
           mExplicitlyConstructed == other.mExplicitlyConstructed;
}

bool
Timebounds::operator!=(Timebounds const& other) const
{
    return !(*this == other);
}
}
