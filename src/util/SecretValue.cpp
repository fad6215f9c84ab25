// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/SecretValue.h"

#include <sodium.h>
#include <utility>

namespace txbuild
{

SecretValue::SecretValue(std::string v) : value(std::move(v))
{
}

SecretValue::~SecretValue()
{
    if (!value.empty())
    {
        sodium_memzero(&value[0], value.size());
    }
}

bool
SecretValue::operator==(SecretValue const& other) const
{
    return value.size() == other.value.size() &&
           sodium_memcmp(value.data(), other.value.data(), value.size()) == 0;
}

bool
SecretValue::operator!=(SecretValue const& other) const
{
    return !(*this == other);
}
}
