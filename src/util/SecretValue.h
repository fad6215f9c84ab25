#pragma once

// Copyright 2017 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <string>

namespace txbuild
{

/**
 * Text of a secret seed. The wrapper has no formatter, so the seed only
 * reaches a log or a string comparison through an explicit `.value`. The
 * buffer is wiped when the wrapper is destroyed.
 */
struct SecretValue
{
    std::string value;

    SecretValue() = default;
    explicit SecretValue(std::string v);
    SecretValue(SecretValue const&) = default;
    SecretValue& operator=(SecretValue const&) = default;
    ~SecretValue();

    bool operator==(SecretValue const& other) const;
    bool operator!=(SecretValue const& other) const;
};
}
