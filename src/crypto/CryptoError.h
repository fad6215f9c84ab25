#pragma once

// Copyright 2020 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <stdexcept>

namespace txbuild
{
// Raised when libsodium reports a failure or key material is unusable
// (malformed seed, wrong length).
struct CryptoError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};
}
