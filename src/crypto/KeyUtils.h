#pragma once

// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Txbuild-types.h"

#include <stdexcept>
#include <string>

namespace txbuild
{

// Conversions between wire keys and their StrKey text.
namespace KeyUtils
{

// Raised when text is not a StrKey of the requested kind.
struct InvalidStrKey : public std::invalid_argument
{
    using std::invalid_argument::invalid_argument;
};

std::string toStrKey(PublicKey const& key);
std::string toStrKey(SignerKey const& key);

template <typename T>
std::string
toShortString(T const& key)
{
    return toStrKey(key).substr(0, 5);
}

// PublicKey accepts 'G' addresses. SignerKey accepts 'G', 'T' (pre-auth tx)
// and 'X' (hash-x) keys. Seeds are rejected by both.
template <typename T> T fromStrKey(std::string const& text);
template <> PublicKey fromStrKey<PublicKey>(std::string const& text);
template <> SignerKey fromStrKey<SignerKey>(std::string const& text);
}
}
