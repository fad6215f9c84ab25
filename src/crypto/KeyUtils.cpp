// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/KeyUtils.h"
#include "crypto/StrKey.h"

#include <algorithm>

namespace txbuild
{
namespace KeyUtils
{

namespace
{
// Decodes a StrKey carrying a 32-byte payload. Non-canonical lengths are
// rejected even when base32 decoding tolerates them.
uint256
decodeKey(std::string const& text, char const* kind,
          strKey::StrKeyVersionByte& version)
{
    std::vector<uint8_t> payload;
    uint256 key;
    if (!strKey::fromStrKey(text, version, payload) ||
        payload.size() != key.size() ||
        text.size() != strKey::getStrKeySize(key.size()))
    {
        throw InvalidStrKey(std::string("bad ") + kind);
    }
    std::copy(payload.begin(), payload.end(), key.begin());
    return key;
}
}

std::string
toStrKey(PublicKey const& key)
{
    return strKey::toStrKey(strKey::STRKEY_PUBKEY_ED25519, key.ed25519());
}

std::string
toStrKey(SignerKey const& key)
{
    switch (key.type())
    {
    case SIGNER_KEY_TYPE_ED25519:
        return strKey::toStrKey(strKey::STRKEY_PUBKEY_ED25519, key.ed25519());
    case SIGNER_KEY_TYPE_PRE_AUTH_TX:
        return strKey::toStrKey(strKey::STRKEY_PRE_AUTH_TX, key.preAuthTx());
    case SIGNER_KEY_TYPE_HASH_X:
        return strKey::toStrKey(strKey::STRKEY_HASH_X, key.hashX());
    default:
        throw std::invalid_argument("invalid signer key type");
    }
}

template <>
PublicKey
fromStrKey<PublicKey>(std::string const& text)
{
    strKey::StrKeyVersionByte version;
    auto bytes = decodeKey(text, "public key", version);
    if (version != strKey::STRKEY_PUBKEY_ED25519)
    {
        throw InvalidStrKey("bad public key");
    }
    PublicKey key;
    key.type(PUBLIC_KEY_TYPE_ED25519);
    key.ed25519() = bytes;
    return key;
}

template <>
SignerKey
fromStrKey<SignerKey>(std::string const& text)
{
    strKey::StrKeyVersionByte version;
    auto bytes = decodeKey(text, "signer key", version);
    SignerKey key;
    switch (version)
    {
    case strKey::STRKEY_PUBKEY_ED25519:
        key.type(SIGNER_KEY_TYPE_ED25519);
        key.ed25519() = bytes;
        break;
    case strKey::STRKEY_PRE_AUTH_TX:
        key.type(SIGNER_KEY_TYPE_PRE_AUTH_TX);
        key.preAuthTx() = bytes;
        break;
    case strKey::STRKEY_HASH_X:
        key.type(SIGNER_KEY_TYPE_HASH_X);
        key.hashX() = bytes;
        break;
    default:
        throw InvalidStrKey("bad signer key");
    }
    return key;
}
}
}
