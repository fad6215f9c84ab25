// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SecretKey.h"
#include "crypto/ByteSlice.h"
#include "crypto/CryptoError.h"
#include "crypto/StrKey.h"
#include "util/Logging.h"

#include <sodium.h>

namespace txbuild
{

static_assert(crypto_sign_PUBLICKEYBYTES == sizeof(uint256),
              "Unexpected public key length");
static_assert(crypto_sign_SEEDBYTES == sizeof(uint256),
              "Unexpected seed length");
static_assert(crypto_sign_SECRETKEYBYTES == 64,
              "Unexpected secret key length");

void
initSodium()
{
    if (sodium_init() < 0)
    {
        throw CryptoError("could not initialize libsodium");
    }
}

SecretKey::SecretKey()
{
    mPublicKey.type(PUBLIC_KEY_TYPE_ED25519);
}

SecretKey::~SecretKey()
{
    sodium_memzero(mSecretKey.data(), mSecretKey.size());
}

PublicKey const&
SecretKey::getPublicKey() const
{
    return mPublicKey;
}

SecretValue
SecretKey::getStrKeySeed() const
{
    uint256 seed;
    if (crypto_sign_ed25519_sk_to_seed(seed.data(), mSecretKey.data()) != 0)
    {
        throw CryptoError("error extracting seed from secret key");
    }
    SecretValue res(strKey::toStrKey(strKey::STRKEY_SEED_ED25519, seed));
    sodium_memzero(seed.data(), seed.size());
    return res;
}

std::string
SecretKey::getStrKeyPublic() const
{
    return KeyUtils::toStrKey(mPublicKey);
}

Signature
SecretKey::sign(ByteSlice const& bin) const
{
    Signature out(crypto_sign_BYTES, 0);
    if (crypto_sign_detached(out.data(), nullptr, bin.data(), bin.size(),
                             mSecretKey.data()) != 0)
    {
        throw CryptoError("error while signing");
    }
    return out;
}

SecretKey
SecretKey::random()
{
    SecretKey sk;
    if (crypto_sign_keypair(sk.mPublicKey.ed25519().data(),
                            sk.mSecretKey.data()) != 0)
    {
        throw CryptoError("error generating random secret key");
    }
    return sk;
}

SecretKey
SecretKey::fromSeed(ByteSlice const& seed)
{
    if (seed.size() != crypto_sign_SEEDBYTES)
    {
        throw CryptoError("seed does not match byte size");
    }
    SecretKey sk;
    if (crypto_sign_seed_keypair(sk.mPublicKey.ed25519().data(),
                                 sk.mSecretKey.data(), seed.data()) != 0)
    {
        throw CryptoError("error generating secret key from seed");
    }
    return sk;
}

SecretKey
SecretKey::fromStrKeySeed(std::string const& strKeySeed)
{
    strKey::StrKeyVersionByte ver;
    std::vector<uint8_t> seed;
    bool ok =
        strKey::fromStrKey(strKeySeed, ver, seed) &&
        ver == strKey::STRKEY_SEED_ED25519 &&
        seed.size() == crypto_sign_SEEDBYTES &&
        strKeySeed.size() == strKey::getStrKeySize(crypto_sign_SEEDBYTES);
    if (!ok)
    {
        sodium_memzero(seed.data(), seed.size());
        throw CryptoError("invalid seed");
    }

    SecretKey sk = fromSeed(seed);
    sodium_memzero(seed.data(), seed.size());
    CLOG_TRACE(Crypto, "loaded key {}", KeyUtils::toShortString(sk.mPublicKey));
    return sk;
}

bool
PubKeyUtils::verifySig(PublicKey const& key, Signature const& signature,
                       ByteSlice const& bin)
{
    if (key.type() != PUBLIC_KEY_TYPE_ED25519 ||
        signature.size() != crypto_sign_BYTES)
    {
        return false;
    }

    bool ok =
        crypto_sign_verify_detached(signature.data(), bin.data(), bin.size(),
                                    key.ed25519().data()) == 0;
    if (!ok)
    {
        CLOG_DEBUG(Crypto, "signature does not verify under {}",
                   KeyUtils::toShortString(key));
    }
    return ok;
}
}
