// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/SignatureUtils.h"

#include "crypto/SecretKey.h"
#include "util/Logging.h"

#include <cstring>

namespace txbuild
{

namespace SignatureUtils
{

DecoratedSignature
sign(SecretKey const& secretKey, Hash const& hash)
{
    DecoratedSignature result;
    result.signature = secretKey.sign(hash);
    result.hint = getHint(secretKey.getPublicKey().ed25519());
    CLOG_TRACE(Crypto, "signed with {}",
               KeyUtils::toShortString(secretKey.getPublicKey()));
    return result;
}

bool
verify(DecoratedSignature const& sig, PublicKey const& pubKey, Hash const& hash)
{
    if (!doesHintMatch(pubKey.ed25519(), sig.hint))
    {
        return false;
    }
    return PubKeyUtils::verifySig(pubKey, sig.signature, hash);
}

SignatureHint
getHint(ByteSlice const& bs)
{
    if (bs.empty())
    {
        return SignatureHint();
    }

    SignatureHint res;
    if (res.size() > bs.size())
    {
        memcpy(res.data(), bs.begin(), bs.size());
    }
    else
    {
        memcpy(res.data(), bs.end() - res.size(), res.size());
    }
    return res;
}

bool
doesHintMatch(ByteSlice const& bs, SignatureHint const& hint)
{
    if (bs.size() < hint.size())
    {
        return false;
    }

    return memcmp(bs.end() - hint.size(), hint.data(), hint.size()) == 0;
}
}
}
