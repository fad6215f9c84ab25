// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/TestAccounts.h"

namespace txbuild
{
namespace txtest
{

SecretKey const&
keypair0()
{
    static SecretKey const key = SecretKey::fromStrKeySeed(
        "SBPQUZ6G4FZNWFHKUWC5BEYWF6R52E3SEP7R3GWYSM2XTKGF5LNTWW4R");
    return key;
}

SecretKey const&
keypair1()
{
    static SecretKey const key = SecretKey::fromStrKeySeed(
        "SBMSVD4KKELKGZXHBUQTIROWUAPQASDX7KEJITARP4VMZ6KLUHOGPTYW");
    return key;
}

SecretKey const&
keypair2()
{
    static SecretKey const key = SecretKey::fromStrKeySeed(
        "SBZVMB74Z76QZ3ZOY7UTDFYKMEGKW5XFJEB6PFKBF4UYSSWHG4EDH7PY");
    return key;
}

char const* const NEW_ACCOUNT_ADDRESS =
    "GCCOBXW2XQNUSL467IEILE6MMCNRR66SSVL4YQADUNYYNUVREF3FIV2Z";
}
}
