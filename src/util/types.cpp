// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/types.h"

#include <cctype>
#include <locale>

namespace txbuild
{

bool
isStringValid(std::string const& str)
{
    auto& loc = std::locale::classic();
    for (auto c : str)
    {
        if (c < 0 || std::iscntrl(c, loc))
        {
            return false;
        }
    }
    return true;
}

template <uint32_t N>
static std::string
codeToStr(xdr::opaque_array<N> const& code)
{
    std::string res;
    for (auto c : code)
    {
        if (c == 0)
        {
            break;
        }
        res.push_back(static_cast<char>(c));
    }
    return res;
}

std::string
assetCodeToStr(Asset const& asset)
{
    switch (asset.type())
    {
    case ASSET_TYPE_CREDIT_ALPHANUM4:
        return codeToStr(asset.alphaNum4().assetCode);
    case ASSET_TYPE_CREDIT_ALPHANUM12:
        return codeToStr(asset.alphaNum12().assetCode);
    default:
        return "";
    }
}

bool
iequals(std::string const& a, std::string const& b)
{
    size_t sz = a.size();
    if (b.size() != sz)
        return false;
    for (size_t i = 0; i < sz; ++i)
        if (tolower(a[i]) != tolower(b[i]))
            return false;
    return true;
}
}
