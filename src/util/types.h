#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Txbuild-ledger-entries.h"
#include <algorithm>
#include <locale>
#include <string>

namespace txbuild
{
// returns true if the passed string contains no control characters
bool isStringValid(std::string const& str);

// returns true if the asset code is 1 to N alphanumeric characters
// followed only by trailing zeros
template <uint32_t N>
bool
isAssetCodeValid(xdr::opaque_array<N> const& code)
{
    bool zeros = false;
    bool onechar = false; // at least one non zero character
    for (uint8_t b : code)
    {
        if (b == 0)
        {
            zeros = true;
        }
        else if (zeros)
        {
            // zeros can only be trailing
            return false;
        }
        else
        {
            if (b > 0x7F || !std::isalnum(static_cast<char>(b),
                                          std::locale::classic()))
            {
                return false;
            }
            onechar = true;
        }
    }
    return onechar;
}

// copies up to N bytes of `str` into `ret`, zero-filling the remainder
template <uint32_t N>
void
strToAssetCode(xdr::opaque_array<N>& ret, std::string const& str)
{
    ret.fill(0);
    size_t n = std::min(ret.size(), str.size());
    std::copy(str.begin(), str.begin() + n, ret.begin());
}

// returns the asset code of a credit asset without trailing zeros
std::string assetCodeToStr(Asset const& asset);

bool iequals(std::string const& a, std::string const& b);
}
