#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Txbuild-transaction.h"

#include <string>

namespace txbuild
{

/**
 * An asset as the caller names it: either the native asset, or a credit
 * asset identified by a 1 to 12 character alphanumeric code and the StrKey
 * address of its issuer. The wire form is produced on demand; codes of up
 * to 4 characters use ASSET_TYPE_CREDIT_ALPHANUM4, longer codes
 * ASSET_TYPE_CREDIT_ALPHANUM12.
 */
class TxAsset
{
    bool mNative{true};
    std::string mCode;
    std::string mIssuer;

    TxAsset(std::string code, std::string issuer);

  public:
    TxAsset() = default;

    static TxAsset native();
    static TxAsset credit(std::string code, std::string issuer);

    // Inverse of toXDR().
    static TxAsset fromXDR(Asset const& asset);

    bool
    isNative() const
    {
        return mNative;
    }

    std::string const&
    getCode() const
    {
        return mCode;
    }

    std::string const&
    getIssuer() const
    {
        return mIssuer;
    }

    AssetType getType() const;

    // Throws EncodingError for a malformed code or issuer.
    Asset toXDR() const;

    // The issuer-less form used by allow-trust. Throws ValidationError for
    // the native asset.
    AllowTrustOp::_asset_t toAllowTrustAsset() const;

    std::string toString() const;

    bool operator==(TxAsset const& other) const;
    bool operator!=(TxAsset const& other) const;
};
}
