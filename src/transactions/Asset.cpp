// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/Asset.h"
#include "transactions/TransactionUtils.h"
#include "transactions/TxBuildError.h"
#include "util/types.h"

#include <fmt/format.h>

namespace txbuild
{

namespace
{
size_t constexpr MAX_ALPHANUM4_LEN = 4;
size_t constexpr MAX_ALPHANUM12_LEN = 12;

void
checkCode(std::string const& code)
{
    if (code.empty() || code.size() > MAX_ALPHANUM12_LEN)
    {
        throw EncodingError(fmt::format(
            "asset code '{}' must be 1 to {} characters", code,
            MAX_ALPHANUM12_LEN));
    }
}

template <uint32_t N>
void
fillCode(xdr::opaque_array<N>& out, std::string const& code)
{
    strToAssetCode(out, code);
    if (!isAssetCodeValid(out))
    {
        throw EncodingError(
            fmt::format("asset code '{}' is not alphanumeric", code));
    }
}
}

TxAsset::TxAsset(std::string code, std::string issuer)
    : mNative(false), mCode(std::move(code)), mIssuer(std::move(issuer))
{
}

TxAsset
TxAsset::native()
{
    return TxAsset();
}

TxAsset
TxAsset::credit(std::string code, std::string issuer)
{
    return TxAsset(std::move(code), std::move(issuer));
}

TxAsset
TxAsset::fromXDR(Asset const& asset)
{
    switch (asset.type())
    {
    case ASSET_TYPE_NATIVE:
        return native();
    case ASSET_TYPE_CREDIT_ALPHANUM4:
        return credit(assetCodeToStr(asset),
                      toAddress(asset.alphaNum4().issuer));
    case ASSET_TYPE_CREDIT_ALPHANUM12:
        return credit(assetCodeToStr(asset),
                      toAddress(asset.alphaNum12().issuer));
    default:
        throw EncodingError("unknown asset type");
    }
}

AssetType
TxAsset::getType() const
{
    if (mNative)
    {
        return ASSET_TYPE_NATIVE;
    }
    checkCode(mCode);
    return mCode.size() <= MAX_ALPHANUM4_LEN ? ASSET_TYPE_CREDIT_ALPHANUM4
                                             : ASSET_TYPE_CREDIT_ALPHANUM12;
}

Asset
TxAsset::toXDR() const
{
    Asset asset;
    asset.type(getType());
    switch (asset.type())
    {
    case ASSET_TYPE_NATIVE:
        break;
    case ASSET_TYPE_CREDIT_ALPHANUM4:
        fillCode(asset.alphaNum4().assetCode, mCode);
        asset.alphaNum4().issuer = toAccountID(mIssuer, "asset issuer");
        break;
    case ASSET_TYPE_CREDIT_ALPHANUM12:
        fillCode(asset.alphaNum12().assetCode, mCode);
        asset.alphaNum12().issuer = toAccountID(mIssuer, "asset issuer");
        break;
    }
    return asset;
}

AllowTrustOp::_asset_t
TxAsset::toAllowTrustAsset() const
{
    if (mNative)
    {
        throw ValidationError(
            "trustline doesn't exist for the native asset");
    }

    AllowTrustOp::_asset_t res;
    res.type(getType());
    if (res.type() == ASSET_TYPE_CREDIT_ALPHANUM4)
    {
        fillCode(res.assetCode4(), mCode);
    }
    else
    {
        fillCode(res.assetCode12(), mCode);
    }
    return res;
}

std::string
TxAsset::toString() const
{
    if (mNative)
    {
        return "native";
    }
    return fmt::format("{}:{}", mCode, mIssuer);
}

bool
TxAsset::operator==(TxAsset const& other) const
{
    return mNative == other.mNative && mCode == other.mCode &&
           mIssuer == other.mIssuer;
}

bool
TxAsset::operator!=(TxAsset const& other) const
{
    return !(*this == other);
}
}
