// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/Memo.h"
#include "transactions/TxBuildError.h"
#include "util/XDROperators.h"

#include <fmt/format.h>

namespace txbuild
{

TxMemo
TxMemo::none()
{
    return TxMemo();
}

TxMemo
TxMemo::text(std::string text)
{
    TxMemo m;
    m.mType = MEMO_TEXT;
    m.mText = std::move(text);
    return m;
}

TxMemo
TxMemo::id(uint64_t id)
{
    TxMemo m;
    m.mType = MEMO_ID;
    m.mId = id;
    return m;
}

TxMemo
TxMemo::hash(Hash const& hash)
{
    TxMemo m;
    m.mType = MEMO_HASH;
    m.mHash = hash;
    return m;
}

TxMemo
TxMemo::returnHash(Hash const& hash)
{
    TxMemo m;
    m.mType = MEMO_RETURN;
    m.mHash = hash;
    return m;
}

TxMemo
TxMemo::fromXDR(Memo const& memo)
{
    switch (memo.type())
    {
    case MEMO_NONE:
        return none();
    case MEMO_TEXT:
        return text(memo.text());
    case MEMO_ID:
        return id(memo.id());
    case MEMO_HASH:
        return hash(memo.hash());
    case MEMO_RETURN:
        return returnHash(memo.retHash());
    default:
        throw EncodingError("unknown memo type");
    }
}

Memo
TxMemo::toXDR() const
{
    Memo memo;
    memo.type(mType);
    switch (mType)
    {
    case MEMO_NONE:
        break;
    case MEMO_TEXT:
        if (mText.size() > MAX_TEXT_SIZE)
        {
            throw EncodingError(
                fmt::format("memo text is {} bytes, at most {} allowed",
                            mText.size(), MAX_TEXT_SIZE));
        }
        memo.text() = mText;
        break;
    case MEMO_ID:
        memo.id() = mId;
        break;
    case MEMO_HASH:
        memo.hash() = mHash;
        break;
    case MEMO_RETURN:
        memo.retHash() = mHash;
        break;
    }
    return memo;
}

bool
TxMemo::operator==(TxMemo const& other) const
{
    if (mType != other.mType)
    {
        return false;
    }
    switch (mType)
    {
    case MEMO_TEXT:
        return mText == other.mText;
    case MEMO_ID:
        return mId == other.mId;
    case MEMO_HASH:
    case MEMO_RETURN:
        return mHash == other.mHash;
    default:
        return true;
    }
}
}
