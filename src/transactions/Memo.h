#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Txbuild-transaction.h"

#include <string>

namespace txbuild
{

// Memo attached to a transaction. Size limits are only checked when the
// wire form is produced at build time.
class TxMemo
{
    MemoType mType{MEMO_NONE};
    std::string mText;
    uint64_t mId{0};
    Hash mHash;

  public:
    // Longest text memo, in bytes.
    static constexpr size_t MAX_TEXT_SIZE = 28;

    static TxMemo none();
    static TxMemo text(std::string text);
    static TxMemo id(uint64_t id);
    static TxMemo hash(Hash const& hash);
    static TxMemo returnHash(Hash const& hash);

    static TxMemo fromXDR(Memo const& memo);

    MemoType
    getType() const
    {
        return mType;
    }

    // Throws EncodingError if the text does not fit.
    Memo toXDR() const;

    bool operator==(TxMemo const& other) const;
};
}
