#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <xdrpp/types.h>

namespace txbuild
{

/**
 * Read-only view of contiguous bytes, built implicitly from the containers
 * that get hashed, signed or encoded: fixed-size XDR opaques (keys, hashes),
 * byte vectors (which covers variable XDR opaques such as signatures) and
 * strings. A slice never owns its bytes and must not outlive its source.
 */
class ByteSlice
{
    uint8_t const* mData;
    size_t mSize;

  public:
    ByteSlice(void const* data, size_t size)
        : mData(static_cast<uint8_t const*>(data)), mSize(size)
    {
    }

    template <uint32_t N>
    ByteSlice(xdr::opaque_array<N> const& bytes)
        : ByteSlice(bytes.data(), bytes.size())
    {
    }

    ByteSlice(std::vector<uint8_t> const& bytes)
        : ByteSlice(bytes.data(), bytes.size())
    {
    }

    ByteSlice(std::string const& bytes) : ByteSlice(bytes.data(), bytes.size())
    {
    }

    ByteSlice(char const* str) : ByteSlice(str, std::strlen(str))
    {
    }

    uint8_t const*
    data() const
    {
        return mData;
    }

    size_t
    size() const
    {
        return mSize;
    }

    bool
    empty() const
    {
        return mSize == 0;
    }

    uint8_t const*
    begin() const
    {
        return mData;
    }

    uint8_t const*
    end() const
    {
        return mData + mSize;
    }

    // The first `n` bytes, or all of them if there are fewer.
    ByteSlice
    prefix(size_t n) const
    {
        return ByteSlice(mData, n < mSize ? n : mSize);
    }

    // The last `n` bytes, or all of them if there are fewer.
    ByteSlice
    suffix(size_t n) const
    {
        return n < mSize ? ByteSlice(mData + mSize - n, n) : *this;
    }
};
}
