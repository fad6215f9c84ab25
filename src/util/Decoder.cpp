// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Decoder.h"

#include <sodium.h>
#include <stdexcept>

namespace txbuild
{
namespace decoder
{

static char const* const kB32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

std::string
encode_b32(ByteSlice const& v)
{
    std::string res;
    res.reserve(encoded_size32(v.size()) + 1);

    uint32_t buffer = 0;
    int bits = 0;
    for (auto b : v)
    {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5)
        {
            res.push_back(kB32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0)
    {
        res.push_back(kB32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    while (res.size() % 8 != 0)
    {
        res.push_back('=');
    }
    return res;
}

static int
b32Value(char c)
{
    if (c >= 'A' && c <= 'Z')
    {
        return c - 'A';
    }
    if (c >= '2' && c <= '7')
    {
        return c - '2' + 26;
    }
    return -1;
}

std::vector<uint8_t>
decode_b32(std::string const& v)
{
    size_t len = v.size();
    while (len > 0 && v[len - 1] == '=')
    {
        --len;
    }
    if (len != v.size() && v.size() % 8 != 0)
    {
        throw std::invalid_argument("bad base32 padding");
    }
    // lengths 1, 3 and 6 (mod 8) cannot come out of an encoder
    auto tail = len % 8;
    if (tail == 1 || tail == 3 || tail == 6)
    {
        throw std::invalid_argument("bad base32 length");
    }

    std::vector<uint8_t> out;
    out.reserve(len * 5 / 8);
    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < len; ++i)
    {
        int val = b32Value(v[i]);
        if (val < 0)
        {
            throw std::invalid_argument("bad base32 character");
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(val);
        bits += 5;
        if (bits >= 8)
        {
            out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    if ((buffer & ((1u << bits) - 1)) != 0)
    {
        throw std::invalid_argument("non-canonical base32 encoding");
    }
    return out;
}

std::string
encode_b64(ByteSlice const& v)
{
    std::string res(
        sodium_base64_encoded_len(v.size(), sodium_base64_VARIANT_ORIGINAL),
        '\0');
    if (sodium_bin2base64(&res[0], res.size(), v.data(), v.size(),
                          sodium_base64_VARIANT_ORIGINAL) == nullptr)
    {
        throw std::runtime_error("error in decoder::encode_b64");
    }
    // drop the terminating NUL written by libsodium
    res.pop_back();
    return res;
}

std::vector<uint8_t>
decode_b64(std::string const& v)
{
    std::vector<uint8_t> out(v.size() / 4 * 3 + 3);
    size_t binLen = 0;
    char const* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), v.data(), v.size(), nullptr,
                          &binLen, &end, sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != v.data() + v.size())
    {
        throw std::invalid_argument("bad base64 encoding");
    }
    out.resize(binLen);
    return out;
}
}
}
