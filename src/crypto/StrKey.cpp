// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/StrKey.h"
#include "util/Decoder.h"
#include "util/crc16.h"

#include <stdexcept>

namespace txbuild
{
namespace strKey
{

namespace
{
// version byte + 2 checksum bytes
size_t constexpr FRAMING_BYTES = 3;
}

std::string
toStrKey(StrKeyVersionByte version, ByteSlice const& payload)
{
    std::vector<uint8_t> raw;
    raw.reserve(payload.size() + FRAMING_BYTES);
    raw.push_back(static_cast<uint8_t>(version << 3));
    raw.insert(raw.end(), payload.begin(), payload.end());

    auto crc = crc16(raw);
    raw.push_back(static_cast<uint8_t>(crc));
    raw.push_back(static_cast<uint8_t>(crc >> 8));
    return decoder::encode_b32(raw);
}

size_t
getStrKeySize(size_t payloadSize)
{
    return decoder::encoded_size32(payloadSize + FRAMING_BYTES);
}

bool
fromStrKey(std::string const& text, StrKeyVersionByte& version,
           std::vector<uint8_t>& payload)
{
    std::vector<uint8_t> raw;
    try
    {
        raw = decoder::decode_b32(text);
    }
    catch (std::invalid_argument const&)
    {
        return false;
    }
    if (raw.size() < FRAMING_BYTES)
    {
        return false;
    }

    auto body = ByteSlice(raw.data(), raw.size() - 2);
    uint16_t expected = static_cast<uint16_t>(raw[raw.size() - 2] |
                                              (raw[raw.size() - 1] << 8));
    if (crc16(body) != expected)
    {
        return false;
    }

    version = static_cast<StrKeyVersionByte>(raw[0] >> 3);
    payload.assign(body.begin() + 1, body.end());
    return true;
}
}
}
