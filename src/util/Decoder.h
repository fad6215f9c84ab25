#pragma once

// Copyright 2018 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"

#include <cstdint>
#include <string>
#include <vector>

namespace txbuild
{

// RFC 4648 encoders. Base32 backs StrKey; base64 (standard alphabet,
// padded) is the transport encoding of envelopes.
namespace decoder
{

inline size_t
encoded_size32(size_t rawsize)
{
    return ((rawsize + 4) / 5 * 8);
}

inline size_t
encoded_size64(size_t rawsize)
{
    return ((rawsize + 2) / 3 * 4);
}

std::string encode_b32(ByteSlice const& v);

std::string encode_b64(ByteSlice const& v);

// Both decoders throw std::invalid_argument on characters outside the
// alphabet or on bad padding.
std::vector<uint8_t> decode_b32(std::string const& v);

std::vector<uint8_t> decode_b64(std::string const& v);
}
}
