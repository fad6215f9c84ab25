#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"

#include <string>
#include <vector>

namespace txbuild
{

// StrKey is the printable key format: base32 of
// [version << 3][payload][crc16 little-endian].
namespace strKey
{

// Only the low 5 bits are meaningful; they select the leading character.
enum StrKeyVersionByte : uint8_t
{
    STRKEY_PUBKEY_ED25519 = 6, // 'G'
    STRKEY_SEED_ED25519 = 18,  // 'S'
    STRKEY_PRE_AUTH_TX = 19,   // 'T'
    STRKEY_HASH_X = 23         // 'X'
};

std::string toStrKey(StrKeyVersionByte version, ByteSlice const& payload);

// Length of the StrKey of a `payloadSize`-byte payload.
size_t getStrKeySize(size_t payloadSize);

// Splits `text` into version and payload. Returns false if it is not base32
// or its checksum does not match; `payload` is unspecified in that case.
bool fromStrKey(std::string const& text, StrKeyVersionByte& version,
                std::vector<uint8_t>& payload);
}
}
