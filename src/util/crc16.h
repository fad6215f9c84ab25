#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/ByteSlice.h"

#include <cstdint>

namespace txbuild
{
// CRC16-XModem (polynomial 0x1021, initial value 0), the StrKey checksum.
uint16_t crc16(ByteSlice const& bytes);
}
