#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Logging.h"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

namespace cpptoml
{
class table;
}

namespace txbuild
{

class Config
{
    void processConfig(std::shared_ptr<cpptoml::table>);

  public:
    // Network the transactions are hashed and signed for.
    std::string NETWORK_PASSPHRASE;

    // Fee per operation, in stroops, applied when a builder has no explicit
    // fee.
    uint32_t BASE_FEE;

    LogLevel LOG_LEVEL;

    // When not empty, logs are also written to this file.
    std::string LOG_FILE_PATH;

    // Seconds from now after which transactions built from this config
    // expire. 0 leaves the timebounds choice to the caller.
    int64_t DEFAULT_TIMEOUT;

    Config();

    void load(std::string const& filename);
    void load(std::istream& in);

    // Applies LOG_LEVEL and LOG_FILE_PATH to the logging subsystem.
    void applyLogging() const;
};
}
