// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#define CATCH_CONFIG_RUNNER

#include "test/test.h"
#include "crypto/CryptoError.h"
#include "crypto/SecretKey.h"
#include "test/Catch2.h"
#include "transactions/NetworkUtils.h"
#include "util/Logging.h"

#include <ctime>
#include <fmt/format.h>
#include <memory>

namespace txbuild
{

Config const&
getTestConfig()
{
    static std::unique_ptr<Config> cfg;
    if (!cfg)
    {
        cfg = std::make_unique<Config>();
        cfg->NETWORK_PASSPHRASE = NetworkUtils::TEST_NETWORK_PASSPHRASE;
    }
    return *cfg;
}

int
runTest(int argc, char* const* argv)
{
    Config logConfig;

    Catch::Session session{};

    auto& seed = session.configData().rngSeed;

    // rotate the seed every 24 hours
    seed = static_cast<unsigned int>(std::time(nullptr)) / (24 * 3600);

    auto parser = session.cli();
    parser |= Catch::clara::Opt(
        [&](std::string const& arg) {
            logConfig.LOG_LEVEL = Logging::getLLfromString(arg);
        },
        "LEVEL")["--ll"]("set the log level");
    parser |= Catch::clara::Opt(logConfig.LOG_FILE_PATH, "FILENAME")
        ["--log-file"]("also write logs to FILENAME");
    session.cli(parser);

    int res = session.applyCommandLine(argc, argv);
    if (res != 0)
    {
        return res;
    }

    try
    {
        initSodium();
    }
    catch (CryptoError const& e)
    {
        LOG_ERROR(DEFAULT_LOG, "Could not initialize crypto: {}", e.what());
        return 1;
    }

    logConfig.applyLogging();

    auto r = session.run();
    // In the 'list' modes Catch returns the number of tests listed. We don't
    // want to treat this value as and error code.
    if (session.configData().listTests ||
        session.configData().listTestNamesOnly ||
        session.configData().listTags || session.configData().listReporters)
    {
        r = 0;
    }

    if (r != 0)
    {
        LOG_ERROR(DEFAULT_LOG, "Nonzero test result with --rng-seed {}", seed);
    }
    Logging::deinit();
    return r;
}
}

int
main(int argc, char* const* argv)
{
    return txbuild::runTest(argc, argv);
}
