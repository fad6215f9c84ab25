// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "transactions/FeePolicy.h"
#include "transactions/NetworkUtils.h"
#include "util/types.h"

#include <cpptoml.h>
#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <type_traits>

namespace txbuild
{

Config::Config()
    : NETWORK_PASSPHRASE(NetworkUtils::TEST_NETWORK_PASSPHRASE)
    , BASE_FEE(FeePolicy::DEFAULT_BASE_FEE)
    , LOG_LEVEL(LogLevel::LVL_INFO)
    , DEFAULT_TIMEOUT(0)
{
}

namespace
{
// About 68 years.
int64_t constexpr MAX_DEFAULT_TIMEOUT = std::numeric_limits<int32_t>::max();

using ConfigItem = std::pair<std::string, std::shared_ptr<cpptoml::base>>;

std::string
readString(ConfigItem const& item)
{
    if (!item.second->as<std::string>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<std::string>()->get();
}

template <typename T>
std::enable_if_t<std::is_signed_v<T>, T>
castInt(int64_t v, std::string const& name, T min, T max)
{
    if (v < min || v > max)
    {
        throw std::invalid_argument(fmt::format(FMT_STRING("bad '{}'"), name));
    }
    return static_cast<T>(v);
}

template <typename T>
std::enable_if_t<std::is_unsigned_v<T>, T>
castInt(int64_t v, std::string const& name, T min, T max)
{
    if (v < 0)
    {
        throw std::invalid_argument(fmt::format(FMT_STRING("bad '{}'"), name));
    }
    else
    {
        if (static_cast<uint64_t>(v) < min || static_cast<uint64_t>(v) > max)
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("bad '{}'"), name));
        }
    }
    return static_cast<T>(v);
}

template <typename T>
T
readInt(ConfigItem const& item, T min = std::numeric_limits<T>::min(),
        T max = std::numeric_limits<T>::max())
{
    if (!item.second->as<int64_t>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return castInt<T>(item.second->as<int64_t>()->get(), item.first, min, max);
}
}

void
Config::load(std::string const& filename)
{
    LOG_DEBUG(DEFAULT_LOG, "Loading config from: {}", filename);
    try
    {
        std::ifstream ifs(filename);
        if (!ifs)
        {
            throw std::runtime_error(
                fmt::format(FMT_STRING("Error opening file '{}'"), filename));
        }
        ifs.exceptions(std::ios::badbit);
        load(ifs);
    }
    catch (std::exception const& ex)
    {
        std::string err("Failed to parse '");
        err += filename;
        err += "' :";
        err += ex.what();
        throw std::invalid_argument(err);
    }
}

void
Config::load(std::istream& in)
{
    std::shared_ptr<cpptoml::table> t;
    try
    {
        cpptoml::parser p(in);
        t = p.parse();
    }
    catch (cpptoml::parse_exception& ex)
    {
        throw std::invalid_argument(ex.what());
    }
    processConfig(t);
}

void
Config::processConfig(std::shared_ptr<cpptoml::table> t)
{
    if (!t)
    {
        throw std::invalid_argument("Could not parse toml");
    }

    for (auto& item : *t)
    {
        CLOG_TRACE(Config, "Config item: {}", item.first);

        std::map<std::string, std::function<void()>> confProcessor = {
            {"NETWORK_PASSPHRASE",
             [&]() {
                 NETWORK_PASSPHRASE = readString(item);
                 if (NETWORK_PASSPHRASE.empty())
                 {
                     throw std::invalid_argument(
                         "NETWORK_PASSPHRASE cannot be empty");
                 }
             }},
            {"BASE_FEE", [&]() { BASE_FEE = readInt<uint32_t>(item, 1); }},
            {"LOG_LEVEL",
             [&]() {
                 auto name = readString(item);
                 LOG_LEVEL = Logging::getLLfromString(name);
                 if (!iequals(Logging::getStringFromLL(LOG_LEVEL), name))
                 {
                     throw std::invalid_argument(
                         fmt::format(FMT_STRING("invalid LOG_LEVEL '{}'"),
                                     name));
                 }
             }},
            {"LOG_FILE_PATH", [&]() { LOG_FILE_PATH = readString(item); }},
            {"DEFAULT_TIMEOUT",
             [&]() {
                 DEFAULT_TIMEOUT =
                     readInt<int64_t>(item, 0, MAX_DEFAULT_TIMEOUT);
             }}};

        auto it = confProcessor.find(item.first);
        if (it != confProcessor.end())
        {
            it->second();
        }
        else
        {
            std::string err("Unknown configuration entry: '");
            err += item.first;
            err += "'";
            throw std::invalid_argument(err);
        }
    }
    CLOG_DEBUG(Config, "Network passphrase: '{}', base fee: {}",
               NETWORK_PASSPHRASE, BASE_FEE);
}

void
Config::applyLogging() const
{
    Logging::setLogLevel(LOG_LEVEL, nullptr);
    if (!LOG_FILE_PATH.empty())
    {
        Logging::setLoggingToFile(LOG_FILE_PATH);
    }
}
}
