// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Logging.h"
#include "util/types.h"

#include <chrono>
#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <stdexcept>
#include <vector>

namespace txbuild
{

std::array<std::string const, 3> const Logging::kPartitionNames = {
#define LOG_PARTITION(name) #name,
#include "util/LogPartitions.def"
#undef LOG_PARTITION
};

LogLevel Logging::mGlobalLogLevel = LogLevel::LVL_INFO;
std::map<std::string, LogLevel> Logging::mPartitionLogLevels;
bool Logging::mInitialized = false;
std::string Logging::mLastPattern;
std::string Logging::mLastFilename;

static spdlog::level::level_enum
convert_loglevel(LogLevel level)
{
    auto slev = spdlog::level::info;
    switch (level)
    {
    case LogLevel::LVL_FATAL:
        slev = spdlog::level::critical;
        break;
    case LogLevel::LVL_ERROR:
        slev = spdlog::level::err;
        break;
    case LogLevel::LVL_WARNING:
        slev = spdlog::level::warn;
        break;
    case LogLevel::LVL_INFO:
        slev = spdlog::level::info;
        break;
    case LogLevel::LVL_DEBUG:
        slev = spdlog::level::debug;
        break;
    case LogLevel::LVL_TRACE:
        slev = spdlog::level::trace;
        break;
    default:
        break;
    }
    return slev;
}

void
Logging::init(bool truncate)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (!mInitialized)
    {
        using namespace spdlog::sinks;
        using std::make_shared;
        using std::shared_ptr;

        std::vector<shared_ptr<sink>> sinks{make_shared<stderr_sink_mt>()};

        if (!mLastFilename.empty())
        {
            // spdlog opens its file in "wb" mode when asked to truncate,
            // which drops O_APPEND. Truncate here and always let spdlog
            // append, so that external log rotation keeps working.
            std::ofstream out;
            if (truncate)
            {
                out.open(mLastFilename,
                         std::ios_base::out | std::ios_base::trunc);
            }
            else
            {
                out.open(mLastFilename,
                         std::ios_base::out | std::ios_base::app);
            }

            if (out.fail())
            {
                throw std::runtime_error(fmt::format(
                    FMT_STRING("Could not open log file {}, check access "
                               "rights"),
                    mLastFilename));
            }
            out.close();

            sinks.emplace_back(make_shared<basic_file_sink_mt>(
                mLastFilename, /*truncate=*/false));
        }

        auto makeLogger =
            [&](std::string const& name) -> shared_ptr<spdlog::logger> {
            auto logger =
                make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            spdlog::register_logger(logger);
            return logger;
        };

        spdlog::set_default_logger(makeLogger("default"));
        for (auto const& partition : kPartitionNames)
        {
            makeLogger(partition);
        }
        if (mLastPattern.empty())
        {
            mLastPattern = "%Y-%m-%dT%H:%M:%S.%e [%^%n %l%$] %v";
        }
        spdlog::set_pattern(mLastPattern);
        spdlog::set_level(convert_loglevel(mGlobalLogLevel));
        for (auto const& pair : mPartitionLogLevels)
        {
            spdlog::get(pair.first)->set_level(convert_loglevel(pair.second));
        }
        spdlog::flush_on(spdlog::level::err);
        mInitialized = true;
    }
}

void
Logging::deinit()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (mInitialized)
    {
#define LOG_PARTITION(name) Logging::name##LogPtr = nullptr;
#include "util/LogPartitions.def"
#undef LOG_PARTITION
        spdlog::drop_all();
        mInitialized = false;
    }
}

void
Logging::setLoggingToFile(std::string const& filename)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mLastFilename = filename;
    deinit();
    try
    {
        init();
    }
    catch (std::runtime_error const&)
    {
        // Could not initialize logging to file, fallback on
        // console-only logging and throw
        mLastFilename.clear();
        deinit();
        init();
        throw;
    }
}

void
Logging::setLogLevel(LogLevel level, const char* partition)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (partition)
    {
        mPartitionLogLevels[normalizePartition(partition)] = level;
    }
    else
    {
        mGlobalLogLevel = level;
        mPartitionLogLevels.clear();
    }
    init();
    auto slev = convert_loglevel(level);
    if (partition)
    {
        spdlog::get(normalizePartition(partition))->set_level(slev);
    }
    else
    {
        spdlog::set_level(slev);
    }
}

LogLevel
Logging::getLLfromString(std::string const& levelName)
{
    if (iequals(levelName, "fatal"))
    {
        return LogLevel::LVL_FATAL;
    }

    if (iequals(levelName, "error"))
    {
        return LogLevel::LVL_ERROR;
    }

    if (iequals(levelName, "warning"))
    {
        return LogLevel::LVL_WARNING;
    }

    if (iequals(levelName, "debug"))
    {
        return LogLevel::LVL_DEBUG;
    }

    if (iequals(levelName, "trace"))
    {
        return LogLevel::LVL_TRACE;
    }

    return LogLevel::LVL_INFO;
}

LogLevel
Logging::getLogLevel(std::string const& partition)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    auto p = mPartitionLogLevels.find(partition);
    if (p != mPartitionLogLevels.end())
    {
        return p->second;
    }
    return mGlobalLogLevel;
}

std::string
Logging::getStringFromLL(LogLevel level)
{
    switch (level)
    {
    case LogLevel::LVL_FATAL:
        return "Fatal";
    case LogLevel::LVL_ERROR:
        return "Error";
    case LogLevel::LVL_WARNING:
        return "Warning";
    case LogLevel::LVL_INFO:
        return "Info";
    case LogLevel::LVL_DEBUG:
        return "Debug";
    case LogLevel::LVL_TRACE:
        return "Trace";
    }
    return "????";
}

// throws if partition name is not recognized
std::string
Logging::normalizePartition(std::string const& partition)
{
    for (auto& p : kPartitionNames)
    {
        if (iequals(partition, p))
        {
            return p;
        }
    }
    throw std::invalid_argument("not a valid partition");
}

std::recursive_mutex Logging::mLogMutex;

// Partition loggers are created lazily so that code logging before
// Logging::init() still gets a usable logger.
#define LOG_PARTITION(name) \
    LogPtr Logging::name##LogPtr = nullptr; \
    LogPtr Logging::get##name##LogPtr() \
    { \
        std::lock_guard<std::recursive_mutex> guard(mLogMutex); \
        if (!name##LogPtr) \
        { \
            init(); \
            name##LogPtr = spdlog::get(#name); \
        } \
        return name##LogPtr; \
    }
#include "util/LogPartitions.def"
#undef LOG_PARTITION
}
