// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transactions/TxBuildError.h"
#include "crypto/CryptoError.h"
#include "crypto/KeyUtils.h"

#include <fmt/format.h>
#include <xdrpp/types.h>

namespace txbuild
{

void
rethrowWithContext(std::string const& context)
{
    try
    {
        throw;
    }
    catch (ConfigError const& e)
    {
        throw ConfigError(fmt::format("{}: {}", context, e.what()));
    }
    catch (ValidationError const& e)
    {
        throw ValidationError(fmt::format("{}: {}", context, e.what()));
    }
    catch (EncodingError const& e)
    {
        throw EncodingError(fmt::format("{}: {}", context, e.what()));
    }
    catch (SequenceError const& e)
    {
        throw SequenceError(fmt::format("{}: {}", context, e.what()));
    }
    catch (TxBuildError const& e)
    {
        throw TxBuildError(fmt::format("{}: {}", context, e.what()));
    }
    catch (CryptoError const& e)
    {
        throw CryptoError(fmt::format("{}: {}", context, e.what()));
    }
    catch (xdr::xdr_runtime_error const& e)
    {
        throw EncodingError(fmt::format("{}: {}", context, e.what()));
    }
    catch (KeyUtils::InvalidStrKey const& e)
    {
        throw EncodingError(fmt::format("{}: {}", context, e.what()));
    }
    catch (std::exception const& e)
    {
        throw TxBuildError(fmt::format("{}: {}", context, e.what()));
    }
}
}
