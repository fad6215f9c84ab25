#pragma once

// Copyright 2019 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <stdexcept>
#include <string>

namespace txbuild
{

// Common base of every error raised while building, signing or encoding a
// transaction. Crypto failures keep their own CryptoError type.
class TxBuildError : public std::runtime_error
{
  public:
    explicit TxBuildError(std::string const& msg) : std::runtime_error(msg)
    {
    }
};

// The caller did not make a required choice (timebounds) or passed an
// unusable configuration value.
class ConfigError : public TxBuildError
{
  public:
    using TxBuildError::TxBuildError;
};

// A business rule of the transaction or of one of its operations does not
// hold.
class ValidationError : public TxBuildError
{
  public:
    using TxBuildError::TxBuildError;
};

// Addresses, memos, asset codes, base64 and XDR that cannot be encoded or
// decoded.
class EncodingError : public TxBuildError
{
  public:
    using TxBuildError::TxBuildError;
};

// The source account could not provide a sequence number.
class SequenceError : public TxBuildError
{
  public:
    using TxBuildError::TxBuildError;
};

// Must be called from within a catch block. Rethrows the exception being
// handled as the same category, with "<context>: " prepended to its message.
// Exceptions from the codec or from key parsing become EncodingError; any
// other std::exception becomes a plain TxBuildError.
[[noreturn]] void rethrowWithContext(std::string const& context);
}
