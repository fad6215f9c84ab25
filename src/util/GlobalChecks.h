// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#pragma once

namespace txbuild
{
// Logs the failed expression on the default logger, then aborts.
[[noreturn]] void printAssertFailureAndAbort(const char* s1, const char* file,
                                             int line);

// Checks an internal invariant of the builder, never user input. Unlike
// `assert()` it stays on when NDEBUG is defined.
#define releaseAssert(e) \
    (static_cast<bool>(e) \
         ? void(0) \
         : txbuild::printAssertFailureAndAbort(#e, __FILE__, __LINE__))
}
