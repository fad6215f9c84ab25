// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <cstdlib>

namespace txbuild
{

void
printAssertFailureAndAbort(const char* s1, const char* file, int line)
{
    auto lg = DEFAULT_LOG;
    lg->critical("assertion failed: {} at {}:{}", s1, file, line);
    lg->flush();
    std::abort();
}
}
