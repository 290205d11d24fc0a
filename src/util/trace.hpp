#pragma once

// Developer tracing. Compiled in with -DMENDER_TRACE=ON; otherwise the
// branch is dead and the optimizer drops it, arguments included.

#include <fmt/format.h>

#include <cstdio>

#ifndef MENDER_TRACE_ENABLE
#define MENDER_TRACE_ENABLE 0
#endif

#define MENDER_TRACE(...)                 \
    if (MENDER_TRACE_ENABLE) {            \
        fmt::print(stderr, __VA_ARGS__);  \
    }
