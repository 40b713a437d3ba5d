#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that stays enabled in release builds.
 *
 * Reserved for invariants whose violation means a bug inside the library (a lease used after
 * release, an accessor called on the wrong Result alternative). Caller input is validated with
 * Result<T, LightingError> instead.
 *
 * When an assertion fails it logs a CRITICAL message with file, line and condition, then
 * aborts.
 */
#define SWEEPLIGHT_ASSERT(condition, message)                                               \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
