#pragma once

#include <stdexcept>
#include <string>

#include <plog/Log.h>

/**
 * @brief Checks an internal consistency condition.
 * @remark Debug builds throw `std::logic_error` when the condition fails.  Release builds log the
 * failure and run `onFailure` in the enclosing scope, so it may be `continue` or `return`.
 */
#ifndef NDEBUG
#define RELAYDECK_INVARIANT(condition, message, onFailure)                           \
    if (!(condition))                                                                \
    {                                                                                \
        throw std::logic_error(std::string("Invariant violated: ") + (message));     \
    }                                                                                \
    else                                                                             \
        (void)0
#else
#define RELAYDECK_INVARIANT(condition, message, onFailure)                           \
    if (!(condition))                                                                \
    {                                                                                \
        PLOG_ERROR << "Invariant violated: " << (message);                           \
        onFailure;                                                                   \
    }                                                                                \
    else                                                                             \
        (void)0
#endif
