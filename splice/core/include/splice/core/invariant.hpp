/**
 * @file invariant.hpp
 * @brief Invariant checks for programming defects
 *
 * A violated invariant is logged as critical. Builds that define
 * SPLICE_FATAL_INVARIANTS (Debug by default) abort right there; other
 * builds return false so the caller can clamp and carry on.
 */

#pragma once

#include <splice/core/logger.hpp>

#include <cstdlib>

namespace spl::detail {

inline bool invariantFailed(const char* expr, const char* message,
                            const char* file, int line) {
    LOG_CRITICAL("Invariant violated: {} ({}) at {}:{}", message, expr, file, line);
#ifdef SPLICE_FATAL_INVARIANTS
    getLogger()->flush();
    std::abort();
#else
    return false;
#endif
}

} // namespace spl::detail

/// Evaluates to true when cond holds, false (after logging) otherwise
#define SPLICE_INVARIANT(cond, message) \
    ((cond) ? true : ::spl::detail::invariantFailed(#cond, message, __FILE__, __LINE__))
