#pragma once
/**
 * @file contract.hpp
 * @brief Fatal contract checks for caller/picker logic errors.
 * @details A failed contract is a bug in the calling code, not a runtime condition:
 *          the diagnostic goes to stderr and the process aborts. Active in every
 *          build type (unlike assert).
 */

#include <source_location>

namespace steer::util {

    /// Print "<file>:<line>: contract violated: <msg> [<function>]" and abort.
    [[noreturn]] void contract_violation(const char* msg, const std::source_location& where) noexcept;

    /// Abort through contract_violation() unless `cond` holds.
    inline void require(bool cond, const char* msg,
                        const std::source_location where = std::source_location::current()) noexcept {
        if (!cond) contract_violation(msg, where);
    }

} // namespace steer::util
