/**
 * @file contract.cpp
 * @brief Abort path for util::require.
 */
#include "steer/util/contract.hpp"
#include <cstdio>
#include <cstdlib>

namespace steer::util {

    void contract_violation(const char* msg, const std::source_location& where) noexcept {
        std::fprintf(stderr, "%s:%u: contract violated: %s [%s]\n",
                     where.file_name(), static_cast<unsigned>(where.line()),
                     msg ? msg : "", where.function_name());
        std::fflush(stderr);
        std::abort();
    }

} // namespace steer::util
