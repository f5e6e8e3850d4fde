/**
 * @file error.cpp
 * @brief Labels for steer::Errc.
 */
#include "steer/error.hpp"

namespace steer {

std::string_view to_string(Errc code) noexcept {
    switch (code) {
        case Errc::Elapsed:     return "elapsed";
        case Errc::Unavailable: return "unavailable";
        case Errc::Failed:      return "failed";
    }
    return "unknown";
}

} // namespace steer
