#pragma once
/**
 * @file error.hpp
 * @brief Common error vocabulary and the Result alias.
 * @details Services are free to use their own error type; the combinator passes
 *          it through untouched. Error is the shared type for the timer-facing
 *          wrappers (deadline race, timeout service), which add Errc::Elapsed.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "steer/compat/expected.hpp"  // steer_detail::expected / unexpected

namespace steer {

/// Outcome of a fallible operation: value or error E.
template <class T, class E>
using Result = steer_detail::expected<T, E>;

/**
 * @enum Errc
 * @brief Error categories carried by steer::Error.
 */
enum class Errc : std::uint8_t {
    Elapsed = 1,  ///< Deadline fired before the operation completed
    Unavailable,  ///< Service cannot take work (readiness failure)
    Failed        ///< Operation completed with a failure
};

/// Stable lowercase name for an error code ("elapsed", "unavailable", ...).
std::string_view to_string(Errc code) noexcept;

/**
 * @struct Error
 * @brief Error value: a code plus a human-readable message.
 */
struct Error {
    Errc        code{Errc::Failed}; ///< Category
    std::string message;            ///< Detail for logs; may be empty

    /// The distinguished deadline error.
    static Error elapsed() { return Error{Errc::Elapsed, "deadline elapsed"}; }

    /// True when produced by a deadline race.
    [[nodiscard]] bool is_elapsed() const noexcept { return code == Errc::Elapsed; }

    bool operator==(const Error&) const = default;
};

/**
 * @brief Convert a service error into steer::Error.
 * @details Identity for Error; any other E must be convertible to Error.
 */
template <class E>
Error into_error(E&& e) {
    using D = std::remove_cvref_t<E>;
    if constexpr (std::is_same_v<D, Error>) {
        return std::forward<E>(e);
    } else {
        static_assert(std::is_convertible_v<E, Error>,
                      "service error type must convert to steer::Error");
        return static_cast<Error>(std::forward<E>(e));
    }
}

} // namespace steer
