/**
 * @file expected.hpp
 * @brief steer_detail::expected / unexpected: the value-or-error carrier behind steer::Result.
 *
 * Resolves to std::expected when the standard library ships it
 * (__cpp_lib_expected, checked through <version>), otherwise to the
 * header-only tl::expected, which the build locates on the include path.
 * Code outside this header spells the type steer_detail::expected, or
 * steer::Result<T, E> once error.hpp is included.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>

namespace steer_detail {
    template <class T, class E> using expected   = std::expected<T, E>;
    template <class E>          using unexpected = std::unexpected<E>;
} // namespace steer_detail

#else
#include <tl/expected.hpp>

namespace steer_detail {
    template <class T, class E> using expected   = tl::expected<T, E>;
    template <class E>          using unexpected = tl::unexpected<E>;
} // namespace steer_detail

#endif
