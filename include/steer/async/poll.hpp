#pragma once
/**
 * @file poll.hpp
 * @brief Poll<T>: outcome of one non-blocking poll (ready with a value, or pending).
 */

#include <optional>
#include <utility>

#include "steer/util/contract.hpp"

namespace steer::async {

/// Tag for "not yet, wait for the waker".
struct Pending final {};
inline constexpr Pending pending{};

/**
 * @class Poll
 * @brief Either Ready(T) or Pending. Pending means the poller registered the
 *        waker of the current Context and will be re-polled once it fires.
 */
template <class T>
class Poll final {
public:
    using value_type = T;

    Poll(Pending) noexcept {}
    Poll(T value) : value_(std::move(value)) {}

    [[nodiscard]] bool is_ready() const noexcept { return value_.has_value(); }
    [[nodiscard]] bool is_pending() const noexcept { return !value_.has_value(); }

    T&       value() &       { util::require(value_.has_value(), "value() on pending Poll"); return *value_; }
    const T& value() const & { util::require(value_.has_value(), "value() on pending Poll"); return *value_; }

    /// Move the ready value out.
    T take() {
        util::require(value_.has_value(), "take() on pending Poll");
        return std::move(*value_);
    }

private:
    std::optional<T> value_;
};

} // namespace steer::async
