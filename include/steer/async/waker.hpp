#pragma once
/**
 * @file waker.hpp
 * @brief Waker and Context handed to every poll.
 * @details A Waker is a cheap, copyable handle; copies share the same callback.
 *          wake() may be called from any thread, any number of times.
 */

#include <functional>
#include <memory>
#include <utility>

namespace steer::async {

class Waker final {
public:
    /// No-op waker.
    Waker() = default;

    explicit Waker(std::function<void()> fn)
        : fn_(std::make_shared<const std::function<void()>>(std::move(fn))) {}

    /// Ask the owner of this waker to poll again.
    void wake() const {
        if (fn_ && *fn_) (*fn_)();
    }

    /// True if both handles wake the same task.
    [[nodiscard]] bool will_wake(const Waker& other) const noexcept { return fn_ == other.fn_; }

    static Waker noop() { return Waker{}; }

private:
    std::shared_ptr<const std::function<void()>> fn_;
};

/**
 * @class Context
 * @brief Per-poll context. Borrowed; never store it, clone the waker instead.
 */
class Context final {
public:
    explicit Context(const Waker& waker) noexcept : waker_(&waker) {}

    [[nodiscard]] const Waker& waker() const noexcept { return *waker_; }

private:
    const Waker* waker_;
};

} // namespace steer::async
