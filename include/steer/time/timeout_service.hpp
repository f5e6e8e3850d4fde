#pragma once
/**
 * @file timeout_service.hpp
 * @brief TimeoutService: a Service whose every call is raced against a fixed deadline.
 * @details The deadline is armed when call() runs, not when the future is first
 *          polled. Errors from the inner service are converted to steer::Error.
 */

#include <utility>

#include "steer/error.hpp"
#include "steer/obs/observability.hpp"
#include "steer/service.hpp"
#include "steer/time/deadline.hpp"
#include "steer/time/timer.hpp"

namespace steer::time {

template <class S, class Req>
    requires Service<S, Req>
class TimeoutService final {
public:
    using response_type = typename S::response_type;
    using error_type    = Error;
    using future_type   = DeadlineFuture<typename S::future_type>;

    /// @note `timer` must outlive the service and every future it returns.
    TimeoutService(S inner, Timer& timer, Duration timeout, obs::Observer* observer = nullptr)
        : inner_(std::move(inner)), timer_(&timer), timeout_(timeout), observer_(observer) {}

    Poll<Result<void, Error>> poll_ready(Context& cx) {
        auto p = inner_.poll_ready(cx);
        if (p.is_pending()) return async::pending;
        auto r = p.take();
        if (!r) return Result<void, Error>{steer_detail::unexpected(into_error(std::move(r.error())))};
        return Result<void, Error>{};
    }

    future_type call(Req req) {
        return future_type(inner_.call(std::move(req)), Sleep::after(*timer_, timeout_), observer_);
    }

    [[nodiscard]] Duration timeout() const noexcept { return timeout_; }
    S&       inner() noexcept       { return inner_; }
    const S& inner() const noexcept { return inner_; }

private:
    S              inner_;
    Timer*         timer_;
    Duration       timeout_;
    obs::Observer* observer_;
};

} // namespace steer::time
