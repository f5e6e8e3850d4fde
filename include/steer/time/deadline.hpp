#pragma once
/**
 * @file deadline.hpp
 * @brief DeadlineFuture: races an operation against a Sleep.
 *
 * Every poll checks the operation first and the timer second, so an operation
 * that is ready in the same pass as the timer wins. Once the timer wins the
 * operation is abandoned (destroyed with the DeadlineFuture).
 *
 * Output: Result<T, steer::Error>. Operation errors are converted with
 * into_error(); a lost race yields Error::elapsed().
 */

#include <type_traits>
#include <utility>

#include "steer/async/future.hpp"
#include "steer/error.hpp"
#include "steer/obs/observability.hpp"
#include "steer/time/timer.hpp"
#include "steer/util/contract.hpp"

namespace steer::time {

template <async::FutureLike F>
class DeadlineFuture final {
    using inner_output = async::output_of<F>;
    using value_type   = typename inner_output::value_type;

public:
    using output_type = Result<value_type, Error>;

    DeadlineFuture(F response, Sleep sleep, obs::Observer* observer = nullptr)
        : response_(std::move(response)), sleep_(std::move(sleep)), observer_(observer) {}

    /// Race `response` against timer.now() + d.
    static DeadlineFuture within(Timer& timer, Duration d, F response,
                                 obs::Observer* observer = nullptr) {
        return DeadlineFuture(std::move(response), Sleep::after(timer, d), observer);
    }

    async::Poll<output_type> poll(async::Context& cx) {
        util::require(!done_, "DeadlineFuture polled after completion");

        // First, try polling the operation
        auto r = response_.poll(cx);
        if (r.is_ready()) {
            done_ = true;
            auto v = r.take();
            if (!v) return output_type{steer_detail::unexpected(into_error(std::move(v.error())))};
            if constexpr (std::is_void_v<value_type>) {
                return output_type{};
            } else {
                return output_type{std::move(*v)};
            }
        }

        // Now check the timer
        if (sleep_.poll(cx).is_pending()) return async::pending;

        done_ = true;
        obs::notify(observer_, {obs::EventKind::DeadlineElapsed, 0, 0, "deadline_elapsed"});
        return output_type{steer_detail::unexpected(Error::elapsed())};
    }

    [[nodiscard]] TimePoint deadline() const noexcept { return sleep_.deadline(); }

private:
    F              response_;
    Sleep          sleep_;
    obs::Observer* observer_;
    bool           done_{false};
};

} // namespace steer::time
