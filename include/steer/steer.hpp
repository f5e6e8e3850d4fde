#pragma once
/**
 * @file steer.hpp
 * @brief Steer: routes each request to one of a fixed set of services chosen by a picker.
 *
 * Steer is itself a Service. It accepts new requests, then:
 *  1. Waits (in poll_ready) for *all* services to be ready.
 *  2. Determines, via the picker, which service the request corresponds to.
 *  3. Calls that service and returns its future, boxed.
 *
 * Waiting for every service is deliberate: the picker may choose any index, so
 * readiness has to be guaranteed for all of them before call(). A service that
 * is slow to become ready therefore blocks dispatch to every other service
 * (head-of-line blocking) unless the services are always ready.
 *
 * Invariants:
 *  - ready_[i] is true iff services_[i] reported ready since its last call.
 *  - call() requires a picked index < size() and ready_[index]; both are fatal
 *    contract checks.
 *
 * Thread-safety: single owner, sequential access. No internal locking.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "steer/async/future.hpp"
#include "steer/compat/expected.hpp"
#include "steer/error.hpp"
#include "steer/obs/observability.hpp"
#include "steer/routing/picker.hpp"
#include "steer/service.hpp"
#include "steer/util/contract.hpp"

namespace steer {

/// Construction errors for Steer.
enum class SteerError : std::uint8_t {
    NoServices = 1 ///< The service set was empty
};

template <class S, class P, class Req>
    requires Service<S, Req> && routing::Picker<P, S, Req>
class Steer final {
public:
    using request_type  = Req;
    using response_type = typename S::response_type;
    using error_type    = typename S::error_type;
    using future_type   = async::BoxFuture<Result<response_type, error_type>>;

    /**
     * @brief Build a Steer over `services`; their order is the picker's index space.
     * @param services Non-empty set of services. Fixed for the lifetime of the Steer.
     * @param picker   Maps (request, services) to an index.
     * @param observer Optional event sink (nullptr = silent).
     * @return The combinator, or SteerError::NoServices for an empty set.
     */
    static steer_detail::expected<Steer, SteerError>
    with_services(std::vector<S> services, P picker, obs::Observer* observer = nullptr) {
        if (services.empty()) {
            return steer_detail::unexpected(SteerError::NoServices);
        }
        return Steer(std::move(services), std::move(picker), observer);
    }

    Steer(Steer&&) noexcept            = default;
    Steer(const Steer&)                = delete;
    Steer& operator=(const Steer&)     = delete;

    /**
     * @brief Ready once every service is ready.
     *
     * Services already flagged ready are not polled again. The first service
     * that is pending suspends the whole check (its waker registration drives
     * the retry); the first one that fails ends the check with its error and
     * later services are not polled.
     */
    Poll<Result<void, error_type>> poll_ready(Context& cx) {
        for (std::size_t i = 0; i < services_.size(); ++i) {
            if (ready_[i]) continue;

            auto p = services_[i].poll_ready(cx);
            if (p.is_pending()) {
                obs::notify(observer_, {obs::EventKind::ReadinessPending, i, services_.size(), "service_not_ready"});
                return async::pending;
            }
            auto r = p.take();
            if (!r) {
                obs::notify(observer_, {obs::EventKind::ReadinessFailed, i, services_.size(), "service_poll_ready_failed"});
                return Result<void, error_type>{steer_detail::unexpected(std::move(r.error()))};
            }
            ready_[i] = true;
        }
        obs::notify(observer_, {obs::EventKind::Ready, 0, services_.size(), "all_services_ready"});
        return Result<void, error_type>{};
    }

    /**
     * @brief Route `req` to the picked service and hand back its future.
     * @pre poll_ready() returned Ready(Ok) and the picked service has not been
     *      called since. Violations abort.
     */
    future_type call(Req req) {
        const std::size_t idx = routing::pick<S, Req>(picker_, req, services());
        util::require(idx < services_.size(), "picker returned an out-of-range service index");
        util::require(ready_[idx], "call() without a fresh poll_ready() for the picked service");

        // Consumed: this service must be polled ready again before its next call.
        ready_[idx] = false;
        obs::notify(observer_, {obs::EventKind::Dispatch, idx, services_.size(), "picked"});
        return async::box(services_[idx].call(std::move(req)));
    }

    /// Number of services.
    [[nodiscard]] std::size_t size() const noexcept { return services_.size(); }

    /// Read-only view of the services, in picker index order.
    [[nodiscard]] std::span<const S> services() const noexcept { return {services_.data(), services_.size()}; }

    P&       picker() noexcept       { return picker_; }
    const P& picker() const noexcept { return picker_; }

private:
    Steer(std::vector<S> services, P picker, obs::Observer* observer)
        : picker_(std::move(picker)),
          services_(std::move(services)),
          ready_(services_.size(), false),
          observer_(observer) {}

    P                 picker_;
    std::vector<S>    services_;
    std::vector<bool> ready_;     ///< Parallel to services_
    obs::Observer*    observer_;  ///< Not owned; may be null
};

/// Deduce the Steer type from its arguments: make_steer<Req>(services, picker).
template <class Req, class S, class P>
    requires Service<S, Req> && routing::Picker<P, S, Req>
steer_detail::expected<Steer<S, P, Req>, SteerError>
make_steer(std::vector<S> services, P picker, obs::Observer* observer = nullptr) {
    return Steer<S, P, Req>::with_services(std::move(services), std::move(picker), observer);
}

} // namespace steer
