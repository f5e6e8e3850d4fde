#pragma once
/**
 * @file service.hpp
 * @brief The handler contract consumed (and implemented) by the combinator.
 *
 * A Service<S, Req> exposes:
 *   - poll_ready(Context&) -> Poll<Result<void, error_type>>
 *       Non-blocking. Pending registers the context's waker.
 *   - call(Req) -> future_type
 *       Only legal right after poll_ready returned Ready(Ok). Consumes the
 *       request; future_type resolves to Result<response_type, error_type>.
 */

#include <concepts>
#include <utility>

#include "steer/async/future.hpp"
#include "steer/error.hpp"
#include "steer/util/contract.hpp"

namespace steer {

using async::Context;
using async::Poll;

template <class S, class Req>
concept Service = requires(S& s, Context& cx, Req req) {
    typename S::response_type;
    typename S::error_type;
    typename S::future_type;
    requires async::FutureLike<typename S::future_type>;
    requires std::same_as<async::output_of<typename S::future_type>,
                          Result<typename S::response_type, typename S::error_type>>;
    { s.poll_ready(cx) } -> std::same_as<Poll<Result<void, typename S::error_type>>>;
    { s.call(std::move(req)) } -> std::same_as<typename S::future_type>;
};

/**
 * @class ServiceReady
 * @brief Resolves once the borrowed service reports ready (or fails to).
 * @note The service must outlive the future.
 */
template <class S, class Req>
    requires Service<S, Req>
class ServiceReady final {
public:
    using output_type = Result<void, typename S::error_type>;

    explicit ServiceReady(S& svc) noexcept : svc_(&svc) {}

    Poll<output_type> poll(Context& cx) {
        util::require(svc_ != nullptr, "ServiceReady polled after completion");
        auto p = svc_->poll_ready(cx);
        if (p.is_ready()) svc_ = nullptr;
        return p;
    }

private:
    S* svc_;
};

/// Future that waits for `svc` to become ready: block_on(ready<Req>(svc)), then svc.call(req).
template <class Req, class S>
    requires Service<S, Req>
ServiceReady<S, Req> ready(S& svc) noexcept {
    return ServiceReady<S, Req>(svc);
}

} // namespace steer
