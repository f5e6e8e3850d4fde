#pragma once
/**
 * @file block_on.hpp
 * @brief Drive one future to completion on the calling thread.
 *
 * The future is polled with a waker that unparks this thread. While pending,
 * the thread sleeps until woken or until the SteadyTimer's next deadline, fires
 * due timers and polls again. Futures that sleep on a SteadyTimer need that
 * timer passed in, otherwise nothing fires their wakers.
 */

#include <condition_variable>
#include <memory>
#include <mutex>
#include <type_traits>

#include "steer/async/future.hpp"
#include "steer/time/timer.hpp"

namespace steer::rt {

namespace detail {
    /// One-shot wakeup flag shared between the driver and its waker.
    struct Parker {
        std::mutex              mu;
        std::condition_variable cv;
        bool                    notified{false};

        void unpark();
    };

    /// Block until `p` is unparked, firing `timer` (may be null) when due.
    void park(Parker& p, time::SteadyTimer* timer);
}

template <class F>
    requires async::FutureLike<std::remove_cvref_t<F>>
async::output_of<std::remove_cvref_t<F>> block_on(F&& fut, time::SteadyTimer* timer = nullptr) {
    auto parker = std::make_shared<detail::Parker>();
    const async::Waker waker([parker] { parker->unpark(); });
    async::Context cx(waker);
    for (;;) {
        auto p = fut.poll(cx);
        if (p.is_ready()) return p.take();
        detail::park(*parker, timer);
    }
}

} // namespace steer::rt
