/**
 * @file block_on.cpp
 * @brief Parking for rt::block_on.
 */
#include "steer/rt/block_on.hpp"
#include "steer/config/constants.hpp"

#include <chrono>

namespace steer::rt::detail {

void Parker::unpark() {
    {
        std::lock_guard<std::mutex> lk(mu);
        notified = true;
    }
    cv.notify_one();
}

void park(Parker& p, time::SteadyTimer* timer) {
    using steer::config::constants::DRIVER_IDLE_WAIT_MS;
    for (;;) {
        // Timer wakers call unpark(); fire them before taking our lock.
        if (timer) timer->fire_due();

        std::unique_lock<std::mutex> lk(p.mu);
        const auto woken = [&p] { return p.notified; };
        const auto next = timer ? timer->next_deadline() : std::nullopt;
        if (next) {
            p.cv.wait_until(lk, *next, woken);
        } else {
            p.cv.wait_for(lk, std::chrono::milliseconds{DRIVER_IDLE_WAIT_MS}, woken);
        }
        if (p.notified) {
            p.notified = false;
            return;
        }
    }
}

} // namespace steer::rt::detail
