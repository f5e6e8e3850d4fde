#pragma once
/**
 * @file timer.hpp
 * @brief Timer sources and the Sleep future.
 *
 * A Timer answers "what time is it" and "wake me at T". Two implementations:
 *  - SteadyTimer: std::chrono::steady_clock; due wakers are fired by the driver
 *    (rt::block_on) through fire_due(). Safe to register from any thread.
 *  - ManualTimer: time moves only through advance(); used for deterministic
 *    simulation and tests. Single-threaded.
 * Registrations are keyed (TimerKey) so an abandoned wait can be cancelled
 * instead of firing a stale waker later.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

#include "steer/async/poll.hpp"
#include "steer/async/waker.hpp"

namespace steer::time {

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration  = Clock::duration;

/** @struct TimerKey
 *  @brief Identifies one registration; orders by deadline, then registration order.
 */
struct TimerKey {
    TimePoint     deadline;
    std::uint64_t seq{0};

    friend bool operator<(const TimerKey& a, const TimerKey& b) noexcept {
        return a.deadline != b.deadline ? a.deadline < b.deadline : a.seq < b.seq;
    }
    bool operator==(const TimerKey&) const = default;
};

/** @class Timer
 *  @brief Time source + wakeup registration.
 */
class Timer {
public:
    virtual ~Timer() = default;
    /// Current time on this timer's clock.
    virtual TimePoint now() const = 0;
    /**
     * @brief Wake `w` once now() >= deadline.
     * @return Key for cancel(), or nullopt when `w` was woken on the spot.
     */
    virtual std::optional<TimerKey> register_waker(TimePoint deadline, async::Waker w) = 0;
    /// Drop a registration that has not fired yet. Unknown or fired keys are ignored.
    virtual void cancel(const TimerKey& key) = 0;
};

/** @class TimerQueue
 *  @brief Earliest-deadline-first set of pending wakers. Not synchronized.
 */
class TimerQueue final {
public:
    TimerKey push(TimePoint deadline, async::Waker w);

    /// Remove every entry due at `now` (deadline <= now), in deadline order.
    std::vector<async::Waker> take_due(TimePoint now);

    /// @return true if `key` was still queued.
    bool cancel(const TimerKey& key);

    /// Earliest pending deadline, if any.
    [[nodiscard]] std::optional<TimePoint> next_deadline() const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::map<TimerKey, async::Waker> entries_;
    std::uint64_t next_seq_{1};
};

/** @class SteadyTimer
 *  @brief Wall-monotonic timer. Thread-safe.
 */
class SteadyTimer final : public Timer {
public:
    TimePoint now() const override { return Clock::now(); }
    std::optional<TimerKey> register_waker(TimePoint deadline, async::Waker w) override;
    void cancel(const TimerKey& key) override;

    /// Wake all due entries (outside the lock). @return number woken.
    std::size_t fire_due();

    [[nodiscard]] std::optional<TimePoint> next_deadline() const;
    [[nodiscard]] std::size_t pending() const;

private:
    mutable std::mutex mu_;
    TimerQueue         queue_;
};

/** @class ManualTimer
 *  @brief Virtual clock for simulation. Not thread-safe.
 */
class ManualTimer final : public Timer {
public:
    explicit ManualTimer(TimePoint start = TimePoint{}) noexcept : now_(start) {}

    TimePoint now() const override { return now_; }

    /// Deadlines already reached wake immediately and are not queued.
    std::optional<TimerKey> register_waker(TimePoint deadline, async::Waker w) override;
    void cancel(const TimerKey& key) override { queue_.cancel(key); }

    /// Move time forward by `d` and fire due wakers. @return number woken.
    std::size_t advance(Duration d);

    [[nodiscard]] std::size_t pending() const noexcept { return queue_.size(); }

private:
    TimePoint  now_;
    TimerQueue queue_;
};

/** @class Sleep
 *  @brief Future that resolves once the timer reaches `deadline`.
 *
 * Holds at most one registration on its timer. Re-polling with another waker
 * replaces it; resolving or destroying the Sleep cancels it, so a race won by
 * the other side leaves nothing queued. Move-only for that reason.
 *
 *  @note The timer must outlive the Sleep.
 */
class Sleep final {
public:
    using output_type = std::monostate;

    Sleep(Timer& timer, TimePoint deadline) noexcept : timer_(&timer), deadline_(deadline) {}
    ~Sleep() { release(); }

    Sleep(Sleep&& other) noexcept;
    Sleep& operator=(Sleep&& other) noexcept;
    Sleep(const Sleep&)            = delete;
    Sleep& operator=(const Sleep&) = delete;

    /// Sleep until timer.now() + d.
    static Sleep after(Timer& timer, Duration d) { return Sleep(timer, timer.now() + d); }

    async::Poll<std::monostate> poll(async::Context& cx);

    [[nodiscard]] TimePoint deadline() const noexcept { return deadline_; }
    [[nodiscard]] bool is_elapsed() const { return timer_->now() >= deadline_; }

private:
    void release() noexcept;

    Timer*                  timer_;
    TimePoint               deadline_;
    async::Waker            registered_;  ///< Waker behind key_
    std::optional<TimerKey> key_;         ///< Live registration, if any
};

} // namespace steer::time
