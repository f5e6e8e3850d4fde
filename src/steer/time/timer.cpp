/**
 * @file timer.cpp
 * @brief TimerQueue, SteadyTimer, ManualTimer and Sleep.
 */
#include "steer/time/timer.hpp"

#include <utility>

namespace steer::time {

//------------------------------- TimerQueue -----------------------------------

TimerKey TimerQueue::push(TimePoint deadline, async::Waker w) {
    const TimerKey key{deadline, next_seq_++};
    entries_.emplace(key, std::move(w));
    return key;
}

std::vector<async::Waker> TimerQueue::take_due(TimePoint now) {
    std::vector<async::Waker> due;
    auto it = entries_.begin();
    while (it != entries_.end() && it->first.deadline <= now) {
        due.push_back(std::move(it->second));
        it = entries_.erase(it);
    }
    return due;
}

bool TimerQueue::cancel(const TimerKey& key) {
    return entries_.erase(key) > 0;
}

std::optional<TimePoint> TimerQueue::next_deadline() const {
    if (entries_.empty()) return std::nullopt;
    return entries_.begin()->first.deadline;
}

//------------------------------- SteadyTimer ----------------------------------

std::optional<TimerKey> SteadyTimer::register_waker(TimePoint deadline, async::Waker w) {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.push(deadline, std::move(w));
}

void SteadyTimer::cancel(const TimerKey& key) {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.cancel(key);
}

std::size_t SteadyTimer::fire_due() {
    std::vector<async::Waker> due;
    {
        std::lock_guard<std::mutex> lk(mu_);
        due = queue_.take_due(Clock::now());
    }
    // Wake without the lock: a woken task may re-register right away.
    for (const auto& w : due) w.wake();
    return due.size();
}

std::optional<TimePoint> SteadyTimer::next_deadline() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.next_deadline();
}

std::size_t SteadyTimer::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

//------------------------------- ManualTimer ----------------------------------

std::optional<TimerKey> ManualTimer::register_waker(TimePoint deadline, async::Waker w) {
    if (deadline <= now_) {
        w.wake();
        return std::nullopt;
    }
    return queue_.push(deadline, std::move(w));
}

std::size_t ManualTimer::advance(Duration d) {
    now_ += d;
    const auto due = queue_.take_due(now_);
    for (const auto& w : due) w.wake();
    return due.size();
}

//------------------------------- Sleep ----------------------------------------

Sleep::Sleep(Sleep&& other) noexcept
    : timer_(other.timer_),
      deadline_(other.deadline_),
      registered_(std::move(other.registered_)),
      key_(std::exchange(other.key_, std::nullopt)) {}

Sleep& Sleep::operator=(Sleep&& other) noexcept {
    if (this != &other) {
        release();
        timer_      = other.timer_;
        deadline_   = other.deadline_;
        registered_ = std::move(other.registered_);
        key_        = std::exchange(other.key_, std::nullopt);
    }
    return *this;
}

void Sleep::release() noexcept {
    if (key_) {
        timer_->cancel(*key_);
        key_.reset();
    }
}

async::Poll<std::monostate> Sleep::poll(async::Context& cx) {
    if (timer_->now() >= deadline_) {
        release();
        return std::monostate{};
    }

    // One registration per Sleep: a new waker replaces the previous one.
    if (!key_ || !registered_.will_wake(cx.waker())) {
        release();
        registered_ = cx.waker();
        key_ = timer_->register_waker(deadline_, registered_);
    }
    return async::pending;
}

} // namespace steer::time
