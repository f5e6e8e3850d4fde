/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer.
 */
#include "steer/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace steer::obs {

    std::string_view to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::ReadinessPending: return "readiness_pending";
            case EventKind::ReadinessFailed:  return "readiness_failed";
            case EventKind::Ready:            return "ready";
            case EventKind::Dispatch:         return "dispatch";
            case EventKind::DeadlineElapsed:  return "deadline_elapsed";
        }
        return "unknown";
    }

    class SimpleObserver : public Observer {
    public:
        void record(const Event& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            switch (e.kind) {
                case EventKind::ReadinessPending: ctr_.readiness_pending++;  break;
                case EventKind::ReadinessFailed:  ctr_.readiness_failures++; break;
                case EventKind::Ready:            ctr_.ready++;              break;
                case EventKind::Dispatch:         ctr_.dispatches++;         break;
                case EventKind::DeadlineElapsed:  ctr_.deadlines_elapsed++;  break;
            }
            // JSON-ish line (swap for structured logger later)
            const auto kind = to_string(e.kind);
            std::printf(
              R"({"event":"%.*s","service":%zu,"of":%zu,"reason":"%s"})" "\n",
              static_cast<int>(kind.size()), kind.data(),
              e.service_index, e.service_count, e.reason.c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace steer::obs
