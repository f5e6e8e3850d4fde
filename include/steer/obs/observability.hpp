#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: steering/deadline events + counters.
 * @details Components take a nullable Observer*; null means nothing is reported.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace steer::obs {

    /** @enum EventKind
     *  @brief What happened.
     */
    enum class EventKind : std::uint8_t {
        ReadinessPending, ///< A service was not ready; the readiness check suspended
        ReadinessFailed,  ///< A service failed its readiness poll
        Ready,            ///< Every service reported ready
        Dispatch,         ///< A request was handed to a service
        DeadlineElapsed   ///< A deadline race resolved with the elapsed error
    };

    /// Stable lowercase label for an event kind.
    std::string_view to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters for steering decisions.
     */
    struct Counters {
        uint64_t dispatches{0};          ///< Requests handed to a service
        uint64_t readiness_pending{0};   ///< Readiness checks that suspended
        uint64_t readiness_failures{0};  ///< Readiness checks that failed
        uint64_t ready{0};               ///< Readiness checks that resolved ready
        uint64_t deadlines_elapsed{0};   ///< Deadline races lost to the timer
    };

    /** @struct Event
     *  @brief Payload describing a single steering or deadline event.
     */
    struct Event {
        EventKind   kind{EventKind::Dispatch}; ///< Event kind
        std::size_t service_index{0};          ///< Service involved (blocking, failing or chosen)
        std::size_t service_count{0};          ///< Size of the service set (0 if not applicable)
        std::string reason;                    ///< Reason label (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single event.
        virtual void record(const Event& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Forward `e` to `obs` when one is attached.
    inline void notify(Observer* obs, const Event& e) {
        if (obs) obs->record(e);
    }

    // Optional factory declaration (implemented in .cpp)
    Observer* make_simple_observer();

} // namespace steer::obs
