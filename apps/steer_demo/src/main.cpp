/**
 * @file main.cpp
 * @brief steer_demo: shard string requests across echo services with a per-request deadline.
 *
 * **Wiring**
 * - Load config (defaults, or a YAML mapping file from argv[1]).
 * - Build `shards` EchoShard services on one SteadyTimer.
 * - Steer them with a SeededHashPicker over the request text.
 * - Wrap the Steer in a TimeoutService (deadline race per call).
 *
 * **Loop**
 * - For each request: block until the steered set is ready, then call and block
 *   on the response. Requests prefixed "slow" take longer than the deadline and
 *   report the elapsed error.
 */

#include <cstdio>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "steer/config/config_loader.hpp"
#include "steer/obs/observability.hpp"
#include "steer/routing/pickers.hpp"
#include "steer/rt/block_on.hpp"
#include "steer/service.hpp"
#include "steer/steer.hpp"
#include "steer/time/timeout_service.hpp"
#include "steer/time/timer.hpp"
#include "steer/version.hpp"

namespace {

using steer::Error;
using steer::Result;
using steer::async::Context;
using steer::async::Poll;

/// Service time multiplier for requests starting with "slow".
constexpr int kSlowFactor = 10;

/** @class EchoShard
 *  @brief Always-ready backend that answers "<shard>: <request>" after a delay.
 */
class EchoShard {
public:
    using response_type = std::string;
    using error_type    = Error;
    using future_type   = steer::async::BoxFuture<Result<std::string, Error>>;

    EchoShard(std::size_t id, steer::time::Timer& timer, steer::time::Duration delay)
        : id_(id), timer_(&timer), delay_(delay) {}

    Poll<Result<void, Error>> poll_ready(Context&) { return Result<void, Error>{}; }

    future_type call(std::string req) {
        const auto delay = req.rfind("slow", 0) == 0 ? delay_ * kSlowFactor : delay_;
        auto sleep = steer::time::Sleep::after(*timer_, delay);
        auto reply = "shard-" + std::to_string(id_) + ": " + req;
        return steer::async::box(steer::async::poll_fn<Result<std::string, Error>>(
            [sleep = std::move(sleep), reply = std::move(reply)](Context& cx) mutable -> Poll<Result<std::string, Error>> {
                if (sleep.poll(cx).is_pending()) return steer::async::pending;
                return Result<std::string, Error>{std::move(reply)};
            }));
    }

private:
    std::size_t           id_;
    steer::time::Timer*   timer_;
    steer::time::Duration delay_;
};

} // namespace

int main(int argc, char** argv) {
    const std::string path = (argc > 1) ? argv[1] : "";
    auto cfg = steer::config::Loader::load_from_file(path);
    if (!cfg) {
        const auto why = steer::config::to_string(cfg.error());
        std::fprintf(stderr, "steer_demo: config '%s': %.*s\n",
                     path.c_str(), static_cast<int>(why.size()), why.data());
        return 2;
    }

    std::printf("steer_demo %s: %zu shards, deadline %lld ms\n",
                steer::version_string, cfg->shards,
                static_cast<long long>(cfg->deadline.count()));

    steer::time::SteadyTimer timer;
    steer::obs::Observer* observer = cfg->log_events ? steer::obs::make_simple_observer() : nullptr;

    std::vector<EchoShard> shards;
    shards.reserve(cfg->shards);
    for (std::size_t i = 0; i < cfg->shards; ++i) shards.emplace_back(i, timer, cfg->shard_delay);

    const auto key = [](const std::string& s) { return std::hash<std::string>{}(s); };
    auto router = steer::make_steer<std::string>(std::move(shards),
                                                 steer::routing::SeededHashPicker(key, cfg->hash_seed),
                                                 observer);
    if (!router) {
        std::fprintf(stderr, "steer_demo: no shards configured\n");
        return 2;
    }

    using Router = std::remove_reference_t<decltype(*router)>;
    steer::time::TimeoutService<Router, std::string> svc(std::move(*router), timer, cfg->deadline, observer);

    const std::vector<std::string> requests = {
        "alpha", "Bravo", "charlie", "slow-delta", "Echo", "foxtrot", "slow-golf", "hotel"
    };

    int failures = 0;
    for (const auto& req : requests) {
        auto ready = steer::rt::block_on(steer::ready<std::string>(svc), &timer);
        if (!ready) {
            const auto why = steer::to_string(ready.error().code);
            std::fprintf(stderr, "steer_demo: services unavailable: %.*s\n",
                         static_cast<int>(why.size()), why.data());
            return 1;
        }

        auto res = steer::rt::block_on(svc.call(req), &timer);
        if (res) {
            std::printf("%-12s -> %s\n", req.c_str(), res->c_str());
        } else {
            ++failures;
            const auto why = steer::to_string(res.error().code);
            std::printf("%-12s -> error: %.*s\n", req.c_str(), static_cast<int>(why.size()), why.data());
        }
    }

    if (observer) {
        const auto c = observer->snapshot();
        std::printf("dispatches=%llu ready=%llu pending=%llu elapsed=%llu\n",
                    static_cast<unsigned long long>(c.dispatches),
                    static_cast<unsigned long long>(c.ready),
                    static_cast<unsigned long long>(c.readiness_pending),
                    static_cast<unsigned long long>(c.deadlines_elapsed));
    }
    std::printf("%zu requests, %d failed\n", requests.size(), failures);
    return 0;
}
