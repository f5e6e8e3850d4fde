/**
 * @file test_steer.cpp
 * @brief Tests for Steer: aggregated readiness, per-service flag reset, routing.
 *
 * Validates:
 *  - Ready iff every service reported ready since its last call
 *  - call() consumes only the picked service's readiness
 *  - Readiness failures propagate verbatim and stop the scan
 *  - Head-of-line blocking when one service never becomes ready
 *  - Fatal contract checks (out-of-range index, call without readiness)
 */

#include <gtest/gtest.h>
#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>
#include <vector>

#include "steer/routing/pickers.hpp"
#include "steer/steer.hpp"
#include "support/mock_service.hpp"

using steer::Steer;
using steer::SteerError;
using steer_test::CountingWaker;
using steer_test::MockService;
using steer_test::Readiness;
using steer_test::State;

namespace {

struct Fixture {
    std::vector<std::shared_ptr<State>> states;
    std::vector<MockService>            services;

    explicit Fixture(std::size_t n) {
        for (std::size_t i = 0; i < n; ++i) {
            states.push_back(std::make_shared<State>());
            services.emplace_back(states.back(), static_cast<int>(i));
        }
    }
};

/// Picker that always answers `k`.
struct FixedPicker {
    std::size_t k{0};
    std::size_t pick(const int&, std::span<const MockService>) const noexcept { return k; }
};

template <class S>
int call_and_get(S& s, steer::async::Context& cx, int req) {
    auto fut = s.call(req);
    auto p = fut.poll(cx);
    EXPECT_TRUE(p.is_ready());
    auto r = p.take();
    EXPECT_TRUE(r.has_value());
    return r ? *r : -1;
}

} // namespace

static_assert(steer::Service<Steer<MockService, FixedPicker, int>, int>,
              "Steer must itself model Service");

// --------------------------- Construction ---------------------------------

TEST(Steer, Construct_EmptySet_Rejected) {
    auto s = Steer<MockService, FixedPicker, int>::with_services({}, FixedPicker{});
    ASSERT_FALSE(s.has_value());
    EXPECT_EQ(s.error(), SteerError::NoServices);
}

TEST(Steer, Construct_DoesNotPollServices) {
    Fixture f(2);
    auto s = steer::make_steer<int>(f.services, FixedPicker{});
    ASSERT_TRUE(s);
    EXPECT_EQ(s->size(), 2u);
    EXPECT_EQ(f.states[0]->polls, 0u);
    EXPECT_EQ(f.states[1]->polls, 0u);
}

// --------------------------- Readiness ------------------------------------

TEST(Steer, PollReady_AllReady_ResolvesOk) {
    Fixture f(3);
    auto s = steer::make_steer<int>(f.services, FixedPicker{});
    ASSERT_TRUE(s);

    CountingWaker w;
    steer::async::Context cx(w.waker);
    auto p = s->poll_ready(cx);
    ASSERT_TRUE(p.is_ready());
    EXPECT_TRUE(p.value().has_value());
    for (const auto& st : f.states) EXPECT_EQ(st->polls, 1u);
}

/**
 * @test PollReady_PendingUntilEveryServiceReady
 * @brief A pending service suspends the scan; the retry skips already-ready services.
 */
TEST(Steer, PollReady_PendingUntilEveryServiceReady) {
    Fixture f(3);
    f.states[1]->mode = Readiness::Pending;
    auto s = steer::make_steer<int>(f.services, FixedPicker{});
    ASSERT_TRUE(s);

    CountingWaker w;
    steer::async::Context cx(w.waker);

    EXPECT_TRUE(s->poll_ready(cx).is_pending());
    EXPECT_EQ(f.states[0]->polls, 1u);
    EXPECT_EQ(f.states[1]->polls, 1u);
    EXPECT_EQ(f.states[2]->polls, 0u);  // scan stopped at the pending service
    ASSERT_TRUE(f.states[1]->has_waker);

    // The pending service's readiness wakes the combinator's caller.
    f.states[1]->make_ready();
    EXPECT_EQ(*w.count, 1);

    auto p = s->poll_ready(cx);
    ASSERT_TRUE(p.is_ready());
    EXPECT_TRUE(p.value().has_value());
    EXPECT_EQ(f.states[0]->polls, 1u);  // flag trusted, not re-polled
    EXPECT_EQ(f.states[1]->polls, 2u);
    EXPECT_EQ(f.states[2]->polls, 1u);
}

TEST(Steer, PollReady_AlreadyReady_DoesNotRepoll) {
    Fixture f(2);
    auto s = steer::make_steer<int>(f.services, FixedPicker{});
    ASSERT_TRUE(s);
    // Context borrows the waker; keep a named one alive.
    const auto noop = steer::async::Waker::noop();
    steer::async::Context cx2(noop);

    ASSERT_TRUE(s->poll_ready(cx2).is_ready());
    ASSERT_TRUE(s->poll_ready(cx2).is_ready());
    ASSERT_TRUE(s->poll_ready(cx2).is_ready());
    EXPECT_EQ(f.states[0]->polls, 1u);
    EXPECT_EQ(f.states[1]->polls, 1u);
}

/**
 * @test PollReady_Failure_PropagatesVerbatim
 * @brief The failing service's own error type and value reach the caller; later services are not polled.
 */
TEST(Steer, PollReady_Failure_PropagatesVerbatim) {
    using steer_test::ShardError;
    using Svc = steer_test::BasicMockService<ShardError>;
    using St  = steer_test::MockState<ShardError>;

    auto s0 = std::make_shared<St>();
    auto s1 = std::make_shared<St>();
    auto s2 = std::make_shared<St>();
    s1->mode = Readiness::Fail;
    s1->fail_error = ShardError{1, "overloaded"};

    std::vector<Svc> svcs{Svc(s0, 0), Svc(s1, 1), Svc(s2, 2)};
    auto picker = [](const int&, std::span<const Svc>) -> std::size_t { return 0; };
    auto s = steer::make_steer<int>(std::move(svcs), picker);
    ASSERT_TRUE(s);

    const auto noop = steer::async::Waker::noop();
    steer::async::Context cx(noop);
    auto p = s->poll_ready(cx);
    ASSERT_TRUE(p.is_ready());
    ASSERT_FALSE(p.value().has_value());
    EXPECT_EQ(p.value().error(), (ShardError{1, "overloaded"}));
    EXPECT_EQ(s0->polls, 1u);
    EXPECT_EQ(s1->polls, 1u);
    EXPECT_EQ(s2->polls, 0u);
}

/**
 * @test PollReady_HeadOfLineBlocking
 * @brief One service that never becomes ready keeps the whole combinator pending.
 */
TEST(Steer, PollReady_HeadOfLineBlocking) {
    Fixture f(2);
    f.states[1]->mode = Readiness::Pending;
    auto s = steer::make_steer<int>(f.services, FixedPicker{0});
    ASSERT_TRUE(s);

    CountingWaker w;
    steer::async::Context cx(w.waker);
    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(s->poll_ready(cx).is_pending()) << "iteration " << i;
    }
    EXPECT_EQ(f.states[0]->polls, 1u);
    EXPECT_EQ(f.states[1]->polls, 100u);
    EXPECT_EQ(f.states[0]->calls, 0u);
    EXPECT_EQ(*w.count, 0);
}

// --------------------------- Call -----------------------------------------

/**
 * @test Call_ResetsOnlyPickedService
 * @brief After call(), only the picked service is polled again on the next readiness check.
 */
TEST(Steer, Call_ResetsOnlyPickedService) {
    Fixture f(3);
    auto s = steer::make_steer<int>(f.services, FixedPicker{1});
    ASSERT_TRUE(s);

    const auto noop = steer::async::Waker::noop();
    steer::async::Context cx(noop);
    ASSERT_TRUE(s->poll_ready(cx).is_ready());

    EXPECT_EQ(call_and_get(*s, cx, 7), 1007);
    EXPECT_EQ(f.states[1]->calls, 1u);
    EXPECT_EQ(f.states[1]->requests, std::vector<int>{7});

    ASSERT_TRUE(s->poll_ready(cx).is_ready());
    EXPECT_EQ(f.states[0]->polls, 1u);
    EXPECT_EQ(f.states[1]->polls, 2u);
    EXPECT_EQ(f.states[2]->polls, 1u);
}

TEST(Steer, Call_RepeatedCycles_RepollOnlyPicked) {
    Fixture f(3);
    auto s = steer::make_steer<int>(f.services, FixedPicker{2});
    ASSERT_TRUE(s);

    const auto noop = steer::async::Waker::noop();
    steer::async::Context cx(noop);
    constexpr int kCycles = 5;
    for (int i = 0; i < kCycles; ++i) {
        ASSERT_TRUE(s->poll_ready(cx).is_ready());
        EXPECT_EQ(call_and_get(*s, cx, i), 2000 + i);
    }
    EXPECT_EQ(f.states[0]->polls, 1u);
    EXPECT_EQ(f.states[1]->polls, 1u);
    EXPECT_EQ(f.states[2]->polls, static_cast<std::size_t>(kCycles));
    EXPECT_EQ(f.states[2]->calls, static_cast<std::size_t>(kCycles));
    EXPECT_EQ(f.states[0]->calls + f.states[1]->calls, 0u);
}

/**
 * @test Call_ConsumedReadiness_WaitsForFreshReady
 * @brief A service that goes pending after serving must report ready again before the next dispatch.
 */
TEST(Steer, Call_ConsumedReadiness_WaitsForFreshReady) {
    Fixture f(2);
    f.states[0]->ready_once = true;
    auto s = steer::make_steer<int>(f.services, FixedPicker{0});
    ASSERT_TRUE(s);

    CountingWaker w;
    steer::async::Context cx(w.waker);
    ASSERT_TRUE(s->poll_ready(cx).is_ready());
    EXPECT_EQ(call_and_get(*s, cx, 1), 1);

    EXPECT_TRUE(s->poll_ready(cx).is_pending());
    f.states[0]->make_ready();
    EXPECT_EQ(*w.count, 1);
    ASSERT_TRUE(s->poll_ready(cx).is_ready());
    EXPECT_EQ(call_and_get(*s, cx, 2), 2);
    EXPECT_EQ(f.states[1]->polls, 1u);
}

/**
 * @test Call_IdentityModThree_Distribution
 * @brief Requests 0..4 with key % 3 land on services 0,1,2,0,1.
 */
TEST(Steer, Call_IdentityModThree_Distribution) {
    Fixture f(3);
    auto identity = [](const int& r) { return static_cast<unsigned>(r); };
    auto s = steer::make_steer<int>(f.services, steer::routing::KeyModPicker(identity));
    ASSERT_TRUE(s);

    const auto noop = steer::async::Waker::noop();
    steer::async::Context cx(noop);
    std::vector<int> routed;
    for (int req = 0; req < 5; ++req) {
        ASSERT_TRUE(s->poll_ready(cx).is_ready());
        routed.push_back(call_and_get(*s, cx, req) / 1000);
    }
    EXPECT_EQ(routed, (std::vector<int>{0, 1, 2, 0, 1}));
    EXPECT_EQ(f.states[0]->calls, 2u);
    EXPECT_EQ(f.states[1]->calls, 2u);
    EXPECT_EQ(f.states[2]->calls, 1u);
    EXPECT_EQ(f.states[0]->requests, (std::vector<int>{0, 3}));
    EXPECT_EQ(f.states[1]->requests, (std::vector<int>{1, 4}));
}

TEST(Steer, Call_PickerSeesServicesInOrder) {
    Fixture f(3);
    std::vector<int> seen_tags;
    auto picker = [&seen_tags](const int& r, std::span<const MockService> svcs) -> std::size_t {
        seen_tags.clear();
        for (const auto& s : svcs) seen_tags.push_back(s.tag());
        return static_cast<std::size_t>(r);
    };
    auto s = steer::make_steer<int>(f.services, picker);
    ASSERT_TRUE(s);

    const auto noop = steer::async::Waker::noop();
    steer::async::Context cx(noop);
    ASSERT_TRUE(s->poll_ready(cx).is_ready());
    EXPECT_EQ(call_and_get(*s, cx, 2), 2002);
    EXPECT_EQ(seen_tags, (std::vector<int>{0, 1, 2}));
}

TEST(Steer, Nested_SteerOfSteers) {
    Fixture left(2), right(2);
    auto inner_l = steer::make_steer<int>(left.services, FixedPicker{1});
    auto inner_r = steer::make_steer<int>(right.services, FixedPicker{0});
    ASSERT_TRUE(inner_l);
    ASSERT_TRUE(inner_r);

    using Inner = std::remove_reference_t<decltype(*inner_l)>;
    std::vector<Inner> inners;
    inners.push_back(std::move(*inner_l));
    inners.push_back(std::move(*inner_r));
    auto outer = steer::make_steer<int>(std::move(inners),
        [](const int& r, std::span<const Inner>) -> std::size_t { return r < 100 ? 0 : 1; });
    ASSERT_TRUE(outer);

    const auto noop = steer::async::Waker::noop();
    steer::async::Context cx(noop);
    ASSERT_TRUE(outer->poll_ready(cx).is_ready());
    EXPECT_EQ(call_and_get(*outer, cx, 5), 1005);
    ASSERT_TRUE(outer->poll_ready(cx).is_ready());
    EXPECT_EQ(call_and_get(*outer, cx, 150), 150);
    EXPECT_EQ(left.states[1]->calls, 1u);
    EXPECT_EQ(right.states[0]->calls, 1u);
}

// --------------------------- Contract violations --------------------------

TEST(SteerDeathTest, Call_OutOfRangeIndex_Aborts) {
    EXPECT_DEATH({
        Fixture f(2);
        auto s = steer::make_steer<int>(f.services, FixedPicker{2});
        const auto noop = steer::async::Waker::noop();
        steer::async::Context cx(noop);
        (void)s->poll_ready(cx);
        (void)s->call(1);
    }, "out-of-range");
}

TEST(SteerDeathTest, Call_WithoutReadiness_Aborts) {
    EXPECT_DEATH({
        Fixture f(2);
        auto s = steer::make_steer<int>(f.services, FixedPicker{0});
        (void)s->call(1);
    }, "without a fresh poll_ready");
}

TEST(SteerDeathTest, Call_TwiceAfterOneReadiness_Aborts) {
    EXPECT_DEATH({
        Fixture f(1);
        auto s = steer::make_steer<int>(f.services, FixedPicker{0});
        const auto noop = steer::async::Waker::noop();
        steer::async::Context cx(noop);
        (void)s->poll_ready(cx);
        (void)s->call(1);
        (void)s->call(2);
    }, "without a fresh poll_ready");
}
