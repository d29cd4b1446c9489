/*
Rampart — GuardedCaller Tests
Role: Verify the composed breaker + admission-control call path
Testing Strategy: Real registry and BackpressureManager with tiny limits
Coverage: Result pass-through, per-name breaker selection, open circuit short-circuits before
          admission, backpressure rejection never reaches the breaker, explicit timeouts,
          slots held by calls past their deadline, opting out of backpressure
*/
#include <gtest/gtest.h>
#include "resilience/GuardedCaller.hpp"
#include "fixtures/stub_sampler.hpp"
#include "fixtures/wait.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace Rampart;
using namespace std::chrono_literals;

namespace {

struct GuardFixture {
    std::shared_ptr<StubReadings> readings = std::make_shared<StubReadings>();
    ResourceMonitor monitor{ResourceMonitorConfig{}, std::make_unique<StubResourceSampler>(readings)};
    BlockingExecutor executor{2};
    CircuitBreakerRegistry breakers{CircuitBreakerRegistryConfig{}, executor};
    BackpressureManager backpressure{[]{
        BackpressureConfig cfg;
        cfg.maxConcurrent = 1;
        return cfg;
    }(), monitor, executor};
    GuardedCaller guard{breakers, &backpressure};
};

} // namespace

TEST(GuardedCaller, ReturnsResultAndReleasesPermit) {
    GuardFixture f;
    EXPECT_EQ(f.guard.call("external_apis", []{ return std::string("ok"); }), "ok");
    EXPECT_EQ(f.backpressure.active(), 0);
    EXPECT_EQ(f.breakers.get("external_apis")->stats().successfulCalls, 1);
}

TEST(GuardedCaller, FailuresCountAgainstTheNamedBreakerOnly) {
    GuardFixture f;
    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(f.guard.call("external_apis", []() -> int { throw std::runtime_error("503"); }),
                     std::runtime_error);
    }
    EXPECT_EQ(f.breakers.get("external_apis")->state(), CircuitState::Open);
    EXPECT_EQ(f.breakers.get("database_operations")->state(), CircuitState::Closed);

    std::atomic<bool> ran{false};
    EXPECT_THROW(f.guard.call("external_apis", [&]{ ran = true; }), CircuitOpenError);
    EXPECT_FALSE(ran.load());
    EXPECT_EQ(f.guard.call("database_operations", []{ return 1; }), 1);
    EXPECT_EQ(f.backpressure.active(), 0);
}

TEST(GuardedCaller, BackpressureRejectionDoesNotTouchBreaker) {
    GuardFixture f;
    f.readings->set(99.0, 99.0, 99.0);
    f.monitor.sampleOnce();

    CallOptions options;
    options.priority = Priority::Low;
    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(f.guard.call("trading_execution", []{ return 1; }, options), BackpressureError);
    }
    auto s = f.breakers.get("trading_execution")->stats();
    EXPECT_EQ(s.state, CircuitState::Closed);
    EXPECT_EQ(s.totalCalls, 0);

    // Capacity errors share a base with a retry-after hint
    try {
        f.guard.call("trading_execution", []{ return 1; }, options);
    } catch (const CapacityError& e) {
        EXPECT_GT(e.retryAfter().count(), 0);
    }
}

TEST(GuardedCaller, ExplicitTimeoutOverridesBreakerDefault) {
    GuardFixture f;
    CallOptions options;
    options.timeout = 20ms;
    EXPECT_THROW(f.guard.call("websocket_connections", []{ std::this_thread::sleep_for(300ms); }, options),
                 CallTimeoutError);
    EXPECT_EQ(f.breakers.get("websocket_connections")->stats().timeouts, 1);
    // the abandoned call keeps its slot until it actually finishes
    EXPECT_EQ(f.backpressure.active(), 1);
    EXPECT_TRUE(eventually([&]{ return f.backpressure.active() == 0; }));
}

TEST(GuardedCaller, OverrunningCallStillBlocksAdmission) {
    GuardFixture f;
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    auto work = [&](std::chrono::milliseconds d) {
        return [&, d]{
            const int now = ++inFlight;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(d);
            --inFlight;
        };
    };

    CallOptions options;
    options.timeout = 60ms;
    EXPECT_THROW(f.guard.call("external_apis", work(400ms), options), CallTimeoutError);
    // queue wait is half of 60ms, well before the overrunning call ends
    EXPECT_THROW(f.guard.call("external_apis", work(1ms), options), BackpressureError);

    ASSERT_TRUE(eventually([&]{ return f.backpressure.active() == 0; }));
    f.guard.call("external_apis", work(1ms), options);
    EXPECT_EQ(peak.load(), 1);
}

TEST(GuardedCaller, BackpressureCanBeBypassedPerCall) {
    GuardFixture f;
    auto held = f.backpressure.acquire(Priority::High, 1s);

    CallOptions options;
    options.useBackpressure = false;
    EXPECT_EQ(f.guard.call("redis_operations", []{ return 5; }, options), 5);
    EXPECT_EQ(f.backpressure.active(), 1);
}

TEST(GuardedCaller, WorksWithoutBackpressure) {
    BlockingExecutor executor(1);
    CircuitBreakerRegistry breakers(CircuitBreakerRegistryConfig{}, executor);
    GuardedCaller guard(breakers, nullptr);
    EXPECT_EQ(guard.call("anything", []{ return 9; }), 9);
    EXPECT_EQ(guard.backpressure(), nullptr);
}
