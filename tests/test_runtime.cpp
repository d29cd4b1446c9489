/*
Rampart — RampartRuntime Tests
Role: Verify the runtime wires every component from one config and degrades per subsystem
Testing Strategy: Injected sampler, broker, store, REST client and WebSocket transports so the
                  whole stack runs in-process; real threads with millisecond stream settings
Coverage: Construction and wiring, per-subsystem disabling on bad sections, mandatory sections,
          start/stop lifecycle, ticker to cache to market_updates flow, status JSON shape
*/
#include <gtest/gtest.h>
#include "runtime/RampartRuntime.hpp"
#include "status/StatusJson.hpp"
#include "streams/InMemoryStreamBroker.hpp"
#include "store/InMemoryKeyValueStore.hpp"
#include "RampartErrors.hpp"
#include "fixtures/stub_sampler.hpp"
#include "fixtures/wait.hpp"
#include "marketdata/fixtures/fake_ws_transport.hpp"
#include "marketdata/fixtures/stub_rest_client.hpp"
#include "marketdata/fixtures/ticker_messages.hpp"
#include <algorithm>

using namespace Rampart;
using namespace std::chrono_literals;

namespace {

RampartConfig testConfig() {
    RampartConfig cfg;
    cfg.runtime.executorThreads = 4;
    cfg.runtime.logLevel = "warn";

    cfg.streams.pollTimeout = 20ms;
    cfg.streams.backoffDelay = 20ms;
    cfg.streams.criticalStagger = 0ms;
    cfg.streams.defaultStagger = 0ms;
    // portfolio_sync shares market_data_processor's group and would split market_updates with it
    auto& services = cfg.streams.services;
    services.erase(std::remove_if(services.begin(), services.end(),
                                  [](const ServiceConsumerConfig& s){ return s.service == "portfolio_sync"; }),
                   services.end());

    cfg.marketData.symbols = {"BTCUSDT"};
    cfg.marketData.exchanges = {ExchangeConfig::defaultsFor(ExchangeId::Binance)};
    cfg.marketData.enableFallbackPollers = false;
    return cfg;
}

struct RuntimeFixture {
    std::shared_ptr<StubReadings> readings = std::make_shared<StubReadings>();
    std::shared_ptr<InMemoryStreamBroker> broker = std::make_shared<InMemoryStreamBroker>();
    std::shared_ptr<InMemoryKeyValueStore> store = std::make_shared<InMemoryKeyValueStore>();
    std::shared_ptr<StubRestPriceClient> rest = std::make_shared<StubRestPriceClient>();
    FakeTransportFactory transports;

    RuntimeDependencies deps() {
        RuntimeDependencies d;
        d.sampler = std::make_unique<StubResourceSampler>(readings);
        d.broker = broker;
        d.store = store;
        d.rest = rest;
        d.transportFactory = transports.factory();
        return d;
    }

    std::unique_ptr<RampartRuntime> make(RampartConfig cfg = testConfig()) {
        return std::make_unique<RampartRuntime>(std::move(cfg), deps());
    }
};

bool has(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

TEST(RampartRuntime, BuildsEveryComponent) {
    RuntimeFixture f;
    auto runtime = f.make();

    EXPECT_FALSE(runtime->running());
    EXPECT_TRUE(runtime->disabled().empty());
    ASSERT_NE(runtime->backpressure(), nullptr);
    ASSERT_NE(runtime->streams(), nullptr);
    ASSERT_NE(runtime->marketData(), nullptr);
    EXPECT_EQ(&runtime->store(), f.store.get());

    // every configured service has a handler, built-in or logging stand-in
    for (const auto& svc : runtime->config().streams.services) {
        EXPECT_TRUE(runtime->streams()->hasHandler(svc.service)) << svc.service;
    }
    EXPECT_EQ(runtime->status().breakers.size(), runtime->config().breakers.profiles.size());
}

TEST(RampartRuntime, MandatorySectionsThrow) {
    RuntimeFixture f;
    auto cfg = testConfig();
    cfg.runtime.executorThreads = 0;
    EXPECT_THROW((void)f.make(cfg), ConfigError);

    cfg = testConfig();
    cfg.backpressure.maxConcurrent = 0;
    EXPECT_THROW((void)f.make(cfg), ConfigError);

    cfg = testConfig();
    cfg.breakers.defaults.failureThreshold = 0;
    EXPECT_THROW((void)f.make(cfg), ConfigError);
}

TEST(RampartRuntime, InvalidStreamsSectionDisablesOnlyStreams) {
    RuntimeFixture f;
    auto cfg = testConfig();
    cfg.streams.pollTimeout = 0ms;
    auto runtime = f.make(cfg);

    EXPECT_EQ(runtime->streams(), nullptr);
    EXPECT_NE(runtime->marketData(), nullptr);
    EXPECT_EQ(runtime->disabled(), std::vector<std::string>{"streams"});
    EXPECT_FALSE(runtime->status().streams.has_value());
}

TEST(RampartRuntime, InvalidMarketDataSectionDisablesOnlyMarketData) {
    RuntimeFixture f;
    auto cfg = testConfig();
    cfg.marketData.symbols.clear();
    auto runtime = f.make(cfg);

    EXPECT_EQ(runtime->marketData(), nullptr);
    EXPECT_NE(runtime->streams(), nullptr);
    EXPECT_TRUE(has(runtime->disabled(), "market_data"));
}

TEST(RampartRuntime, SectionsDisabledByConfiguration) {
    RuntimeFixture f;
    auto cfg = testConfig();
    cfg.enableBackpressure = false;
    cfg.enableStreams = false;
    cfg.enableMarketData = false;
    auto runtime = f.make(cfg);

    EXPECT_EQ(runtime->backpressure(), nullptr);
    EXPECT_EQ(runtime->streams(), nullptr);
    EXPECT_EQ(runtime->marketData(), nullptr);
    // switched off, not failed
    EXPECT_TRUE(runtime->disabled().empty());

    const auto st = runtime->status();
    EXPECT_FALSE(st.backpressure.has_value());
    EXPECT_FALSE(st.marketData.has_value());
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST(RampartRuntime, StartsAndStopsEverySubsystem) {
    RuntimeFixture f;
    auto runtime = f.make();
    runtime->start();
    runtime->start();   // idempotent

    EXPECT_TRUE(runtime->running());
    EXPECT_GE(f.readings->calls.load(), 1);
    ASSERT_TRUE(eventually([&]{
        auto st = runtime->status();
        return st.marketData && st.marketData->exchanges.size() == 1
            && st.marketData->exchanges[0].state == ConnectionState::Streaming;
    }));
    EXPECT_TRUE(runtime->streams()->isRunning());

    runtime->stop();
    EXPECT_FALSE(runtime->running());
    EXPECT_FALSE(runtime->streams()->isRunning());
    EXPECT_FALSE(runtime->marketData()->running());
    EXPECT_TRUE(f.transports.last()->closed());
    runtime->stop();
}

TEST(RampartRuntime, TickerReachesCacheAndMarketUpdatesStream) {
    RuntimeFixture f;
    auto runtime = f.make();
    runtime->start();
    ASSERT_TRUE(eventually([&]{
        auto st = runtime->status();
        return st.marketData && !st.marketData->exchanges.empty()
            && st.marketData->exchanges[0].state == ConnectionState::Streaming;
    }));

    f.transports.last()->deliver(fixtures::binanceTicker("BTCUSDT", "43210.5").dump());
    ASSERT_TRUE(eventually([&]{ return runtime->marketData()->cache().lookup("BTCUSDT").has_value(); }));
    ASSERT_TRUE(eventually([&]{ return runtime->status().streams->published >= 1; }));

    const auto info = f.broker->info("market_updates");
    EXPECT_GE(info.length, 1u);
    // market_data_processor seeds its baseline from the first update
    ASSERT_TRUE(eventually([&]{ return f.store->get("last_price:BTCUSDT").has_value(); }));
    runtime->stop();
}

TEST(RampartRuntime, DestructorStopsARunningRuntime) {
    RuntimeFixture f;
    {
        auto runtime = f.make();
        runtime->start();
        ASSERT_TRUE(eventually([&]{
            auto st = runtime->status();
            return st.marketData && !st.marketData->exchanges.empty()
                && st.marketData->exchanges[0].state == ConnectionState::Streaming;
        }));
    }
    ASSERT_NE(f.transports.last(), nullptr);
    EXPECT_TRUE(f.transports.last()->closed());
}

// =============================================================================
// Status rendering
// =============================================================================

TEST(StatusJson, RuntimeStatusHasEverySection) {
    RuntimeFixture f;
    f.readings->set(12.5, 40.0, 55.0);
    auto runtime = f.make();
    runtime->resources().sampleOnce();

    const auto j = toJson(runtime->status());
    EXPECT_FALSE(j.at("running").get<bool>());
    EXPECT_TRUE(j.at("resources").at("valid").get<bool>());
    EXPECT_DOUBLE_EQ(j.at("resources").at("cpu_percent").get<double>(), 12.5);
    EXPECT_EQ(j.at("circuit_breakers").size(), runtime->config().breakers.profiles.size());
    EXPECT_EQ(j.at("circuit_breakers")[0].at("state"), "closed");
    EXPECT_TRUE(j.at("backpressure").is_object());
    EXPECT_EQ(j.at("backpressure").at("queue_lengths").size(), kPriorityCount);
    EXPECT_TRUE(j.at("streams").at("consumers").is_array());
    EXPECT_EQ(j.at("streams").at("streams").size(), runtime->config().streams.streams.size());
    EXPECT_TRUE(j.at("market_data").at("updates_by_source").is_object());
    EXPECT_TRUE(j.at("disabled").empty());
}

TEST(StatusJson, DisabledSubsystemsRenderAsNull) {
    RuntimeFixture f;
    auto cfg = testConfig();
    cfg.enableBackpressure = false;
    cfg.streams.pollTimeout = 0ms;
    auto runtime = f.make(cfg);

    const auto j = toJson(runtime->status());
    EXPECT_TRUE(j.at("backpressure").is_null());
    EXPECT_TRUE(j.at("streams").is_null());
    EXPECT_EQ(j.at("disabled"), nlohmann::json::array({"streams"}));
}

TEST(StatusJson, ExchangeStatusOmitsEmptyError) {
    ExchangeStatus s;
    s.exchange = "kraken";
    const auto j = toJson(s);
    EXPECT_EQ(j.at("exchange"), "kraken");
    EXPECT_FALSE(j.contains("last_error"));
    EXPECT_TRUE(j.at("last_message_age_ms").is_null());

    s.lastError = "handshake failed";
    s.lastMessageAge = 1500ms;
    const auto k = toJson(s);
    EXPECT_EQ(k.at("last_error"), "handshake failed");
    EXPECT_EQ(k.at("last_message_age_ms"), 1500);
}
