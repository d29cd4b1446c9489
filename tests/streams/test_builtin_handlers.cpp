/*
Rampart — Built-in Handler Tests
Role: Verify the platform-owned services react to events and fallbacks as intended
Testing Strategy: Handlers driven directly against an unstarted EventStreamManager on the
                  in-memory broker; ManualClock for store expiry; stub sampler for readings
Coverage: Significant-move detection and thresholds, last-price expiry, portfolio change
          publishing, health alerts, cleanup passes, installation against the service table
*/
#include <gtest/gtest.h>
#include "streams/BuiltinHandlers.hpp"
#include "streams/InMemoryStreamBroker.hpp"
#include "store/InMemoryKeyValueStore.hpp"
#include "RampartErrors.hpp"
#include "fixtures/stub_sampler.hpp"
#include <string>

using namespace Rampart;
using namespace std::chrono_literals;

namespace {

struct HandlerFixture {
    ManualClock clock;
    BlockingExecutor executor{1};
    std::shared_ptr<InMemoryStreamBroker> broker = std::make_shared<InMemoryStreamBroker>(clock);
    std::shared_ptr<InMemoryKeyValueStore> store = std::make_shared<InMemoryKeyValueStore>(clock);
    std::shared_ptr<StubReadings> readings = std::make_shared<StubReadings>();
    ResourceMonitor monitor{ResourceMonitorConfig{}, std::make_unique<StubResourceSampler>(readings), clock};
    EventStreamManager manager{StreamManagerConfig{}, broker, executor, &monitor, clock};

    std::size_t lengthOf(const std::string& stream) {
        try {
            return broker->info(stream).length;
        } catch (const RampartError&) {
            return 0;
        }
    }
};

StreamEntry marketUpdate(const std::string& symbol, const std::string& price) {
    return StreamEntry{StreamEntryId{1, 0}, {{"symbol", symbol}, {"price", price}, {"event_type", "price_update"}}};
}

} // namespace

// =============================================================================
// market_data_processor
// =============================================================================

TEST(MarketDataProcessor, ThresholdsByMajorPair) {
    EXPECT_DOUBLE_EQ(MarketDataProcessorHandler::thresholdPercentFor("BTCUSDT"), 0.5);
    EXPECT_DOUBLE_EQ(MarketDataProcessorHandler::thresholdPercentFor("ETHUSDT"), 0.5);
    EXPECT_DOUBLE_EQ(MarketDataProcessorHandler::thresholdPercentFor("SOLUSDT"), 1.0);
}

TEST(MarketDataProcessor, FirstPriceSeedsWithoutSignal) {
    HandlerFixture f;
    MarketDataProcessorHandler handler(f.manager, f.store);

    EXPECT_FALSE(handler.isSignificantChange("BTCUSDT", 100.0));
    ASSERT_TRUE(f.store->get("last_price:BTCUSDT").has_value());
    EXPECT_DOUBLE_EQ(std::stod(*f.store->get("last_price:BTCUSDT")), 100.0);
}

TEST(MarketDataProcessor, SmallMovesKeepTheBaseline) {
    HandlerFixture f;
    MarketDataProcessorHandler handler(f.manager, f.store);

    (void)handler.isSignificantChange("BTCUSDT", 100.0);
    EXPECT_FALSE(handler.isSignificantChange("BTCUSDT", 100.4));
    EXPECT_FALSE(handler.isSignificantChange("BTCUSDT", 99.6));
    EXPECT_DOUBLE_EQ(std::stod(*f.store->get("last_price:BTCUSDT")), 100.0);

    EXPECT_TRUE(handler.isSignificantChange("BTCUSDT", 100.6));
    EXPECT_DOUBLE_EQ(std::stod(*f.store->get("last_price:BTCUSDT")), 100.6);
    // measured from the new baseline
    EXPECT_FALSE(handler.isSignificantChange("BTCUSDT", 100.9));
}

TEST(MarketDataProcessor, AltcoinsNeedOnePercent) {
    HandlerFixture f;
    MarketDataProcessorHandler handler(f.manager, f.store);

    (void)handler.isSignificantChange("SOLUSDT", 10.0);
    EXPECT_FALSE(handler.isSignificantChange("SOLUSDT", 10.09));
    EXPECT_TRUE(handler.isSignificantChange("SOLUSDT", 9.8));
}

TEST(MarketDataProcessor, BaselineExpires) {
    HandlerFixture f;
    MarketDataProcessorHandler handler(f.manager, f.store);

    (void)handler.isSignificantChange("ETHUSDT", 2000.0);
    f.clock.advance(MarketDataProcessorHandler::kLastPriceTtl + 1s);
    EXPECT_FALSE(f.store->get("last_price:ETHUSDT").has_value());
    // a large move after expiry only reseeds
    EXPECT_FALSE(handler.isSignificantChange("ETHUSDT", 2500.0));
}

TEST(MarketDataProcessor, SignificantUpdatePublishesPortfolioChange) {
    HandlerFixture f;
    MarketDataProcessorHandler handler(f.manager, f.store);

    handler.onEvent(marketUpdate("BTCUSDT", "50000"));
    EXPECT_EQ(f.lengthOf("portfolio_changes"), 0u);

    handler.onEvent(marketUpdate("BTCUSDT", "51000"));
    ASSERT_EQ(f.lengthOf("portfolio_changes"), 1u);

    EXPECT_EQ(f.manager.status().published, 1u);
}

TEST(MarketDataProcessor, UnusableUpdatesAreIgnored) {
    HandlerFixture f;
    MarketDataProcessorHandler handler(f.manager, f.store);

    EXPECT_NO_THROW(handler.onEvent(marketUpdate("BTCUSDT", "not-a-price")));
    EXPECT_NO_THROW(handler.onEvent(marketUpdate("BTCUSDT", "-5")));
    EXPECT_NO_THROW(handler.onEvent(StreamEntry{StreamEntryId{2, 0}, {{"price", "10"}}}));
    EXPECT_EQ(f.store->size(), 0u);
    EXPECT_EQ(f.manager.status().published, 0u);
}

TEST(MarketDataProcessor, WorksWithoutSharedStore) {
    HandlerFixture f;
    MarketDataProcessorHandler handler(f.manager, nullptr);
    EXPECT_FALSE(handler.isSignificantChange("BTCUSDT", 100.0));
    EXPECT_TRUE(handler.isSignificantChange("BTCUSDT", 110.0));
}

// =============================================================================
// health_monitor
// =============================================================================

TEST(HealthMonitor, AlertsWhenAThresholdIsCrossed) {
    HandlerFixture f;
    HealthMonitorHandler handler(f.manager, &f.monitor, ResourceThresholds{85.0, 85.0, 90.0});

    f.readings->set(40.0, 50.0, 60.0);
    f.monitor.sampleOnce();
    handler.onFallback();
    EXPECT_EQ(f.lengthOf("system_events"), 0u);

    f.readings->set(40.0, 92.0, 60.0);
    f.monitor.sampleOnce();
    handler.onFallback();
    EXPECT_EQ(f.lengthOf("system_events"), 1u);
    EXPECT_EQ(f.manager.status().published, 1u);
}

TEST(HealthMonitor, NoReadingsNoAlert) {
    HandlerFixture f;
    HealthMonitorHandler withoutMonitor(f.manager, nullptr);
    withoutMonitor.onFallback();

    HealthMonitorHandler unsampled(f.manager, &f.monitor, ResourceThresholds{1.0, 1.0, 1.0});
    unsampled.onFallback();
    EXPECT_EQ(f.manager.status().published, 0u);
}

TEST(HealthMonitor, RejectsInvalidThresholds) {
    HandlerFixture f;
    EXPECT_THROW((void)HealthMonitorHandler(f.manager, &f.monitor, ResourceThresholds{0.0, 85.0, 90.0}),
                 ConfigError);
}

// =============================================================================
// cleanup_service
// =============================================================================

TEST(CleanupService, EventAndFallbackBothRunACleanupPass) {
    HandlerFixture f;
    CleanupHandler handler(f.manager);

    for (int i = 0; i < 5100; ++i) f.broker->append("cleanup_events", {{"i", std::to_string(i)}}, 0);
    handler.onFallback();
    EXPECT_EQ(f.lengthOf("cleanup_events"), 5000u);

    for (int i = 0; i < 20; ++i) f.broker->append("cleanup_events", {{"i", std::to_string(i)}}, 0);
    handler.onEvent(StreamEntry{StreamEntryId{1, 0}, {{"event_type", "cleanup_request"}}});
    EXPECT_EQ(f.lengthOf("cleanup_events"), 5000u);
    EXPECT_EQ(f.manager.status().trimmedByLength, 120u);
}

// =============================================================================
// Installation
// =============================================================================

TEST(BuiltinHandlers, InstallsOnlyConfiguredServices) {
    HandlerFixture f;
    installBuiltinHandlers(f.manager, f.store, &f.monitor);
    EXPECT_TRUE(f.manager.hasHandler("cleanup_service"));
    EXPECT_TRUE(f.manager.hasHandler("health_monitor"));
    EXPECT_TRUE(f.manager.hasHandler("metrics_collector"));
    EXPECT_TRUE(f.manager.hasHandler("market_data_processor"));
    EXPECT_FALSE(f.manager.hasHandler("trade_execution"));

    StreamManagerConfig cfg;
    cfg.services = {{"trade_execution", "trade_signals", ServicePriority::Critical, 1, 100ms, 1s}};
    EventStreamManager trading(cfg, f.broker, f.executor, &f.monitor, f.clock);
    installBuiltinHandlers(trading, f.store, &f.monitor);
    EXPECT_FALSE(trading.hasHandler("cleanup_service"));
    EXPECT_FALSE(trading.hasHandler("market_data_processor"));
}

TEST(BuiltinHandlers, MetricsFallbackReadsStatus) {
    HandlerFixture f;
    f.monitor.sampleOnce();
    MetricsCollectorHandler handler(f.manager, &f.monitor);
    EXPECT_NO_THROW(handler.onFallback());
    MetricsCollectorHandler bare(f.manager, nullptr);
    EXPECT_NO_THROW(bare.onFallback());
}
