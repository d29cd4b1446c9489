/*
Rampart — EventStreamManager Tests
Role: Verify consumer loops, at-least-once acknowledgement, reclaim, fallback scheduling,
      publishing and retention trimming
Testing Strategy: InMemoryStreamBroker with millisecond poll/idle settings so real consumer
                  loops finish quickly; ManualClock for the pure scheduling and trimming checks
Coverage: Delivery and ack, failed batches left pending then reclaimed, recovery of a stopped
          instance's unacknowledged batch by a new manager, skipped services,
          registration rules, fallback runs on idle streams, adaptive intervals, resource gates,
          activity checks, publish fields and unknown streams, length/age trimming at volume
*/
#include <gtest/gtest.h>
#include "streams/EventStreamManager.hpp"
#include "streams/InMemoryStreamBroker.hpp"
#include "RampartErrors.hpp"
#include "fixtures/recording_handler.hpp"
#include "fixtures/wait.hpp"
#include <atomic>
#include <future>
#include <set>

using namespace Rampart;
using namespace std::chrono_literals;

namespace {

// One critical service on trade_signals with fast loops.
StreamManagerConfig fastConfig() {
    StreamManagerConfig cfg;
    cfg.pollTimeout = 10ms;
    cfg.minIdle = 50ms;
    cfg.reclaimInterval = 60ms;
    cfg.backoffDelay = 10ms;
    cfg.criticalStagger = 0ms;
    cfg.defaultStagger = 0ms;
    cfg.minFallbackCritical = 10ms;
    cfg.shutdownGrace = 2000ms;
    cfg.services = {{"trade_execution", "trade_signals", ServicePriority::Critical, 5, 1000ms, 20ms}};
    return cfg;
}

ResourceSnapshot snapshotOf(double cpu, double mem) {
    ResourceSnapshot s;
    s.cpuPercent = cpu;
    s.memoryPercent = mem;
    s.valid = true;
    return s;
}

const ConsumerStats* consumerFor(const StreamManagerStatus& st, const std::string& service) {
    for (const auto& c : st.consumers) {
        if (c.service == service) return &c;
    }
    return nullptr;
}

} // namespace

// =============================================================================
// Consumption
// =============================================================================

TEST(EventStreamManager, DeliversAndAcknowledgesEvents) {
    BlockingExecutor executor(4);
    auto broker = std::make_shared<InMemoryStreamBroker>();
    EventStreamManager manager(fastConfig(), broker, executor);
    auto handler = std::make_shared<RecordingHandler>();
    manager.registerHandler("trade_execution", handler);

    // published before start: the group starts at the beginning of the stream
    manager.publishEvent(EventType::TradeSignal, {{"symbol", "BTCUSDT"}, {"side", "buy"}});
    manager.start();
    for (int i = 0; i < 4; ++i) manager.publishEvent(EventType::TradeSignal, {{"seq", std::to_string(i)}});

    ASSERT_TRUE(eventually([&]{ return handler->count() == 5; }));
    ASSERT_TRUE(eventually([&]{
        const auto* c = consumerFor(manager.status(), "trade_execution");
        return c && c->acknowledged == 5;
    }));

    auto first = handler->seen().front();
    EXPECT_EQ(first.fields.at("symbol"), "BTCUSDT");
    EXPECT_EQ(first.fields.at("event_type"), "trade_signal");
    EXPECT_FALSE(first.fields.at("timestamp").empty());

    auto st = manager.status();
    const auto* c = consumerFor(st, "trade_execution");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->group, "trading_services");
    EXPECT_EQ(c->consumer.rfind("rampart_trade_execution_", 0), 0u);
    EXPECT_EQ(c->failedBatches, 0);
    EXPECT_EQ(broker->info("trade_signals").groups.front().pending, 0);
    EXPECT_EQ(st.published, 5);

    manager.stop();
    EXPECT_FALSE(manager.isRunning());
    EXPECT_EQ(consumerFor(manager.status(), "trade_execution")->state, ConsumerState::Stopped);
}

TEST(EventStreamManager, FailedBatchIsReclaimedLater) {
    BlockingExecutor executor(4);
    auto broker = std::make_shared<InMemoryStreamBroker>();
    EventStreamManager manager(fastConfig(), broker, executor);
    auto handler = std::make_shared<RecordingHandler>(1);
    manager.registerHandler("trade_execution", handler);
    manager.start();

    manager.publishEvent(EventType::TradeSignal, {{"order", "42"}});

    ASSERT_TRUE(eventually([&]{ return handler->count() == 1; }));
    ASSERT_TRUE(eventually([&]{
        const auto* c = consumerFor(manager.status(), "trade_execution");
        return c && c->reclaimed == 1 && c->acknowledged == 1;
    }));

    EXPECT_EQ(handler->failures.load(), 1);
    EXPECT_EQ(handler->seen().front().deliveryCount, 2u);
    const auto* c = consumerFor(manager.status(), "trade_execution");
    EXPECT_EQ(c->failedBatches, 1);
    EXPECT_EQ(broker->info("trade_signals").groups.front().pending, 0);
}

TEST(EventStreamManager, RestartedManagerRecoversUnacknowledgedBatch) {
    BlockingExecutor executor(4);
    auto broker = std::make_shared<InMemoryStreamBroker>();

    // First instance: its handler never returns before the stop, and it never reclaims itself.
    auto first = fastConfig();
    first.minIdle = 60s;
    first.reclaimInterval = 60s;
    first.services[0].batchTimeout = 300ms;
    EventStreamManager crashed(first, broker, executor);

    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<int> entered{0};
    crashed.registerHandler("trade_execution", std::make_shared<CallbackServiceHandler>(
        [&entered, gate](const StreamEntry&){
            ++entered;
            gate.wait();
        }));

    std::set<std::string> published;
    for (int i = 0; i < 3; ++i) {
        const auto id = crashed.publishEvent(EventType::TradeSignal, {{"order", std::to_string(i)}});
        ASSERT_TRUE(id.has_value());
        published.insert(id->toString());
    }
    crashed.start();
    ASSERT_TRUE(eventually([&]{ return entered.load() == 3; }));

    crashed.stop();
    EXPECT_EQ(consumerFor(crashed.status(), "trade_execution")->acknowledged, 0);
    EXPECT_EQ(broker->info("trade_signals").groups.front().pending, 3);
    release.set_value();

    // Second instance on the same broker picks the batch up.
    EventStreamManager restarted(fastConfig(), broker, executor);
    auto handler = std::make_shared<RecordingHandler>();
    restarted.registerHandler("trade_execution", handler);
    restarted.start();

    ASSERT_TRUE(eventually([&]{
        const auto* c = consumerFor(restarted.status(), "trade_execution");
        return c && c->reclaimed == 3 && c->acknowledged == 3;
    }));
    EXPECT_EQ(broker->info("trade_signals").groups.front().pending, 0);

    std::set<std::string> recovered;
    for (const auto& entry : handler->seen()) {
        recovered.insert(entry.id.toString());
        EXPECT_GE(entry.deliveryCount, 2u);
    }
    EXPECT_EQ(recovered, published);
    restarted.stop();
}

TEST(EventStreamManager, ServicesWithoutHandlersAreSkipped) {
    BlockingExecutor executor(2);
    auto cfg = fastConfig();
    cfg.services.push_back({"risk_monitor", "portfolio_changes", ServicePriority::Critical, 5, 500ms, 5000ms});
    EventStreamManager manager(cfg, std::make_shared<InMemoryStreamBroker>(), executor);
    manager.registerHandler("trade_execution", std::make_shared<RecordingHandler>());
    manager.start();

    auto st = manager.status();
    EXPECT_TRUE(st.running);
    ASSERT_EQ(st.skippedServices.size(), 1);
    EXPECT_EQ(st.skippedServices[0], "risk_monitor");
    EXPECT_EQ(st.consumers.size(), 1);
    EXPECT_TRUE(manager.hasHandler("trade_execution"));
    EXPECT_FALSE(manager.hasHandler("risk_monitor"));
}

TEST(EventStreamManager, RegistrationRules) {
    BlockingExecutor executor(1);
    EventStreamManager manager(fastConfig(), std::make_shared<InMemoryStreamBroker>(), executor);

    EXPECT_THROW(manager.registerHandler("unknown_service", std::make_shared<RecordingHandler>()), ConfigError);
    EXPECT_THROW(manager.registerHandler("trade_execution", nullptr), ConfigError);

    manager.registerHandler("trade_execution", std::make_shared<RecordingHandler>());
    manager.start();
    EXPECT_THROW(manager.registerHandler("trade_execution", std::make_shared<RecordingHandler>()), ConfigError);
}

TEST(EventStreamManager, InvalidConfigRejected) {
    BlockingExecutor executor(1);
    auto cfg = fastConfig();
    cfg.services.push_back({"orphan", "no_such_stream", ServicePriority::Background, 1, 100ms, 1000ms});
    EXPECT_THROW((void)EventStreamManager(cfg, std::make_shared<InMemoryStreamBroker>(), executor), ConfigError);
    EXPECT_THROW((void)EventStreamManager(fastConfig(), nullptr, executor), ConfigError);
}

// =============================================================================
// Fallback
// =============================================================================

TEST(EventStreamManager, FallbackRunsWhileStreamIsQuiet) {
    BlockingExecutor executor(2);
    EventStreamManager manager(fastConfig(), std::make_shared<InMemoryStreamBroker>(), executor);
    auto handler = std::make_shared<RecordingHandler>();
    manager.registerHandler("trade_execution", handler);
    manager.start();

    ASSERT_TRUE(eventually([&]{ return handler->fallbacks.load() >= 2; }));
    const auto* c = consumerFor(manager.status(), "trade_execution");
    ASSERT_NE(c, nullptr);
    EXPECT_GE(c->fallbackRuns, 2);
    // critical halves the base, then the per-priority floor applies
    EXPECT_EQ(c->lastFallbackInterval, 10ms);
}

TEST(EventStreamManager, ActivityCheckUsesLastAppendTime) {
    ManualClock clock;
    BlockingExecutor executor(1);
    auto broker = std::make_shared<InMemoryStreamBroker>(clock);
    EventStreamManager manager(StreamManagerConfig{}, broker, executor, nullptr, clock);

    EXPECT_TRUE(manager.shouldRunFallback("market_updates"));   // stream does not exist yet
    manager.publishEvent(EventType::PriceUpdate, {{"symbol", "BTCUSDT"}});
    EXPECT_FALSE(manager.shouldRunFallback("market_updates"));

    clock.advance(30s);
    EXPECT_FALSE(manager.shouldRunFallback("market_updates"));
    clock.advance(1ms);
    EXPECT_TRUE(manager.shouldRunFallback("market_updates"));
}

TEST(EventStreamManager, AdaptiveIntervalScalesWithLoadAndPriority) {
    BlockingExecutor executor(1);
    EventStreamManager manager(StreamManagerConfig{}, std::make_shared<InMemoryStreamBroker>(), executor);

    // no snapshot: priority factor only
    EXPECT_EQ(manager.adaptiveInterval(60000ms, ServicePriority::Important, ResourceSnapshot{}), 60000ms);
    // memory > 85 and cpu > 90
    EXPECT_EQ(manager.adaptiveInterval(60000ms, ServicePriority::Important, snapshotOf(95.0, 90.0)), 360000ms);
    // idle host shortens background work, floor is 300s
    EXPECT_EQ(manager.adaptiveInterval(300000ms, ServicePriority::Background, snapshotOf(30.0, 40.0)), 360000ms);
    EXPECT_EQ(manager.adaptiveInterval(600000ms, ServicePriority::Background, snapshotOf(30.0, 40.0)), 720000ms);
    // moderate load
    EXPECT_EQ(manager.adaptiveInterval(120000ms, ServicePriority::Important, snapshotOf(80.0, 75.0)), 360000ms);
    // critical: halved, then clamped to its 1s floor
    EXPECT_EQ(manager.adaptiveInterval(1000ms, ServicePriority::Critical, snapshotOf(50.0, 60.0)), 1000ms);
    // ceiling
    EXPECT_EQ(manager.adaptiveInterval(3600000ms, ServicePriority::Background, snapshotOf(95.0, 90.0)), 3600000ms);
}

TEST(EventStreamManager, ResourceGatesByPriority) {
    const auto loaded = snapshotOf(88.0, 50.0);
    EXPECT_TRUE(EventStreamManager::canProcess(ServicePriority::Critical, loaded));
    EXPECT_FALSE(EventStreamManager::canProcess(ServicePriority::Important, loaded));
    EXPECT_FALSE(EventStreamManager::canProcess(ServicePriority::Background, loaded));

    const auto moderate = snapshotOf(60.0, 72.0);
    EXPECT_TRUE(EventStreamManager::canProcess(ServicePriority::Important, moderate));
    EXPECT_FALSE(EventStreamManager::canProcess(ServicePriority::Background, moderate));

    EXPECT_FALSE(EventStreamManager::canProcess(ServicePriority::Critical, snapshotOf(96.0, 10.0)));
    EXPECT_TRUE(EventStreamManager::canProcess(ServicePriority::Background, ResourceSnapshot{}));
}

// =============================================================================
// Publishing and trimming
// =============================================================================

TEST(EventStreamManager, PublishToUnknownStreamFails) {
    BlockingExecutor executor(1);
    auto broker = std::make_shared<InMemoryStreamBroker>();
    EventStreamManager manager(StreamManagerConfig{}, broker, executor);

    EXPECT_FALSE(manager.publishEvent(EventType::SystemHealth, {}, std::string("not_a_stream")).has_value());
    auto id = manager.publishEvent(EventType::SystemHealth, {{"note", "override"}}, std::string("cleanup_events"));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(broker->info("cleanup_events").length, 1);

    auto st = manager.status();
    EXPECT_EQ(st.published, 1);
    EXPECT_EQ(st.publishFailures, 1);
}

TEST(EventStreamManager, StatusReportsMissingStreams) {
    BlockingExecutor executor(1);
    EventStreamManager manager(StreamManagerConfig{}, std::make_shared<InMemoryStreamBroker>(), executor);
    manager.publishEvent(EventType::RiskAlert, {{"level", "high"}});

    auto st = manager.status();
    ASSERT_EQ(st.streams.size(), 7);
    for (const auto& s : st.streams) {
        if (s.name == "risk_alerts") {
            EXPECT_TRUE(s.available);
            EXPECT_EQ(s.info.length, 1);
        } else {
            EXPECT_FALSE(s.available);
            EXPECT_FALSE(s.error.empty());
        }
    }
}

TEST(EventStreamManager, HighVolumeStreamStaysWithinLengthAndRetention) {
    ManualClock clock;
    BlockingExecutor executor(1);
    auto broker = std::make_shared<InMemoryStreamBroker>(clock);
    StreamManagerConfig cfg;
    cfg.services.clear();
    EventStreamManager manager(cfg, broker, executor, nullptr, clock);

    for (int i = 0; i < 150000; ++i) {
        manager.publishEvent(EventType::PriceUpdate, {{"symbol", "BTCUSDT"}, {"price", std::to_string(40000 + i % 100)}});
        if (i % 1000 == 999) clock.advance(1ms);
    }
    EXPECT_LE(broker->info("market_updates").length, 100000u);

    // a later burst inside the retention window
    clock.advance(3599s);
    for (int i = 0; i < 10; ++i) manager.publishEvent(EventType::PriceUpdate, {{"symbol", "ETHUSDT"}});
    clock.advance(2s);

    const auto result = manager.runCleanupPass();
    const auto info = broker->info("market_updates");
    const auto cutoffMs = static_cast<std::uint64_t>(clock.nowMs() - 3600 * 1000);

    EXPECT_EQ(info.length, 10);
    EXPECT_GE(info.firstEntryId.ms, cutoffMs);
    EXPECT_GE(result.trimmedByAge, 99990u);
    EXPECT_EQ(manager.status().trimmedByAge, result.trimmedByAge);
}

TEST(EventStreamManager, CleanupTrimsToMaxLength) {
    ManualClock clock;
    BlockingExecutor executor(1);
    auto broker = std::make_shared<InMemoryStreamBroker>(clock);
    StreamManagerConfig cfg;
    cfg.services.clear();
    EventStreamManager manager(cfg, broker, executor, nullptr, clock);

    // appended directly, bypassing the cap publishEvent applies
    for (int i = 0; i < 6000; ++i) broker->append("cleanup_events", {{"i", std::to_string(i)}}, 0);
    const auto result = manager.runCleanupPass();
    EXPECT_EQ(result.trimmedByLength, 1000);
    EXPECT_EQ(result.trimmedByAge, 0);
    EXPECT_EQ(broker->info("cleanup_events").length, 5000);
}
