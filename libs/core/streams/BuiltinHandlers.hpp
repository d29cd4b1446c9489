/*
Rampart — Built-in service handlers
Role: Handlers for the platform-owned services in the service table: cleanup_service,
      health_monitor, metrics_collector and market_data_processor. Business services
      (trade_execution, risk_monitor, portfolio_sync, balance_sync) are supplied by the embedding
      application; LoggingServiceHandler is the stand-in RampartRuntime registers for them.
Threading: Called from the EventStreamManager executor; every handler is safe for concurrent onEvent.
Integration: installBuiltinHandlers() registers the four built-ins on a manager before start().
Related: EventStreamManager.hpp, ServiceHandler.hpp.
*/
#pragma once

#include "streams/EventStreamManager.hpp"
#include "streams/ServiceHandler.hpp"
#include "monitor/ResourceMonitor.hpp"
#include "store/KeyValueStore.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace Rampart {

class CleanupHandler : public ServiceHandler {
public:
    explicit CleanupHandler(EventStreamManager& manager) : m_manager(manager) {}

    void onEvent(const StreamEntry& entry) override;
    void onFallback() override;

private:
    EventStreamManager& m_manager;
};

// Publishes a SystemHealth alert whenever a resource reading crosses its threshold.
class HealthMonitorHandler : public ServiceHandler {
public:
    HealthMonitorHandler(EventStreamManager& manager, const ResourceMonitor* resources,
                         ResourceThresholds alertAt = {85.0, 85.0, 90.0});

    void onEvent(const StreamEntry& entry) override;
    void onFallback() override;

private:
    EventStreamManager&    m_manager;
    const ResourceMonitor* m_resources;
    ResourceThresholds     m_alertAt;
};

class MetricsCollectorHandler : public ServiceHandler {
public:
    MetricsCollectorHandler(EventStreamManager& manager, const ResourceMonitor* resources)
        : m_manager(manager), m_resources(resources) {}

    void onEvent(const StreamEntry& entry) override;
    void onFallback() override;

private:
    EventStreamManager&    m_manager;
    const ResourceMonitor* m_resources;
};

// Turns significant price moves on market_updates into PortfolioChange events.
// The last price that triggered (or seeded) a symbol is kept in the store under
// "last_price:<SYMBOL>" for five minutes.
class MarketDataProcessorHandler : public ServiceHandler {
public:
    MarketDataProcessorHandler(EventStreamManager& manager, std::shared_ptr<KeyValueStore> store);

    void onEvent(const StreamEntry& entry) override;
    void onFallback() override;

    // Moves above 0.5% are significant for BTCUSDT and ETHUSDT, above 1% for everything else.
    static double thresholdPercentFor(const std::string& symbol);

    // Compares against the stored last price and updates it when the move is significant.
    // The first price seen for a symbol is stored and never significant.
    bool isSignificantChange(const std::string& symbol, double price);

    static constexpr std::chrono::minutes kLastPriceTtl{5};

private:
    EventStreamManager&            m_manager;
    std::shared_ptr<KeyValueStore> m_store;
};

class LoggingServiceHandler : public ServiceHandler {
public:
    explicit LoggingServiceHandler(std::string service) : m_service(std::move(service)) {}

    void onEvent(const StreamEntry& entry) override;
    void onFallback() override;

private:
    std::string m_service;
};

// Registers cleanup_service, health_monitor, metrics_collector and market_data_processor.
void installBuiltinHandlers(EventStreamManager& manager,
                            std::shared_ptr<KeyValueStore> store,
                            const ResourceMonitor* resources,
                            const ResourceThresholds& healthAlert = {85.0, 85.0, 90.0});

} // namespace Rampart
