/*
Rampart — RampartRuntime
Role: Builds every component from one RampartConfig, wires them by constructor injection and
      owns their lifetimes.
Inputs/Outputs: RampartConfig plus optional injected dependencies in; component accessors and an
                aggregated RuntimeStatus out.
Threading: start()/stop() from one controlling thread. status() is safe from any thread.
Performance: Construction only; every hot path lives in the components themselves.
Integration: rampartd and the end-to-end tests. Start order is monitor, breakers, streams,
             market data; stop runs in reverse.
Observability: Logs each subsystem it starts or disables; status() gathers every component.
Related: RampartConfig.hpp, StatusJson.hpp.
Assumptions: Runtime, resources, breakers and backpressure sections are mandatory and throw
             ConfigError from the constructor. An invalid streams or market_data section only
             disables that subsystem (reported in disabled()).
*/
#pragma once

#include "config/RampartConfig.hpp"
#include "marketdata/MarketDataManager.hpp"
#include "marketdata/rest/RestPriceClient.hpp"
#include "monitor/ResourceMonitor.hpp"
#include "resilience/BackpressureManager.hpp"
#include "resilience/CircuitBreakerRegistry.hpp"
#include "resilience/GuardedCaller.hpp"
#include "runtime/BlockingExecutor.hpp"
#include "runtime/Clock.hpp"
#include "store/KeyValueStore.hpp"
#include "streams/EventStreamManager.hpp"
#include "streams/StreamBroker.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Rampart {

// Anything left empty gets the production implementation.
struct RuntimeDependencies {
    std::unique_ptr<ResourceSampler>    sampler;            // ProcResourceSampler
    std::shared_ptr<StreamBroker>       broker;             // InMemoryStreamBroker
    std::shared_ptr<KeyValueStore>      store;              // InMemoryKeyValueStore
    std::shared_ptr<RestPriceClient>    rest;               // CoinGeckoPriceClient
    MarketDataManager::TransportFactory transportFactory;   // BeastWsTransport
    const Clock*                        clock{nullptr};     // SystemClock
};

struct RuntimeStatus {
    bool                               running{false};
    ResourceSnapshot                   resources;
    std::vector<CircuitBreakerStats>   breakers;
    std::optional<BackpressureStats>   backpressure;
    std::optional<StreamManagerStatus> streams;
    std::optional<MarketDataStatus>    marketData;
    std::vector<std::string>           disabled;
    std::uint64_t                      abandonedCalls{0};
};

class RampartRuntime {
public:
    explicit RampartRuntime(RampartConfig config, RuntimeDependencies deps = {});
    ~RampartRuntime();

    RampartRuntime(const RampartRuntime&) = delete;
    RampartRuntime& operator=(const RampartRuntime&) = delete;

    void start();
    void stop();

    [[nodiscard]] RuntimeStatus status() const;

    [[nodiscard]] const RampartConfig& config() const noexcept { return m_config; }
    [[nodiscard]] bool running() const noexcept { return m_running.load(); }
    [[nodiscard]] const std::vector<std::string>& disabled() const noexcept { return m_disabled; }

    [[nodiscard]] BlockingExecutor&       executor() noexcept { return *m_executor; }
    [[nodiscard]] ResourceMonitor&        resources() noexcept { return *m_monitor; }
    [[nodiscard]] CircuitBreakerRegistry& breakers() noexcept { return *m_breakers; }
    [[nodiscard]] GuardedCaller&          guard() noexcept { return *m_guard; }
    [[nodiscard]] KeyValueStore&          store() noexcept { return *m_store; }
    [[nodiscard]] BackpressureManager*    backpressure() noexcept { return m_backpressure.get(); }
    [[nodiscard]] EventStreamManager*     streams() noexcept { return m_streams.get(); }
    [[nodiscard]] MarketDataManager*      marketData() noexcept { return m_marketData.get(); }

private:
    void buildStreams(std::shared_ptr<StreamBroker> broker);
    void buildMarketData(std::shared_ptr<RestPriceClient> rest,
                         MarketDataManager::TransportFactory transportFactory);

    const RampartConfig                     m_config;
    const Clock&                            m_clock;
    std::shared_ptr<KeyValueStore>          m_store;

    // Declaration order is destruction order in reverse: dependents go first.
    std::unique_ptr<BlockingExecutor>       m_executor;
    std::unique_ptr<ResourceMonitor>        m_monitor;
    std::unique_ptr<CircuitBreakerRegistry> m_breakers;
    std::unique_ptr<BackpressureManager>    m_backpressure;
    std::unique_ptr<GuardedCaller>          m_guard;
    std::unique_ptr<EventStreamManager>     m_streams;
    std::unique_ptr<MarketDataManager>      m_marketData;

    std::vector<std::string>                m_disabled;
    std::atomic<bool>                       m_running{false};
};

} // namespace Rampart
