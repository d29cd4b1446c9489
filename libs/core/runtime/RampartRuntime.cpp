#include "runtime/RampartRuntime.hpp"
#include "RampartErrors.hpp"
#include "RampartLogging.hpp"
#include "marketdata/rest/CoinGeckoPriceClient.hpp"
#include "monitor/ProcResourceSampler.hpp"
#include "store/InMemoryKeyValueStore.hpp"
#include "streams/BuiltinHandlers.hpp"
#include "streams/InMemoryStreamBroker.hpp"
#include <fmt/ranges.h>

namespace Rampart {

namespace {

RampartConfig validatedCore(RampartConfig config) {
    config.runtime.validate();
    config.resources.validate();
    config.breakers.validate();
    if (config.enableBackpressure) config.backpressure.validate();
    return config;
}

} // namespace

RampartRuntime::RampartRuntime(RampartConfig config, RuntimeDependencies deps)
    : m_config(validatedCore(std::move(config)))
    , m_clock(deps.clock ? *deps.clock : SystemClock::instance())
    , m_store(deps.store ? std::move(deps.store) : std::make_shared<InMemoryKeyValueStore>(m_clock))
{
    Log::setLevel(Log::parseLevel(m_config.runtime.logLevel.c_str()));

    m_executor = std::make_unique<BlockingExecutor>(m_config.runtime.executorThreads);

    std::unique_ptr<ResourceSampler> sampler = std::move(deps.sampler);
    if (!sampler) {
        sampler = std::make_unique<ProcResourceSampler>(m_config.resources.procRoot, m_config.resources.diskPath);
    }
    m_monitor = std::make_unique<ResourceMonitor>(m_config.resources, std::move(sampler), m_clock);

    m_breakers = std::make_unique<CircuitBreakerRegistry>(m_config.breakers, *m_executor, m_store, m_clock);
    m_breakers->preload();

    if (m_config.enableBackpressure) {
        m_backpressure = std::make_unique<BackpressureManager>(m_config.backpressure, *m_monitor, *m_executor);
    } else {
        LOG_I("App", "Backpressure disabled by configuration");
    }
    m_guard = std::make_unique<GuardedCaller>(*m_breakers, m_backpressure.get());

    if (m_config.enableStreams) {
        buildStreams(std::move(deps.broker));
    } else {
        LOG_I("App", "Event streams disabled by configuration");
    }

    if (m_config.enableMarketData) {
        buildMarketData(std::move(deps.rest), std::move(deps.transportFactory));
    } else {
        LOG_I("App", "Market data disabled by configuration");
    }
}

RampartRuntime::~RampartRuntime() {
    stop();
    // Abandoned executor work still holds backpressure permits; drain the pool before the
    // manager goes away.
    m_marketData.reset();
    m_streams.reset();
    m_guard.reset();
    m_executor.reset();
}

void RampartRuntime::buildStreams(std::shared_ptr<StreamBroker> broker) {
    try {
        m_config.streams.validate();
        m_config.healthAlert.validate("streams.health_alert");

        if (!broker) broker = std::make_shared<InMemoryStreamBroker>(m_clock);
        m_streams = std::make_unique<EventStreamManager>(m_config.streams, std::move(broker),
                                                         *m_executor, m_monitor.get(), m_clock);
        installBuiltinHandlers(*m_streams, m_store, m_monitor.get(), m_config.healthAlert);
        for (const auto& svc : m_config.streams.services) {
            if (!m_streams->hasHandler(svc.service)) {
                m_streams->registerHandler(svc.service, std::make_shared<LoggingServiceHandler>(svc.service));
            }
        }
    } catch (const ConfigError& e) {
        m_streams.reset();
        m_disabled.push_back("streams");
        rLog_Error("Event streams disabled: {}", e.what());
    }
}

void RampartRuntime::buildMarketData(std::shared_ptr<RestPriceClient> rest,
                                     MarketDataManager::TransportFactory transportFactory) {
    try {
        m_config.marketData.validate();
        if (!rest) rest = std::make_shared<CoinGeckoPriceClient>(m_config.rest);

        m_marketData = std::make_unique<MarketDataManager>(m_config.marketData, std::move(rest), *m_guard,
                                                           m_streams.get(), m_store, m_clock,
                                                           std::move(transportFactory));
    } catch (const ConfigError& e) {
        m_marketData.reset();
        m_disabled.push_back("market_data");
        rLog_Error("Market data disabled: {}", e.what());
    }
}

void RampartRuntime::start() {
    if (m_running.exchange(true)) return;

    rLog_App("Starting Rampart runtime ({} executor threads)", m_config.runtime.executorThreads);
    m_monitor->start();
    m_breakers->start();
    if (m_streams) m_streams->start();
    if (m_marketData) m_marketData->start();

    if (!m_disabled.empty()) {
        rLog_Warning("Runtime started with {} subsystem(s) disabled: {}",
                     m_disabled.size(), fmt::join(m_disabled, ", "));
    }
}

void RampartRuntime::stop() {
    if (!m_running.exchange(false)) return;

    rLog_App("Stopping Rampart runtime");
    if (m_marketData) m_marketData->stop();
    if (m_streams) m_streams->stop();
    m_breakers->stop();
    m_monitor->stop();
    rLog_App("Rampart runtime stopped ({} abandoned blocking calls)", m_executor->abandoned());
}

RuntimeStatus RampartRuntime::status() const {
    RuntimeStatus out;
    out.running = m_running.load();
    out.resources = m_monitor->snapshot();
    out.breakers = m_breakers->stats();
    if (m_backpressure) out.backpressure = m_backpressure->stats();
    if (m_streams) out.streams = m_streams->status();
    if (m_marketData) out.marketData = m_marketData->status();
    out.disabled = m_disabled;
    out.abandonedCalls = m_executor->abandoned();
    return out;
}

} // namespace Rampart
