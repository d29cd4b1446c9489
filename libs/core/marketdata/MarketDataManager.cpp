#include "marketdata/MarketDataManager.hpp"
#include "marketdata/ws/BeastWsTransport.hpp"
#include "streams/EventStreamManager.hpp"
#include "RampartErrors.hpp"
#include "RampartLogging.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <cmath>
#include <set>

namespace Rampart {

namespace net = boost::asio;

// ============================================================================
// Config
// ============================================================================

void MarketDataConfig::validate() const {
    if (symbols.empty()) throw ConfigError("market_data.symbols must not be empty");
    std::set<std::string> seen;
    for (const auto& s : symbols) {
        if (s.empty()) throw ConfigError("market_data.symbols contains an empty symbol");
        if (!seen.insert(s).second) throw ConfigError("market_data.symbols lists '" + s + "' twice");
    }
    std::set<ExchangeId> exchangeIds;
    for (const auto& e : exchanges) {
        e.validate();
        if (!exchangeIds.insert(e.id).second) {
            throw ConfigError(std::string("market_data.exchanges lists '") + toString(e.id) + "' twice");
        }
    }
    cache.validate();

    if (stalenessThreshold.count() <= 0) throw ConfigError("market_data.staleness_threshold_ms must be positive");
    if (staleAfter.count() <= 0) throw ConfigError("market_data.stale_after_ms must be positive");
    if (watchdogInterval.count() <= 0) throw ConfigError("market_data.watchdog_interval_ms must be positive");
    if (healthyRecheck.count() <= 0) throw ConfigError("market_data.healthy_recheck_ms must be positive");
    if (hotFallbackBase.count() <= 0 || warmFallbackBase.count() <= 0 || coldFallbackBase.count() <= 0) {
        throw ConfigError("market_data fallback base intervals must be positive");
    }
    if (minFallbackInterval.count() <= 0 || minFallbackInterval > maxFallbackInterval) {
        throw ConfigError("market_data fallback bounds must satisfy 0 < min <= max");
    }
    if (maxFailureMultiplier < 1) throw ConfigError("market_data.max_failure_multiplier must be >= 1");
    if (fallbackJitter < 0.0 || fallbackJitter >= 1.0) throw ConfigError("market_data.fallback_jitter must be in [0, 1)");
    if (hotRestTimeout.count() <= 0 || warmRestTimeout.count() <= 0 || coldRestTimeout.count() <= 0) {
        throw ConfigError("market_data REST timeouts must be positive");
    }
    if (restBreaker.empty()) throw ConfigError("market_data.rest_breaker must not be empty");
    if (subscriberThreads == 0) throw ConfigError("market_data.subscriber_threads must be >= 1");
    if (subscriberBacklog == 0) throw ConfigError("market_data.subscriber_backlog must be >= 1");
}

std::chrono::milliseconds MarketDataConfig::fallbackBaseFor(SymbolTier tier) const {
    switch (tier) {
        case SymbolTier::Hot:  return hotFallbackBase;
        case SymbolTier::Warm: return warmFallbackBase;
        case SymbolTier::Cold: return coldFallbackBase;
    }
    return coldFallbackBase;
}

std::chrono::milliseconds MarketDataConfig::restTimeoutFor(SymbolTier tier) const {
    switch (tier) {
        case SymbolTier::Hot:  return hotRestTimeout;
        case SymbolTier::Warm: return warmRestTimeout;
        case SymbolTier::Cold: return coldRestTimeout;
    }
    return coldRestTimeout;
}

// ============================================================================
// Lifecycle
// ============================================================================

namespace {
MarketDataConfig validated(MarketDataConfig config) {
    config.validate();
    return config;
}
} // namespace

MarketDataManager::MarketDataManager(MarketDataConfig config,
                                     std::shared_ptr<RestPriceClient> rest,
                                     GuardedCaller& guard,
                                     EventStreamManager* streams,
                                     std::shared_ptr<KeyValueStore> store,
                                     const Clock& clock,
                                     TransportFactory transportFactory)
    : m_config(validated(std::move(config)))
    , m_rest(std::move(rest))
    , m_guard(guard)
    , m_streams(streams)
    , m_clock(clock)
    , m_cache(m_config.cache, std::move(store), clock)
    , m_transportFactory(std::move(transportFactory))
    , m_subscriberPool(m_config.subscriberThreads)
{
    m_sslCtx.set_default_verify_paths();
    m_sslCtx.set_verify_mode(net::ssl::verify_peer);

    if (!m_transportFactory) {
        m_transportFactory = [this](const ExchangeConfig& ex) -> std::shared_ptr<WsTransport> {
            return std::make_shared<BeastWsTransport>(m_ioc, m_sslCtx, ex.pingInterval);
        };
    }
    if (!m_rest) {
        LOG_W("Data", "No REST price client configured; fallback polling and cache misses return unavailable");
    }
    rLog_App("MarketDataManager initialized for {} symbols", m_config.symbols.size());
}

MarketDataManager::~MarketDataManager() {
    stop();
    m_subscriberPool.join();
}

void MarketDataManager::start() {
    if (m_running.exchange(true)) return;
    rLog_App("Starting market data ({} exchanges, websockets {})",
             m_config.exchanges.size(), m_config.enableWebSockets ? "on" : "off");

    if (m_config.enableWebSockets) {
        m_workGuard.emplace(m_ioc.get_executor());
        m_ioc.restart();
        m_ioThread = std::thread([this]{
            LOG_D("Data", "market-data io_context running");
            m_ioc.run();
            LOG_D("Data", "market-data io_context stopped");
        });
        startConnections();
    }

    if (m_config.enableFallbackPollers) {
        m_pollers = std::make_unique<TaskGroup>("market-data-fallback");
        for (const auto& symbol : m_config.symbols) {
            m_pollers->spawn("fallback:" + symbol, [this, symbol](CancellationToken& token){
                runFallbackPoller(symbol, token);
            });
        }
    }
}

void MarketDataManager::startConnections() {
    std::lock_guard lock(m_connectionsMutex);
    m_connections.clear();

    ConnectionOptions options;
    options.staleAfter = m_config.staleAfter;
    options.watchdogInterval = m_config.watchdogInterval;

    for (const auto& ex : m_config.exchanges) {
        if (!ex.enabled) {
            LOG_I("Data", "{} disabled in config", toString(ex.id));
            continue;
        }
        auto conn = std::make_shared<ExchangeConnection>(
            m_ioc, ex, m_config.symbols, m_transportFactory,
            [this](MarketDataPoint point){ updatePriceData(std::move(point)); },
            m_clock, options);
        conn->start();
        m_connections.push_back(std::move(conn));
    }
}

void MarketDataManager::stop() {
    if (!m_running.exchange(false)) return;
    rLog_App("Stopping market data...");

    if (m_pollers) {
        m_pollers->shutdown(std::chrono::seconds(5));
        m_pollers.reset();
    }

    {
        std::lock_guard lock(m_connectionsMutex);
        for (auto& conn : m_connections) conn->stop();
    }

    if (m_ioThread.joinable()) {
        m_workGuard.reset();
        m_ioc.stop();
        m_ioThread.join();
        // run the stop handlers posted above so transports are closed before they are released
        m_ioc.restart();
        m_ioc.poll();
    }

    {
        std::lock_guard lock(m_connectionsMutex);
        m_connections.clear();
    }
    rLog_App("Market data stopped");
}

// ============================================================================
// Ingestion
// ============================================================================

void MarketDataManager::updatePriceData(MarketDataPoint point) {
    if (point.symbol.empty() || !(point.price > 0.0) || !std::isfinite(point.price)) {
        rLog_DataN(50, "Ignoring unusable price update for '{}' ({})", point.symbol, point.price);
        return;
    }

    m_totalUpdates.fetch_add(1, std::memory_order_relaxed);
    m_updatesBySource[static_cast<std::size_t>(point.source)].fetch_add(1, std::memory_order_relaxed);

    m_cache.put(point);

    if (m_config.publishToStreams && m_streams) {
        if (!m_streams->publishEvent(EventType::PriceUpdate, point.toStreamFields())) {
            m_publishFailures.fetch_add(1, std::memory_order_relaxed);
        }
    }

    notifySubscribers(point);

    LOG_EVERY_N(DEBUG, 500, "Data", "Price updated: {} = {:.4f} ({} via {})",
                point.symbol, point.price, toString(point.source), point.exchange);
}

// ============================================================================
// Subscribers
// ============================================================================

SubscriptionId MarketDataManager::subscribe(const std::string& symbol, PriceCallback callback) {
    if (symbol.empty()) throw ConfigError("subscribe: symbol must not be empty");
    if (!callback) throw ConfigError("subscribe: callback must not be empty");

    std::lock_guard lock(m_subscribersMutex);
    const SubscriptionId id = m_nextSubscription++;
    m_subscribers.emplace(id, std::make_shared<Subscriber>(id, symbol, std::move(callback),
                                                           net::make_strand(m_subscriberPool.get_executor())));
    LOG_I("Data", "Subscribed #{} to {} updates", id, symbol);
    return id;
}

bool MarketDataManager::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(m_subscribersMutex);
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end()) return false;
    it->second->active.store(false);
    m_subscribers.erase(it);
    LOG_I("Data", "Unsubscribed #{}", id);
    return true;
}

void MarketDataManager::notifySubscribers(const MarketDataPoint& point) {
    std::vector<std::shared_ptr<Subscriber>> targets;
    {
        std::lock_guard lock(m_subscribersMutex);
        for (const auto& [id, sub] : m_subscribers) {
            if (sub->symbol == point.symbol) targets.push_back(sub);
        }
    }

    for (auto& sub : targets) {
        if (sub->pending.load() >= m_config.subscriberBacklog) {
            m_dropped.fetch_add(1, std::memory_order_relaxed);
            rLog_DataN(100, "Subscriber #{} for {} is {} updates behind; dropping update",
                       sub->id, sub->symbol, sub->pending.load());
            continue;
        }
        sub->pending.fetch_add(1);
        net::post(sub->strand, [this, sub, point]{
            if (sub->active.load()) {
                try {
                    sub->callback(point);
                } catch (const std::exception& e) {
                    m_subscriberErrors.fetch_add(1, std::memory_order_relaxed);
                    LOG_W("Data", "Subscriber #{} for {} failed: {}", sub->id, sub->symbol, e.what());
                }
            }
            sub->pending.fetch_sub(1);
        });
    }
}

// ============================================================================
// Fallback
// ============================================================================

bool MarketDataManager::shouldFallback(const std::string& symbol) const {
    const auto entry = m_cache.lookup(symbol);
    if (!entry) return true;
    if (entry->point.source != DataSource::WebSocket) return true;
    return m_cache.ageOf(*entry) > m_config.stalenessThreshold;
}

std::chrono::milliseconds MarketDataManager::fallbackInterval(SymbolTier tier, int failures, double jitter) const {
    double interval = static_cast<double>(m_config.fallbackBaseFor(tier).count());
    if (failures > 0) {
        const int exponent = std::min(failures, 30);
        const double multiplier = std::min(std::ldexp(1.0, exponent), static_cast<double>(m_config.maxFailureMultiplier));
        interval *= multiplier;
    }
    interval *= 1.0 + jitter;
    const auto ms = std::chrono::milliseconds(static_cast<std::int64_t>(interval));
    return std::clamp(ms, m_config.minFallbackInterval, m_config.maxFallbackInterval);
}

double MarketDataManager::nextJitter() {
    std::lock_guard lock(m_fallbackMutex);
    std::uniform_real_distribution<double> dist(-m_config.fallbackJitter, m_config.fallbackJitter);
    return dist(m_rng);
}

int MarketDataManager::fallbackFailures(const std::string& symbol) const {
    std::lock_guard lock(m_fallbackMutex);
    auto it = m_fallbackFailures.find(symbol);
    return it == m_fallbackFailures.end() ? 0 : it->second;
}

void MarketDataManager::recordFallbackResult(const std::string& symbol, bool success) {
    std::lock_guard lock(m_fallbackMutex);
    int& failures = m_fallbackFailures[symbol];
    failures = success ? std::max(0, failures - 1) : failures + 1;
}

std::chrono::milliseconds MarketDataManager::pollFallbackOnce(const std::string& symbol) {
    if (!shouldFallback(symbol)) return m_config.healthyRecheck;

    rLog_DataN(10, "WebSocket data for {} is missing or stale, polling REST", symbol);
    bool success = false;
    try {
        if (auto point = fetchFromRest(symbol)) {
            updatePriceData(std::move(*point));
            success = true;
        }
    } catch (const CapacityError& e) {
        rLog_DataN(20, "REST fallback for {} rejected: {}", symbol, e.what());
    } catch (const std::exception& e) {
        rLog_DataN(5, "REST fallback for {} failed: {}", symbol, e.what());
    }
    recordFallbackResult(symbol, success);

    return fallbackInterval(m_cache.tierOf(symbol), fallbackFailures(symbol), nextJitter());
}

void MarketDataManager::runFallbackPoller(const std::string& symbol, CancellationToken& token) {
    m_activePollers.fetch_add(1);
    while (!token.cancelled()) {
        std::chrono::milliseconds sleep = m_config.healthyRecheck;
        try {
            sleep = pollFallbackOnce(symbol);
        } catch (const std::exception& e) {
            rLog_Error("Fallback poller for {} failed: {}", symbol, e.what());
        }
        if (!token.sleepFor(sleep)) break;
    }
    m_activePollers.fetch_sub(1);
}

std::optional<MarketDataPoint> MarketDataManager::fetchFromRest(const std::string& symbol) {
    if (!m_rest) return std::nullopt;

    const auto tier = m_cache.tierOf(symbol);
    CallOptions options;
    options.priority = Priority::High;
    options.timeout = m_config.restTimeoutFor(tier);

    m_restCalls.fetch_add(1, std::memory_order_relaxed);
    std::optional<RestQuote> quote;
    try {
        quote = m_guard.call(m_config.restBreaker,
                             [client = m_rest, symbol]{ return client->fetchPrice(symbol); },
                             options);
    } catch (const std::exception&) {
        m_restFailures.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
    if (!quote) return std::nullopt;

    MarketDataPoint point;
    point.symbol = symbol;
    point.price = quote->price;
    point.volume24h = quote->volume24h;
    point.changePercent24h = quote->changePercent24h;
    point.exchange = quote->provider + "_rest";
    point.timestamp = m_clock.now();
    point.source = DataSource::RestFallback;
    return point;
}

// ============================================================================
// Reads
// ============================================================================

std::optional<MarketDataPoint> MarketDataManager::currentPrice(const std::string& symbol) {
    if (auto entry = m_cache.fresh(symbol)) {
        m_cacheHits.fetch_add(1, std::memory_order_relaxed);
        m_updatesBySource[static_cast<std::size_t>(DataSource::Cached)].fetch_add(1, std::memory_order_relaxed);
        MarketDataPoint point = entry->point;
        point.source = DataSource::Cached;
        return point;
    }

    std::optional<MarketDataPoint> point;
    try {
        point = fetchFromRest(symbol);
    } catch (const CapacityError&) {
        throw;
    } catch (const std::exception& e) {
        rLog_DataN(5, "currentPrice({}) REST fetch failed: {}", symbol, e.what());
        return std::nullopt;
    }
    if (!point) return std::nullopt;

    updatePriceData(*point);
    return point;
}

MarketDataStatus MarketDataManager::status() const {
    MarketDataStatus s;
    s.running = m_running.load();
    {
        std::lock_guard lock(m_connectionsMutex);
        for (const auto& conn : m_connections) s.exchanges.push_back(conn->status());
    }
    s.totalUpdates = m_totalUpdates.load();
    for (std::size_t i = 0; i < s.updatesBySource.size(); ++i) s.updatesBySource[i] = m_updatesBySource[i].load();
    s.restCalls = m_restCalls.load();
    s.restFailures = m_restFailures.load();
    s.cacheHits = m_cacheHits.load();
    s.publishFailures = m_publishFailures.load();
    {
        std::lock_guard lock(m_subscribersMutex);
        s.subscribers = m_subscribers.size();
    }
    s.droppedNotifications = m_dropped.load();
    s.subscriberErrors = m_subscriberErrors.load();
    s.fallbackPollers = m_activePollers.load();
    s.cachedSymbols = m_cache.size();
    s.storeErrors = m_cache.storeErrors();
    return s;
}

} // namespace Rampart
