/*
Rampart — MarketDataManager
Role: WebSocket-first price feed with per-symbol REST fallback, tiered caching and subscriber fan-out.
Inputs/Outputs: Ticker points from ExchangeConnections and REST quotes in; PriceCache entries,
                market_updates events and subscriber callbacks out. currentPrice() is the read contract.
Threading: Owns the io_context (one I/O thread) that runs every exchange connection. One fallback
           poller task per symbol in a TaskGroup. Subscriber callbacks run on their own strand of a
           dedicated thread_pool so a slow subscriber never stalls ingestion.
Performance: updatePriceData is a cache write, one stream append and one post per subscriber.
             REST calls are bounded by the tier timeout and guarded by the external_apis breaker.
Integration: Built by RampartRuntime with the shared GuardedCaller, EventStreamManager and store.
Observability: Per-source update counters, REST calls/failures, cache hits, subscriber drops and
               per-exchange connection status through status().
Related: ExchangeConnection.hpp, PriceCache.hpp, RestPriceClient.hpp, GuardedCaller.hpp.
Assumptions: Symbols are canonical ("BTCUSDT"). A point is "healthy" only while its source is
             WebSocket and it was received less than stalenessThreshold ago.
*/
#pragma once

#include "marketdata/Exchange.hpp"
#include "marketdata/ExchangeConnection.hpp"
#include "marketdata/MarketDataPoint.hpp"
#include "marketdata/cache/PriceCache.hpp"
#include "marketdata/rest/RestPriceClient.hpp"
#include "resilience/GuardedCaller.hpp"
#include "runtime/Clock.hpp"
#include "runtime/TaskGroup.hpp"
#include "store/KeyValueStore.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace Rampart {

class EventStreamManager;

struct MarketDataConfig {
    std::vector<std::string>    symbols{"BTCUSDT", "ETHUSDT", "SOLUSDT", "ADAUSDT",
                                        "DOTUSDT", "MATICUSDT", "LINKUSDT", "UNIUSDT"};
    std::vector<ExchangeConfig> exchanges = ExchangeConfig::defaults();
    PriceCacheConfig            cache;

    std::chrono::milliseconds stalenessThreshold{10000};   // WebSocket point older than this triggers REST
    std::chrono::milliseconds staleAfter{30000};           // silent connection is recycled
    std::chrono::milliseconds watchdogInterval{5000};
    std::chrono::milliseconds healthyRecheck{5000};        // poller sleep while WebSocket is healthy

    std::chrono::milliseconds hotFallbackBase{1000};
    std::chrono::milliseconds warmFallbackBase{2000};
    std::chrono::milliseconds coldFallbackBase{5000};
    std::chrono::milliseconds minFallbackInterval{1000};
    std::chrono::milliseconds maxFallbackInterval{30000};
    int                       maxFailureMultiplier{8};
    double                    fallbackJitter{0.10};

    std::chrono::milliseconds hotRestTimeout{2000};
    std::chrono::milliseconds warmRestTimeout{5000};
    std::chrono::milliseconds coldRestTimeout{10000};
    std::string               restBreaker{"external_apis"};

    std::size_t subscriberThreads{2};
    std::size_t subscriberBacklog{1000};

    bool enableWebSockets{true};
    bool enableFallbackPollers{true};
    bool publishToStreams{true};

    void validate() const;

    [[nodiscard]] std::chrono::milliseconds fallbackBaseFor(SymbolTier tier) const;
    [[nodiscard]] std::chrono::milliseconds restTimeoutFor(SymbolTier tier) const;
};

using SubscriptionId = std::uint64_t;
using PriceCallback = std::function<void(const MarketDataPoint&)>;

struct MarketDataStatus {
    bool                        running{false};
    std::vector<ExchangeStatus> exchanges;
    std::uint64_t               totalUpdates{0};
    std::array<std::uint64_t, 3> updatesBySource{};   // indexed by DataSource
    std::uint64_t               restCalls{0};
    std::uint64_t               restFailures{0};
    std::uint64_t               cacheHits{0};
    std::uint64_t               publishFailures{0};
    std::size_t                 subscribers{0};
    std::uint64_t               droppedNotifications{0};
    std::uint64_t               subscriberErrors{0};
    std::size_t                 fallbackPollers{0};
    std::size_t                 cachedSymbols{0};
    std::uint64_t               storeErrors{0};
};

class MarketDataManager {
public:
    using TransportFactory = ExchangeConnection::TransportFactory;

    // transportFactory defaults to BeastWsTransport on the manager's own io_context.
    MarketDataManager(MarketDataConfig config,
                      std::shared_ptr<RestPriceClient> rest,
                      GuardedCaller& guard,
                      EventStreamManager* streams,
                      std::shared_ptr<KeyValueStore> store,
                      const Clock& clock = SystemClock::instance(),
                      TransportFactory transportFactory = {});
    ~MarketDataManager();

    MarketDataManager(const MarketDataManager&) = delete;
    MarketDataManager& operator=(const MarketDataManager&) = delete;
    MarketDataManager(MarketDataManager&&) = delete;
    MarketDataManager& operator=(MarketDataManager&&) = delete;

    void start();
    void stop();

    // Single ingestion path for every source: cache, publish, notify.
    void updatePriceData(MarketDataPoint point);

    SubscriptionId subscribe(const std::string& symbol, PriceCallback callback);
    bool unsubscribe(SubscriptionId id);

    // Fresh cached point (marked Cached), else one REST fetch (cached as RestFallback), else nullopt.
    // CapacityError from the guarded REST call propagates.
    std::optional<MarketDataPoint> currentPrice(const std::string& symbol);

    // True when the cached point is missing, did not come from a WebSocket, or is older than
    // stalenessThreshold.
    [[nodiscard]] bool shouldFallback(const std::string& symbol) const;

    // base(tier) * min(2^failures, maxFailureMultiplier) * (1 + jitter), clamped.
    [[nodiscard]] std::chrono::milliseconds fallbackInterval(SymbolTier tier, int failures, double jitter) const;

    // One poller iteration; returns how long the poller should sleep next.
    std::chrono::milliseconds pollFallbackOnce(const std::string& symbol);

    [[nodiscard]] int fallbackFailures(const std::string& symbol) const;
    [[nodiscard]] MarketDataStatus status() const;
    [[nodiscard]] const MarketDataConfig& config() const noexcept { return m_config; }
    [[nodiscard]] PriceCache& cache() noexcept { return m_cache; }
    [[nodiscard]] bool running() const noexcept { return m_running.load(); }

private:
    struct Subscriber {
        SubscriptionId  id{0};
        std::string     symbol;
        PriceCallback   callback;
        boost::asio::strand<boost::asio::thread_pool::executor_type> strand;
        std::atomic<std::size_t> pending{0};
        std::atomic<bool>        active{true};

        Subscriber(SubscriptionId i, std::string s, PriceCallback cb,
                   boost::asio::strand<boost::asio::thread_pool::executor_type> st)
            : id(i), symbol(std::move(s)), callback(std::move(cb)), strand(std::move(st)) {}
    };

    std::optional<MarketDataPoint> fetchFromRest(const std::string& symbol);
    void notifySubscribers(const MarketDataPoint& point);
    void runFallbackPoller(const std::string& symbol, CancellationToken& token);
    void startConnections();
    void recordFallbackResult(const std::string& symbol, bool success);
    double nextJitter();

    const MarketDataConfig           m_config;
    std::shared_ptr<RestPriceClient> m_rest;
    GuardedCaller&                   m_guard;
    EventStreamManager*              m_streams;
    const Clock&                     m_clock;
    PriceCache                       m_cache;
    TransportFactory                 m_transportFactory;

    boost::asio::io_context          m_ioc;
    boost::asio::ssl::context        m_sslCtx{boost::asio::ssl::context::tlsv12_client};
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> m_workGuard;
    std::thread                      m_ioThread;
    std::vector<std::shared_ptr<ExchangeConnection>> m_connections;
    mutable std::mutex               m_connectionsMutex;

    boost::asio::thread_pool         m_subscriberPool;
    mutable std::mutex               m_subscribersMutex;
    std::map<SubscriptionId, std::shared_ptr<Subscriber>> m_subscribers;
    SubscriptionId                   m_nextSubscription{1};

    std::unique_ptr<TaskGroup>       m_pollers;
    std::atomic<std::size_t>         m_activePollers{0};

    mutable std::mutex                   m_fallbackMutex;
    std::unordered_map<std::string, int> m_fallbackFailures;
    std::mt19937                         m_rng{std::random_device{}()};

    std::atomic<bool>          m_running{false};
    std::atomic<std::uint64_t> m_totalUpdates{0};
    std::array<std::atomic<std::uint64_t>, 3> m_updatesBySource{};
    std::atomic<std::uint64_t> m_restCalls{0};
    std::atomic<std::uint64_t> m_restFailures{0};
    std::atomic<std::uint64_t> m_cacheHits{0};
    std::atomic<std::uint64_t> m_publishFailures{0};
    std::atomic<std::uint64_t> m_dropped{0};
    std::atomic<std::uint64_t> m_subscriberErrors{0};
};

} // namespace Rampart
