/*
Rampart — PriceCache
Role: Latest MarketDataPoint per symbol with freshness judged by the symbol's priority tier.
Inputs/Outputs: put() from every ingestion path; lookup()/fresh() for readers.
Threading: std::shared_mutex; many concurrent readers, exclusive writers.
Performance: One hash lookup per call. The local entry is kept after its TTL so staleness
             (age of the last WebSocket point) stays observable.
Integration: Owned by MarketDataManager. Writes through to the KeyValueStore as price:<SYMBOL>
             with the tier TTL; reads fall back to the store for points another instance wrote.
Observability: Counts store read/write failures; they are logged and never surface to callers.
Related: MarketDataManager.hpp, MarketDataPoint.hpp, KeyValueStore.hpp.
*/
#pragma once

#include "marketdata/MarketDataPoint.hpp"
#include "runtime/Clock.hpp"
#include "store/KeyValueStore.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace Rampart {

enum class SymbolTier { Hot, Warm, Cold };

const char* toString(SymbolTier t);

struct PriceCacheConfig {
    std::chrono::milliseconds hotTtl{1000};
    std::chrono::milliseconds warmTtl{5000};
    std::chrono::milliseconds coldTtl{15000};
    std::set<std::string>     hot{"BTCUSDT", "ETHUSDT", "SOLUSDT", "ADAUSDT"};
    std::set<std::string>     warm{"DOTUSDT", "MATICUSDT", "LINKUSDT", "UNIUSDT"};

    void validate() const;
    [[nodiscard]] SymbolTier tierOf(const std::string& symbol) const;
};

struct CachedPrice {
    MarketDataPoint   point;
    Clock::time_point receivedAt{};
};

class PriceCache {
public:
    PriceCache(PriceCacheConfig config, std::shared_ptr<KeyValueStore> store, const Clock& clock);

    void put(const MarketDataPoint& point);

    // Last known point (local first, then the store), regardless of age.
    [[nodiscard]] std::optional<CachedPrice> lookup(const std::string& symbol) const;

    // Last known point if it is still within its tier TTL.
    [[nodiscard]] std::optional<CachedPrice> fresh(const std::string& symbol) const;

    [[nodiscard]] bool isFresh(const CachedPrice& entry) const;
    [[nodiscard]] Clock::duration ageOf(const CachedPrice& entry) const;

    [[nodiscard]] SymbolTier tierOf(const std::string& symbol) const { return m_config.tierOf(symbol); }
    [[nodiscard]] std::chrono::milliseconds ttlFor(const std::string& symbol) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::uint64_t storeErrors() const noexcept { return m_storeErrors.load(); }

    static std::string storeKey(const std::string& symbol) { return "price:" + symbol; }

private:
    const PriceCacheConfig                       m_config;
    std::shared_ptr<KeyValueStore>               m_store;
    const Clock&                                 m_clock;

    mutable std::shared_mutex                    m_mutex;
    std::unordered_map<std::string, CachedPrice> m_latest;
    mutable std::atomic<std::uint64_t>           m_storeErrors{0};
};

} // namespace Rampart
