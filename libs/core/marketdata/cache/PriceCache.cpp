#include "marketdata/cache/PriceCache.hpp"
#include "RampartErrors.hpp"
#include "RampartLogging.hpp"
#include <mutex>

namespace Rampart {

const char* toString(SymbolTier t) {
    switch (t) {
        case SymbolTier::Hot:  return "hot";
        case SymbolTier::Warm: return "warm";
        case SymbolTier::Cold: return "cold";
    }
    return "unknown";
}

void PriceCacheConfig::validate() const {
    if (hotTtl.count() <= 0 || warmTtl.count() <= 0 || coldTtl.count() <= 0) {
        throw ConfigError("market_data.cache TTLs must be positive");
    }
    for (const auto& s : hot) {
        if (warm.count(s)) throw ConfigError("symbol '" + s + "' is listed as both hot and warm");
    }
}

SymbolTier PriceCacheConfig::tierOf(const std::string& symbol) const {
    if (hot.count(symbol))  return SymbolTier::Hot;
    if (warm.count(symbol)) return SymbolTier::Warm;
    return SymbolTier::Cold;
}

PriceCache::PriceCache(PriceCacheConfig config, std::shared_ptr<KeyValueStore> store, const Clock& clock)
    : m_config(std::move(config))
    , m_store(std::move(store))
    , m_clock(clock)
{
    m_config.validate();
}

std::chrono::milliseconds PriceCache::ttlFor(const std::string& symbol) const {
    switch (tierOf(symbol)) {
        case SymbolTier::Hot:  return m_config.hotTtl;
        case SymbolTier::Warm: return m_config.warmTtl;
        case SymbolTier::Cold: return m_config.coldTtl;
    }
    return m_config.coldTtl;
}

void PriceCache::put(const MarketDataPoint& point) {
    {
        std::unique_lock lock(m_mutex);
        m_latest[point.symbol] = CachedPrice{point, m_clock.now()};
    }

    if (!m_store) return;
    try {
        m_store->set(storeKey(point.symbol), point.toJson(), ttlFor(point.symbol));
    } catch (const std::exception& e) {
        m_storeErrors.fetch_add(1, std::memory_order_relaxed);
        rLog_DataN(50, "Price write-through for {} failed: {}", point.symbol, e.what());
    }
}

std::optional<CachedPrice> PriceCache::lookup(const std::string& symbol) const {
    {
        std::shared_lock lock(m_mutex);
        auto it = m_latest.find(symbol);
        if (it != m_latest.end()) return it->second;
    }

    if (!m_store) return std::nullopt;
    try {
        auto raw = m_store->get(storeKey(symbol));
        if (!raw) return std::nullopt;
        auto point = MarketDataPoint::fromJson(*raw);
        const auto receivedAt = point.timestamp;
        return CachedPrice{std::move(point), receivedAt};
    } catch (const DataIntegrityError& e) {
        LOG_W("Data", "Ignoring unreadable cached price for {}: {}", symbol, e.what());
    } catch (const std::exception& e) {
        m_storeErrors.fetch_add(1, std::memory_order_relaxed);
        rLog_DataN(50, "Price lookup for {} in store failed: {}", symbol, e.what());
    }
    return std::nullopt;
}

Clock::duration PriceCache::ageOf(const CachedPrice& entry) const {
    return m_clock.now() - entry.receivedAt;
}

bool PriceCache::isFresh(const CachedPrice& entry) const {
    return ageOf(entry) < ttlFor(entry.point.symbol);
}

std::optional<CachedPrice> PriceCache::fresh(const std::string& symbol) const {
    auto entry = lookup(symbol);
    if (entry && isFresh(*entry)) return entry;
    return std::nullopt;
}

std::size_t PriceCache::size() const {
    std::shared_lock lock(m_mutex);
    return m_latest.size();
}

} // namespace Rampart
