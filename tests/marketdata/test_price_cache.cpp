/*
Rampart — PriceCache Tests
Role: Verify tiered freshness, store write-through and store fallback reads
Testing Strategy: ManualClock + InMemoryKeyValueStore → advance time, assert fresh/lookup
Coverage: Tier TTLs, stale entries kept for lookup, cross-instance reads, failing store
*/
#include <gtest/gtest.h>
#include "marketdata/cache/PriceCache.hpp"
#include "store/InMemoryKeyValueStore.hpp"
#include "RampartErrors.hpp"
#include "fixtures/failing_store.hpp"

using namespace Rampart;
using namespace std::chrono_literals;

namespace {

MarketDataPoint point(const std::string& symbol, double price, Clock::time_point ts) {
    MarketDataPoint p;
    p.symbol = symbol;
    p.price = price;
    p.exchange = "binance";
    p.timestamp = ts;
    p.source = DataSource::WebSocket;
    return p;
}

} // namespace

// =============================================================================
// Tiers
// =============================================================================

TEST(PriceCache, DefaultTiers) {
    ManualClock clock;
    PriceCache cache({}, nullptr, clock);

    EXPECT_EQ(cache.tierOf("BTCUSDT"), SymbolTier::Hot);
    EXPECT_EQ(cache.tierOf("LINKUSDT"), SymbolTier::Warm);
    EXPECT_EQ(cache.tierOf("DOGEUSDT"), SymbolTier::Cold);
    EXPECT_EQ(cache.ttlFor("BTCUSDT"), 1000ms);
    EXPECT_EQ(cache.ttlFor("LINKUSDT"), 5000ms);
    EXPECT_EQ(cache.ttlFor("DOGEUSDT"), 15000ms);
}

TEST(PriceCache, OverlappingTiersRejected) {
    PriceCacheConfig cfg;
    cfg.warm.insert("BTCUSDT");
    EXPECT_THROW(cfg.validate(), ConfigError);
}

// =============================================================================
// Freshness
// =============================================================================

TEST(PriceCache, HotEntryExpiresAfterOneSecondButStaysInLookup) {
    ManualClock clock;
    PriceCache cache({}, nullptr, clock);
    cache.put(point("BTCUSDT", 43000.0, clock.now()));

    EXPECT_TRUE(cache.fresh("BTCUSDT").has_value());

    clock.advance(1500ms);
    EXPECT_FALSE(cache.fresh("BTCUSDT").has_value());

    auto last = cache.lookup("BTCUSDT");
    ASSERT_TRUE(last.has_value());
    EXPECT_DOUBLE_EQ(last->point.price, 43000.0);
    EXPECT_EQ(cache.ageOf(*last), std::chrono::duration_cast<Clock::duration>(1500ms));
}

TEST(PriceCache, ColdEntryStaysFreshLonger) {
    ManualClock clock;
    PriceCache cache({}, nullptr, clock);
    cache.put(point("DOGEUSDT", 0.08, clock.now()));

    clock.advance(10s);
    EXPECT_TRUE(cache.fresh("DOGEUSDT").has_value());
    clock.advance(6s);
    EXPECT_FALSE(cache.fresh("DOGEUSDT").has_value());
}

TEST(PriceCache, NewerPutReplacesEntry) {
    ManualClock clock;
    PriceCache cache({}, nullptr, clock);
    cache.put(point("ETHUSDT", 2000.0, clock.now()));
    clock.advance(2s);
    cache.put(point("ETHUSDT", 2010.0, clock.now()));

    auto fresh = cache.fresh("ETHUSDT");
    ASSERT_TRUE(fresh.has_value());
    EXPECT_DOUBLE_EQ(fresh->point.price, 2010.0);
    EXPECT_EQ(cache.size(), 1);
}

// =============================================================================
// Store write-through
// =============================================================================

TEST(PriceCache, WritesThroughWithTierTtl) {
    ManualClock clock;
    auto store = std::make_shared<InMemoryKeyValueStore>(clock);
    PriceCache cache({}, store, clock);
    cache.put(point("BTCUSDT", 43000.0, clock.now()));

    auto raw = store->get(PriceCache::storeKey("BTCUSDT"));
    ASSERT_TRUE(raw.has_value());
    EXPECT_DOUBLE_EQ(MarketDataPoint::fromJson(*raw).price, 43000.0);

    clock.advance(1001ms);
    EXPECT_FALSE(store->get(PriceCache::storeKey("BTCUSDT")).has_value());
}

TEST(PriceCache, ReadsPointWrittenByAnotherInstance) {
    ManualClock clock;
    auto store = std::make_shared<InMemoryKeyValueStore>(clock);
    PriceCache writer({}, store, clock);
    PriceCache reader({}, store, clock);

    writer.put(point("SOLUSDT", 150.0, clock.now()));

    auto fresh = reader.fresh("SOLUSDT");
    ASSERT_TRUE(fresh.has_value());
    EXPECT_DOUBLE_EQ(fresh->point.price, 150.0);
    EXPECT_EQ(reader.size(), 0);
}

TEST(PriceCache, UnreadableStoreEntryIsIgnored) {
    ManualClock clock;
    auto store = std::make_shared<InMemoryKeyValueStore>(clock);
    store->set(PriceCache::storeKey("ADAUSDT"), "{garbage", 10s);
    PriceCache cache({}, store, clock);

    EXPECT_FALSE(cache.lookup("ADAUSDT").has_value());
}

TEST(PriceCache, FailingStoreDegradesToLocal) {
    ManualClock clock;
    auto store = std::make_shared<FailingStore>();
    PriceCache cache({}, store, clock);

    cache.put(point("BTCUSDT", 43000.0, clock.now()));
    EXPECT_TRUE(cache.fresh("BTCUSDT").has_value());
    EXPECT_FALSE(cache.lookup("ETHUSDT").has_value());
    EXPECT_EQ(cache.storeErrors(), 2);
}
