/*
Rampart — TickerParser Tests
Role: Verify exchange ticker frames normalize to MarketDataPoint
Testing Strategy: Golden JSON fixtures → assert symbol, price and 24h fields
Coverage: Binance (plain and combined), Coinbase, Kraken, non-ticker frames, malformed input, ISO-8601
*/
#include <gtest/gtest.h>
#include "marketdata/dispatch/TickerParser.hpp"
#include "RampartErrors.hpp"
#include "fixtures/ticker_messages.hpp"

using namespace Rampart;
using namespace std::chrono;

namespace {
const Clock::time_point kReceived = Clock::time_point(milliseconds(1700000999000));
}

// =============================================================================
// Binance
// =============================================================================

TEST(TickerParser, BinanceTicker) {
    auto p = TickerParser::parse(ExchangeId::Binance, fixtures::binanceTicker("BTCUSDT", "43210.55"), kReceived);

    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->symbol, "BTCUSDT");
    EXPECT_DOUBLE_EQ(p->price, 43210.55);
    EXPECT_DOUBLE_EQ(p->change24h, -150.50);
    EXPECT_DOUBLE_EQ(p->changePercent24h, -0.35);
    EXPECT_DOUBLE_EQ(p->volume24h, 12345.67);
    EXPECT_DOUBLE_EQ(p->high24h, 43500.0);
    EXPECT_DOUBLE_EQ(p->low24h, 42000.0);
    EXPECT_EQ(p->exchange, "binance");
    EXPECT_EQ(p->source, DataSource::WebSocket);
    // Event time wins over receive time
    EXPECT_EQ(p->timestamp, Clock::time_point(milliseconds(1700000000123)));
}

TEST(TickerParser, BinanceCombinedStreamEnvelope) {
    auto frame = fixtures::binanceCombined("ethusdt@ticker", fixtures::binanceTicker("ETHUSDT", "2250.10"));
    auto p = TickerParser::parse(ExchangeId::Binance, frame.dump(), kReceived);

    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->symbol, "ETHUSDT");
    EXPECT_DOUBLE_EQ(p->price, 2250.10);
}

TEST(TickerParser, BinanceOtherEventIsIgnored) {
    auto frame = fixtures::binanceTicker("BTCUSDT", "43210.55");
    frame["e"] = "trade";
    EXPECT_FALSE(TickerParser::parse(ExchangeId::Binance, frame, kReceived).has_value());
}

TEST(TickerParser, BinanceSubscribeAckIsIgnored) {
    nlohmann::json ack = {{"result", nullptr}, {"id", 1}};
    EXPECT_FALSE(TickerParser::parse(ExchangeId::Binance, ack, kReceived).has_value());
}

TEST(TickerParser, BinanceZeroPriceIsMalformed) {
    EXPECT_THROW(TickerParser::parse(ExchangeId::Binance, fixtures::binanceTicker("BTCUSDT", "0"), kReceived),
                 DataIntegrityError);
}

TEST(TickerParser, BinanceNonNumericPriceIsMalformed) {
    EXPECT_THROW(TickerParser::parse(ExchangeId::Binance, fixtures::binanceTicker("BTCUSDT", "abc"), kReceived),
                 DataIntegrityError);
}

// =============================================================================
// Coinbase
// =============================================================================

TEST(TickerParser, CoinbaseTickerDerivesChangeFromOpen) {
    auto p = TickerParser::parse(ExchangeId::Coinbase, fixtures::coinbaseTicker("SOL-USD", "110.00", "100.00"),
                                 kReceived);

    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->symbol, "SOLUSD");
    EXPECT_DOUBLE_EQ(p->price, 110.0);
    EXPECT_DOUBLE_EQ(p->change24h, 10.0);
    EXPECT_DOUBLE_EQ(p->changePercent24h, 10.0);
    EXPECT_DOUBLE_EQ(p->volume24h, 5000.5);
    EXPECT_EQ(p->exchange, "coinbase");
}

TEST(TickerParser, CoinbaseTimestampIsParsed) {
    auto p = TickerParser::parse(ExchangeId::Coinbase, fixtures::coinbaseTicker("BTC-USD", "65000.00"), kReceived);

    ASSERT_TRUE(p.has_value());
    auto expected = sys_days{year{2024} / March / 1} + hours(12) + milliseconds(250);
    EXPECT_EQ(p->timestamp, time_point_cast<Clock::duration>(expected));
}

TEST(TickerParser, CoinbaseSubscriptionAckIsIgnored) {
    EXPECT_FALSE(TickerParser::parse(ExchangeId::Coinbase, fixtures::coinbaseSubscriptionsAck(), kReceived));
}

TEST(TickerParser, CoinbaseTickerWithoutPriceIsMalformed) {
    auto frame = fixtures::coinbaseTicker("BTC-USD", "1");
    frame.erase("price");
    EXPECT_THROW(TickerParser::parse(ExchangeId::Coinbase, frame, kReceived), DataIntegrityError);
}

// =============================================================================
// Kraken
// =============================================================================

TEST(TickerParser, KrakenTickerMapsXbtToBtc) {
    auto p = TickerParser::parse(ExchangeId::Kraken, fixtures::krakenTicker("XBT/USD", "2100.0", "2000.0"),
                                 kReceived);

    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->symbol, "BTCUSD");
    EXPECT_DOUBLE_EQ(p->price, 2100.0);
    EXPECT_DOUBLE_EQ(p->volume24h, 820.25);
    EXPECT_DOUBLE_EQ(p->high24h, 2060.0);
    EXPECT_DOUBLE_EQ(p->low24h, 1980.0);
    EXPECT_DOUBLE_EQ(p->changePercent24h, 5.0);
    EXPECT_EQ(p->timestamp, kReceived);
}

TEST(TickerParser, KrakenHeartbeatIsIgnored) {
    EXPECT_FALSE(TickerParser::parse(ExchangeId::Kraken, fixtures::krakenHeartbeat(), kReceived));
}

// =============================================================================
// Malformed frames
// =============================================================================

TEST(TickerParser, NonJsonPayloadThrows) {
    EXPECT_THROW(TickerParser::parse(ExchangeId::Binance, std::string("{not json"), kReceived), DataIntegrityError);
}

TEST(TickerParser, WrongFieldTypeThrowsDataIntegrity) {
    auto frame = fixtures::binanceTicker("BTCUSDT", "100");
    frame["s"] = 42;
    EXPECT_THROW(TickerParser::parse(ExchangeId::Binance, frame, kReceived), DataIntegrityError);
}

// =============================================================================
// ISO-8601
// =============================================================================

TEST(TickerParser, Iso8601WithOffset) {
    auto t = TickerParser::parseIso8601("2024-03-01T14:30:00+02:30");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, time_point_cast<Clock::duration>(sys_days{year{2024} / March / 1} + hours(12)));
}

TEST(TickerParser, Iso8601NanosecondsTruncateToMicros) {
    auto t = TickerParser::parseIso8601("2023-02-09T20:32:50.714964855Z");
    ASSERT_TRUE(t.has_value());
    auto expected = sys_days{year{2023} / February / 9} + hours(20) + minutes(32) + seconds(50) + microseconds(714964);
    EXPECT_EQ(*t, time_point_cast<Clock::duration>(expected));
}

TEST(TickerParser, Iso8601RejectsGarbage) {
    EXPECT_FALSE(TickerParser::parseIso8601("yesterday").has_value());
    EXPECT_FALSE(TickerParser::parseIso8601("2024-13-01T00:00:00Z").has_value());
}
