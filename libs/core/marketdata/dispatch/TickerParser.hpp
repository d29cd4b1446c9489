/*
Rampart — TickerParser
Role: Normalizes exchange ticker frames into MarketDataPoint.
Inputs/Outputs: Raw WebSocket payload (or parsed JSON) plus the exchange it came from; returns a
                point for ticker frames, nullopt for everything else (acks, heartbeats, status).
Threading: Stateless; called on the market-data io_context.
Performance: One JSON parse per frame; numeric fields converted with from_chars/strtod.
Integration: ExchangeConnection feeds every inbound frame through parse().
Observability: None; callers log and count DataIntegrityError.
Related: MarketDataPoint.hpp, SubscriptionManager.hpp, ExchangeConnection.hpp.
Assumptions: A frame that identifies itself as a ticker but lacks a usable price is malformed and
             throws DataIntegrityError; the caller drops that single frame.
*/
#pragma once

#include "marketdata/Exchange.hpp"
#include "marketdata/MarketDataPoint.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace Rampart {

class TickerParser {
public:
    static std::optional<MarketDataPoint> parse(ExchangeId exchange, const std::string& payload,
                                                Clock::time_point receivedAt);
    static std::optional<MarketDataPoint> parse(ExchangeId exchange, const nlohmann::json& j,
                                                Clock::time_point receivedAt);

    static std::optional<MarketDataPoint> parseBinance(const nlohmann::json& j, Clock::time_point receivedAt);
    static std::optional<MarketDataPoint> parseCoinbase(const nlohmann::json& j, Clock::time_point receivedAt);
    static std::optional<MarketDataPoint> parseKraken(const nlohmann::json& j, Clock::time_point receivedAt);

    // "2023-02-09T20:32:50.714964Z" or with a +HH:MM offset. nullopt when unparseable.
    static std::optional<Clock::time_point> parseIso8601(std::string_view s);

    // Accepts a JSON string or number.
    static double number(const nlohmann::json& v, const char* field);
};

} // namespace Rampart
