#include "marketdata/dispatch/TickerParser.hpp"
#include "marketdata/ws/SubscriptionManager.hpp"
#include "RampartErrors.hpp"
#include <charconv>
#include <cstdlib>

namespace Rampart {

namespace {

int toInt(std::string_view s) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return -1;
    return v;
}

double optionalNumber(const nlohmann::json& obj, const char* field) {
    if (!obj.contains(field) || obj[field].is_null()) return 0.0;
    return TickerParser::number(obj[field], field);
}

// Kraken sends most ticker values as ["today", "last 24h"] pairs.
double krakenValue(const nlohmann::json& body, const char* field, std::size_t index) {
    if (!body.contains(field)) return 0.0;
    const auto& arr = body[field];
    if (!arr.is_array() || arr.size() <= index) return 0.0;
    return TickerParser::number(arr[index], field);
}

void fillChange(MarketDataPoint& p, double open) {
    if (open > 0.0) {
        p.change24h = p.price - open;
        p.changePercent24h = p.change24h / open * 100.0;
    }
}

void requirePrice(const MarketDataPoint& p, const char* exchange) {
    if (!(p.price > 0.0)) {
        throw DataIntegrityError(std::string(exchange) + " ticker for '" + p.symbol + "' has no positive price");
    }
    if (p.symbol.empty()) throw DataIntegrityError(std::string(exchange) + " ticker without symbol");
}

} // namespace

double TickerParser::number(const nlohmann::json& v, const char* field) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        const char* begin = s.c_str();
        char* end = nullptr;
        const double value = std::strtod(begin, &end);
        if (end != begin && *end == '\0') return value;
    }
    throw DataIntegrityError(std::string("field '") + field + "' is not numeric: " + v.dump());
}

std::optional<Clock::time_point> TickerParser::parseIso8601(std::string_view s) {
    if (s.size() < 19 || s[4] != '-' || s[7] != '-' || (s[10] != 'T' && s[10] != ' ')) return std::nullopt;

    const int yearValue   = toInt(s.substr(0, 4));
    const int monthValue  = toInt(s.substr(5, 2));
    const int dayValue    = toInt(s.substr(8, 2));
    const int hourValue   = toInt(s.substr(11, 2));
    const int minuteValue = toInt(s.substr(14, 2));
    const int secondValue = toInt(s.substr(17, 2));
    if (yearValue < 0 || monthValue < 0 || dayValue < 0 || hourValue < 0 || minuteValue < 0 || secondValue < 0) {
        return std::nullopt;
    }

    // Fractional seconds, kept to microsecond precision
    std::size_t pos = 19;
    std::int64_t micros = 0;
    int digits = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits > 0 && digits < 6) {
            micros *= 10;
            ++digits;
        }
    }

    int tzSign = 0;
    int tzHours = 0;
    int tzMinutes = 0;
    if (pos < s.size()) {
        const char tz = s[pos];
        if (tz == '+' || tz == '-') {
            tzSign = tz == '+' ? 1 : -1;
            if (pos + 3 > s.size()) return std::nullopt;
            tzHours = toInt(s.substr(pos + 1, 2));
            if (pos + 6 <= s.size() && s[pos + 3] == ':') tzMinutes = toInt(s.substr(pos + 4, 2));
            if (tzHours < 0 || tzMinutes < 0) return std::nullopt;
        } else if (tz != 'Z' && tz != 'z') {
            return std::nullopt;
        }
    }

    using namespace std::chrono;
    const auto y = year{yearValue};
    const auto m = month{static_cast<unsigned>(monthValue)};
    const auto d = day{static_cast<unsigned>(dayValue)};
    const year_month_day ymd{y, m, d};
    if (!ymd.ok() || hourValue > 23 || minuteValue > 59 || secondValue > 60) return std::nullopt;

    auto tp = sys_time<microseconds>(sys_days{ymd});
    tp += hours(hourValue) + minutes(minuteValue) + seconds(secondValue) + microseconds(micros);
    if (tzSign != 0) tp -= (hours(tzHours) + minutes(tzMinutes)) * tzSign;
    return time_point_cast<Clock::duration>(tp);
}

// ============================================================================
// Per-exchange ticker formats
// ============================================================================

std::optional<MarketDataPoint> TickerParser::parseBinance(const nlohmann::json& j, Clock::time_point receivedAt) {
    // Combined-stream frames wrap the payload: {"stream": "...", "data": {...}}
    if (j.is_object() && j.contains("data") && j["data"].is_object()) return parseBinance(j["data"], receivedAt);
    if (!j.is_object() || !j.contains("s") || !j.contains("c")) return std::nullopt;
    if (j.contains("e") && j["e"] != "24hrTicker") return std::nullopt;

    MarketDataPoint p;
    p.symbol           = SubscriptionManager::toCanonical(ExchangeId::Binance, j["s"].get<std::string>());
    p.price            = number(j["c"], "c");
    p.change24h        = optionalNumber(j, "p");
    p.changePercent24h = optionalNumber(j, "P");
    p.volume24h        = optionalNumber(j, "v");
    p.high24h          = optionalNumber(j, "h");
    p.low24h           = optionalNumber(j, "l");
    p.exchange         = "binance";
    p.source           = DataSource::WebSocket;
    p.timestamp        = receivedAt;
    if (j.contains("E") && j["E"].is_number_integer()) {
        p.timestamp = Clock::time_point(std::chrono::milliseconds(j["E"].get<std::int64_t>()));
    }
    requirePrice(p, "binance");
    return p;
}

std::optional<MarketDataPoint> TickerParser::parseCoinbase(const nlohmann::json& j, Clock::time_point receivedAt) {
    if (!j.is_object() || j.value("type", "") != "ticker" || !j.contains("product_id")) return std::nullopt;

    MarketDataPoint p;
    p.symbol    = SubscriptionManager::toCanonical(ExchangeId::Coinbase, j["product_id"].get<std::string>());
    p.price     = optionalNumber(j, "price");
    p.volume24h = optionalNumber(j, "volume_24h");
    p.high24h   = optionalNumber(j, "high_24h");
    p.low24h    = optionalNumber(j, "low_24h");
    fillChange(p, optionalNumber(j, "open_24h"));
    p.exchange  = "coinbase";
    p.source    = DataSource::WebSocket;
    p.timestamp = receivedAt;
    if (j.contains("time") && j["time"].is_string()) {
        if (auto t = parseIso8601(j["time"].get<std::string>())) p.timestamp = *t;
    }
    requirePrice(p, "coinbase");
    return p;
}

std::optional<MarketDataPoint> TickerParser::parseKraken(const nlohmann::json& j, Clock::time_point receivedAt) {
    // [channelID, {ticker body}, "ticker", "XBT/USD"]
    if (!j.is_array() || j.size() < 4) return std::nullopt;
    const auto& body = j[1];
    if (!body.is_object() || !body.contains("c") || !j[2].is_string() || j[2] != "ticker") return std::nullopt;

    MarketDataPoint p;
    p.symbol    = j[3].is_string() ? SubscriptionManager::toCanonical(ExchangeId::Kraken, j[3].get<std::string>()) : "";
    p.price     = krakenValue(body, "c", 0);
    p.volume24h = krakenValue(body, "v", 1);
    p.high24h   = krakenValue(body, "h", 1);
    p.low24h    = krakenValue(body, "l", 1);
    fillChange(p, krakenValue(body, "o", 1));
    p.exchange  = "kraken";
    p.source    = DataSource::WebSocket;
    p.timestamp = receivedAt;
    requirePrice(p, "kraken");
    return p;
}

std::optional<MarketDataPoint> TickerParser::parse(ExchangeId exchange, const nlohmann::json& j,
                                                   Clock::time_point receivedAt) {
    try {
        switch (exchange) {
            case ExchangeId::Binance:  return parseBinance(j, receivedAt);
            case ExchangeId::Coinbase: return parseCoinbase(j, receivedAt);
            case ExchangeId::Kraken:   return parseKraken(j, receivedAt);
        }
    } catch (const nlohmann::json::exception& e) {
        throw DataIntegrityError(std::string(toString(exchange)) + " ticker has unexpected shape: " + e.what());
    }
    return std::nullopt;
}

std::optional<MarketDataPoint> TickerParser::parse(ExchangeId exchange, const std::string& payload,
                                                   Clock::time_point receivedAt) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw DataIntegrityError(std::string(toString(exchange)) + " frame is not JSON: " + e.what());
    }
    return parse(exchange, j, receivedAt);
}

} // namespace Rampart
