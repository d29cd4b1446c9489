#include "marketdata/MarketDataPoint.hpp"
#include "RampartErrors.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace Rampart {

const char* toString(DataSource s) {
    switch (s) {
        case DataSource::WebSocket:    return "websocket";
        case DataSource::RestFallback: return "rest_fallback";
        case DataSource::Cached:       return "cached";
    }
    return "unknown";
}

std::optional<DataSource> dataSourceFromString(std::string_view s) {
    if (s == "websocket")     return DataSource::WebSocket;
    if (s == "rest_fallback") return DataSource::RestFallback;
    if (s == "cached")        return DataSource::Cached;
    return std::nullopt;
}

namespace {

std::int64_t toMs(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

std::string MarketDataPoint::toJson() const {
    nlohmann::json j;
    j["symbol"]             = symbol;
    j["price"]              = price;
    j["change_24h"]         = change24h;
    j["change_percent_24h"] = changePercent24h;
    j["volume_24h"]         = volume24h;
    j["high_24h"]           = high24h;
    j["low_24h"]            = low24h;
    j["exchange"]           = exchange;
    j["timestamp_ms"]       = toMs(timestamp);
    j["source"]             = toString(source);
    return j.dump();
}

MarketDataPoint MarketDataPoint::fromJson(const std::string& payload) {
    try {
        const auto j = nlohmann::json::parse(payload);
        MarketDataPoint p;
        p.symbol           = j.at("symbol").get<std::string>();
        p.price            = j.at("price").get<double>();
        p.change24h        = j.value("change_24h", 0.0);
        p.changePercent24h = j.value("change_percent_24h", 0.0);
        p.volume24h        = j.value("volume_24h", 0.0);
        p.high24h          = j.value("high_24h", 0.0);
        p.low24h           = j.value("low_24h", 0.0);
        p.exchange         = j.value("exchange", std::string{});
        p.timestamp        = Clock::time_point(std::chrono::milliseconds(j.at("timestamp_ms").get<std::int64_t>()));

        const auto source = dataSourceFromString(j.value("source", std::string{"websocket"}));
        if (!source) throw DataIntegrityError("unknown data source in cached price for " + p.symbol);
        p.source = *source;

        if (p.symbol.empty() || !(p.price > 0.0)) {
            throw DataIntegrityError("cached price entry without symbol or positive price");
        }
        return p;
    } catch (const nlohmann::json::exception& e) {
        throw DataIntegrityError(std::string("malformed cached price: ") + e.what());
    }
}

StreamFields MarketDataPoint::toStreamFields() const {
    return {
        {"symbol",             symbol},
        {"price",              fmt::format("{}", price)},
        {"change_24h",         fmt::format("{}", change24h)},
        {"change_percent_24h", fmt::format("{}", changePercent24h)},
        {"volume_24h",         fmt::format("{}", volume24h)},
        {"high_24h",           fmt::format("{}", high24h)},
        {"low_24h",            fmt::format("{}", low24h)},
        {"exchange",           exchange},
        {"source",             toString(source)},
        {"price_timestamp",    std::to_string(toMs(timestamp))},
    };
}

} // namespace Rampart
