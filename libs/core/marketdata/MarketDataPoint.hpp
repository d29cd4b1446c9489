#pragma once
#include "runtime/Clock.hpp"
#include "streams/StreamBroker.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace Rampart {

enum class DataSource { WebSocket, RestFallback, Cached };

const char* toString(DataSource s);
std::optional<DataSource> dataSourceFromString(std::string_view s);

// One normalized price observation. Passed around by value; subscribers get their own copy.
struct MarketDataPoint {
    std::string       symbol;              // canonical, e.g. "BTCUSDT"
    double            price{0.0};
    double            change24h{0.0};
    double            changePercent24h{0.0};
    double            volume24h{0.0};
    double            high24h{0.0};
    double            low24h{0.0};
    std::string       exchange;
    Clock::time_point timestamp{};
    DataSource        source{DataSource::WebSocket};

    // JSON form used for the price:<SYMBOL> store entries.
    [[nodiscard]] std::string toJson() const;
    static MarketDataPoint fromJson(const std::string& payload);   // throws DataIntegrityError

    // Field map published on market_updates.
    [[nodiscard]] StreamFields toStreamFields() const;
};

} // namespace Rampart
