#include "marketdata/Exchange.hpp"
#include "RampartErrors.hpp"

namespace Rampart {

using namespace std::chrono_literals;

const char* toString(ExchangeId id) {
    switch (id) {
        case ExchangeId::Binance:  return "binance";
        case ExchangeId::Coinbase: return "coinbase";
        case ExchangeId::Kraken:   return "kraken";
    }
    return "unknown";
}

std::optional<ExchangeId> exchangeFromString(std::string_view s) {
    if (s == "binance")  return ExchangeId::Binance;
    if (s == "coinbase") return ExchangeId::Coinbase;
    if (s == "kraken")   return ExchangeId::Kraken;
    return std::nullopt;
}

void ExchangeConfig::validate() const {
    const std::string name = toString(id);
    if (host.empty()) throw ConfigError("exchange '" + name + "': host must not be empty");
    if (port.empty()) throw ConfigError("exchange '" + name + "': port must not be empty");
    if (path.empty() || path.front() != '/') throw ConfigError("exchange '" + name + "': path must start with '/'");
    if (reconnectDelay.count() <= 0) throw ConfigError("exchange '" + name + "': reconnect_delay_ms must be positive");
    if (maxRetries < 1) throw ConfigError("exchange '" + name + "': max_retries must be >= 1");
    if (pingInterval.count() <= 0) throw ConfigError("exchange '" + name + "': ping_interval_ms must be positive");
    if (symbolsPerConnection == 0) throw ConfigError("exchange '" + name + "': symbols_per_connection must be >= 1");
}

ExchangeConfig ExchangeConfig::defaultsFor(ExchangeId id) {
    ExchangeConfig c;
    c.id = id;
    switch (id) {
        case ExchangeId::Binance:
            c.host = "stream.binance.com";
            c.port = "9443";
            c.path = "/ws/";
            c.reconnectDelay = 5s;
            c.maxRetries = 10;
            c.pingInterval = 20s;
            c.symbolsPerConnection = 200;
            break;
        case ExchangeId::Coinbase:
            c.host = "ws-feed.exchange.coinbase.com";
            c.reconnectDelay = 3s;
            c.maxRetries = 5;
            c.pingInterval = 30s;
            c.symbolsPerConnection = 100;
            break;
        case ExchangeId::Kraken:
            c.host = "ws.kraken.com";
            c.reconnectDelay = 7s;
            c.maxRetries = 8;
            c.pingInterval = 25s;
            c.symbolsPerConnection = 50;
            break;
    }
    return c;
}

std::vector<ExchangeConfig> ExchangeConfig::defaults() {
    return {defaultsFor(ExchangeId::Binance), defaultsFor(ExchangeId::Coinbase), defaultsFor(ExchangeId::Kraken)};
}

} // namespace Rampart
