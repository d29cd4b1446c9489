#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Rampart {

enum class ExchangeId { Binance, Coinbase, Kraken };

const char* toString(ExchangeId id);
std::optional<ExchangeId> exchangeFromString(std::string_view s);

struct ExchangeConfig {
    ExchangeId                id{ExchangeId::Binance};
    std::string               host;
    std::string               port{"443"};
    std::string               path{"/"};       // Binance appends the stream names to this
    std::chrono::milliseconds reconnectDelay{5000};
    int                       maxRetries{10};
    std::chrono::milliseconds pingInterval{20000};
    std::size_t               symbolsPerConnection{100};
    bool                      enabled{true};

    void validate() const;

    static ExchangeConfig defaultsFor(ExchangeId id);
    static std::vector<ExchangeConfig> defaults();
};

} // namespace Rampart
