#pragma once
#include "marketdata/rest/RestPriceClient.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace Rampart {

struct CoinGeckoConfig {
    std::string               host{"api.coingecko.com"};
    std::string               port{"443"};
    std::chrono::milliseconds timeout{10000};

    void validate() const;
};

// Synchronous HTTPS client for /api/v3/simple/price. One connection per call; every socket
// operation runs under the configured timeout.
class CoinGeckoPriceClient : public RestPriceClient {
public:
    explicit CoinGeckoPriceClient(CoinGeckoConfig config = {});

    std::optional<RestQuote> fetchPrice(const std::string& symbol) override;

    // "BTCUSDT" -> "bitcoin"; unknown symbols fall back to the lowercase base asset.
    static std::string geckoIdFor(const std::string& symbol);
    static std::string targetFor(const std::string& geckoId);
    // Throws DataIntegrityError on an unparseable body; nullopt when the id is absent.
    static std::optional<RestQuote> parseResponse(const std::string& body, const std::string& geckoId);

    [[nodiscard]] const CoinGeckoConfig& config() const noexcept { return m_config; }

private:
    std::string get(const std::string& target);

    const CoinGeckoConfig m_config;
};

} // namespace Rampart
