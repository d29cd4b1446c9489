#pragma once
#include <optional>
#include <string>

namespace Rampart {

struct RestQuote {
    double      price{0.0};
    double      volume24h{0.0};
    double      changePercent24h{0.0};
    std::string provider;
};

// Blocking REST price lookup used when the WebSocket path is stale or down.
// Returns nullopt when the provider does not know the symbol; throws on transport or HTTP errors
// so the breaker guarding the call can count them.
class RestPriceClient {
public:
    virtual ~RestPriceClient() = default;
    virtual std::optional<RestQuote> fetchPrice(const std::string& symbol) = 0;
};

} // namespace Rampart
