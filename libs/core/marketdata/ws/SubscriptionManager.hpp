#pragma once
#include "marketdata/Exchange.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace Rampart {

// Builds the connect target and subscribe frames for one exchange's ticker feed, and maps
// symbols between the canonical form ("BTCUSDT") and the exchange's own spelling.
class SubscriptionManager {
public:
    explicit SubscriptionManager(ExchangeId exchange) : m_exchange(exchange) {}

    void setDesiredSymbols(std::vector<std::string> symbols) {
        m_desired = std::move(symbols);
    }
    const std::vector<std::string>& desired() const { return m_desired; }
    ExchangeId exchange() const { return m_exchange; }

    // Binance carries the subscription in the URL path: /ws/btcusdt@ticker/ethusdt@ticker
    std::string target(const std::string& basePath) const {
        if (m_exchange != ExchangeId::Binance) return basePath;
        std::string out = basePath;
        for (std::size_t i = 0; i < m_desired.size(); ++i) {
            if (i > 0) out += '/';
            out += toExchangeSymbol(m_exchange, m_desired[i]) + "@ticker";
        }
        return out;
    }

    std::vector<std::string> buildSubscribeMsgs() const {
        std::vector<std::string> out;
        if (m_desired.empty()) return out;

        std::vector<std::string> ids;
        ids.reserve(m_desired.size());
        for (const auto& s : m_desired) ids.push_back(toExchangeSymbol(m_exchange, s));

        nlohmann::json msg;
        switch (m_exchange) {
            case ExchangeId::Binance:
                return out;
            case ExchangeId::Coinbase:
                msg["type"] = "subscribe";
                msg["product_ids"] = ids;
                msg["channels"] = nlohmann::json::array({"ticker"});
                break;
            case ExchangeId::Kraken:
                msg["event"] = "subscribe";
                msg["pair"] = ids;
                msg["subscription"] = {{"name", "ticker"}};
                break;
        }
        out.emplace_back(msg.dump());
        return out;
    }

    // Splits a canonical symbol into base and quote; empty quote if no known quote matches.
    static std::pair<std::string, std::string> splitCanonical(std::string_view symbol) {
        static constexpr std::string_view kQuotes[] = {"USDT", "USDC", "BUSD", "USD", "EUR", "GBP", "BTC", "ETH"};
        for (auto q : kQuotes) {
            if (symbol.size() > q.size() && symbol.substr(symbol.size() - q.size()) == q) {
                return {std::string(symbol.substr(0, symbol.size() - q.size())), std::string(q)};
            }
        }
        return {std::string(symbol), std::string{}};
    }

    static std::string toExchangeSymbol(ExchangeId exchange, const std::string& canonical) {
        const auto [base, quote] = splitCanonical(canonical);
        switch (exchange) {
            case ExchangeId::Binance: {
                std::string lower = canonical;
                std::transform(lower.begin(), lower.end(), lower.begin(),
                               [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
                return lower;
            }
            case ExchangeId::Coinbase:
                return quote.empty() ? canonical : base + "-" + quote;
            case ExchangeId::Kraken:
                if (quote.empty()) return canonical;
                return (base == "BTC" ? std::string("XBT") : base) + "/" + quote;
        }
        return canonical;
    }

    static std::string toCanonical(ExchangeId exchange, std::string_view symbol) {
        std::string out;
        out.reserve(symbol.size());
        for (char c : symbol) {
            if (c == '-' || c == '/') continue;
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
        if (exchange == ExchangeId::Kraken && out.rfind("XBT", 0) == 0) out.replace(0, 3, "BTC");
        return out;
    }

private:
    ExchangeId               m_exchange;
    std::vector<std::string> m_desired;
};

} // namespace Rampart
