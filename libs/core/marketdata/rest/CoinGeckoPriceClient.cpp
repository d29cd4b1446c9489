#include "marketdata/rest/CoinGeckoPriceClient.hpp"
#include "RampartErrors.hpp"
#include "RampartLogging.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_map>

namespace Rampart {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using json = nlohmann::json;

void CoinGeckoConfig::validate() const {
    if (host.empty()) throw ConfigError("rest.host must not be empty");
    if (port.empty()) throw ConfigError("rest.port must not be empty");
    if (timeout.count() <= 0) throw ConfigError("rest.timeout_ms must be positive");
}

CoinGeckoPriceClient::CoinGeckoPriceClient(CoinGeckoConfig config)
    : m_config(std::move(config))
{
    m_config.validate();
}

std::string CoinGeckoPriceClient::geckoIdFor(const std::string& symbol) {
    static const std::unordered_map<std::string, std::string> kIds = {
        {"BTCUSDT", "bitcoin"},   {"ETHUSDT", "ethereum"},      {"SOLUSDT", "solana"},
        {"ADAUSDT", "cardano"},   {"DOTUSDT", "polkadot"},      {"MATICUSDT", "matic-network"},
        {"LINKUSDT", "chainlink"}, {"UNIUSDT", "uniswap"},
    };
    if (auto it = kIds.find(symbol); it != kIds.end()) return it->second;

    std::string id = symbol;
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    constexpr std::string_view kQuote = "usdt";
    if (id.size() > kQuote.size() && id.compare(id.size() - kQuote.size(), kQuote.size(), kQuote) == 0) {
        id.resize(id.size() - kQuote.size());
    }
    return id;
}

std::string CoinGeckoPriceClient::targetFor(const std::string& geckoId) {
    return "/api/v3/simple/price?ids=" + geckoId +
           "&vs_currencies=usd&include_24hr_vol=true&include_24hr_change=true";
}

std::optional<RestQuote> CoinGeckoPriceClient::parseResponse(const std::string& body, const std::string& geckoId) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        throw DataIntegrityError(std::string("coingecko: unparseable body: ") + e.what());
    }
    if (!j.is_object()) throw DataIntegrityError("coingecko: expected a JSON object");

    auto it = j.find(geckoId);
    if (it == j.end() || !it->is_object()) return std::nullopt;
    const auto& entry = *it;

    auto usd = entry.find("usd");
    if (usd == entry.end() || !usd->is_number()) return std::nullopt;

    RestQuote quote;
    quote.provider = "coingecko";
    quote.price = usd->get<double>();
    if (quote.price <= 0.0) throw DataIntegrityError("coingecko: non-positive price for " + geckoId);
    if (auto v = entry.find("usd_24h_vol"); v != entry.end() && v->is_number()) {
        quote.volume24h = v->get<double>();
    }
    if (auto c = entry.find("usd_24h_change"); c != entry.end() && c->is_number()) {
        quote.changePercent24h = c->get<double>();
    }
    return quote;
}

std::optional<RestQuote> CoinGeckoPriceClient::fetchPrice(const std::string& symbol) {
    const std::string id = geckoIdFor(symbol);
    const std::string body = get(targetFor(id));
    auto quote = parseResponse(body, id);
    if (!quote) {
        rLog_DataN(10, "coingecko has no usd price for {} ({})", symbol, id);
    }
    return quote;
}

std::string CoinGeckoPriceClient::get(const std::string& target) {
    net::io_context ioc;
    ssl::context sslCtx{ssl::context::tlsv12_client};
    sslCtx.set_default_verify_paths();
    sslCtx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver{ioc};
    beast::ssl_stream<beast::tcp_stream> stream{ioc, sslCtx};

    if (!SSL_set_tlsext_host_name(stream.native_handle(), m_config.host.c_str())) {
        beast::error_code sniEc{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw beast::system_error{sniEc};
    }

    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, m_config.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/json");

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code failure;
    const char* failedAt = nullptr;
    auto fail = [&](const char* what, beast::error_code ec) { failedAt = what; failure = ec; };

    // tcp_stream deadlines only apply to async operations; one deadline covers the whole exchange.
    beast::get_lowest_layer(stream).expires_after(m_config.timeout);
    resolver.async_resolve(m_config.host, m_config.port, [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail("resolve", ec);
        beast::get_lowest_layer(stream).async_connect(results, [&](beast::error_code ec2, tcp::endpoint) {
            if (ec2) return fail("connect", ec2);
            stream.async_handshake(ssl::stream_base::client, [&](beast::error_code ec3) {
                if (ec3) return fail("tls handshake", ec3);
                http::async_write(stream, req, [&](beast::error_code ec4, std::size_t) {
                    if (ec4) return fail("write", ec4);
                    http::async_read(stream, buffer, res, [&](beast::error_code ec5, std::size_t) {
                        if (ec5) fail("read", ec5);
                    });
                });
            });
        });
    });
    ioc.run();

    if (failedAt) {
        throw beast::system_error(failure, std::string("coingecko ") + failedAt);
    }

    if (res.result() == http::status::too_many_requests) {
        throw RampartError("coingecko: rate limited (HTTP 429)");
    }
    if (res.result() != http::status::ok) {
        throw RampartError("coingecko: HTTP " + std::to_string(res.result_int()) + " for " + target);
    }
    return res.body();
}

} // namespace Rampart
