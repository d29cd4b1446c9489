/*
Rampart — BeastWsTransport
Role: Production WsTransport: resolve, TCP connect, TLS (with SNI), WebSocket upgrade, then a read
      loop plus a periodic ping.
Inputs/Outputs: Host, port and target from ExchangeConfig in; frames and status through callbacks.
Threading: Every operation runs on one strand of the shared market-data io_context.
Integration: Built by MarketDataManager's default transport factory, one per connection attempt.
Related: WsTransport.hpp, ExchangeConnection.hpp.
*/
#pragma once
#include "marketdata/ws/WsTransport.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <openssl/ssl.h>

namespace Rampart {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// TLS WebSocket client over Beast. Every handler holds a shared_ptr to the transport, so the
// owner may drop its reference right after close() while operations unwind.
// Reports "down" through onStatus exactly once per connection.
class BeastWsTransport : public WsTransport, public std::enable_shared_from_this<BeastWsTransport> {
public:
    BeastWsTransport(net::io_context& ioc, ssl::context& sslCtx,
                     std::chrono::milliseconds pingInterval = std::chrono::seconds(20));

    void connect(std::string host, std::string port, std::string target) override;
    void close() override;
    void send(std::string msg) override;

    void onMessage(MessageCb cb) override { m_onMessage = std::move(cb); }
    void onStatus(StatusCb cb) override { m_onStatus = std::move(cb); }
    void onError(ErrorCb cb) override { m_onError = std::move(cb); }

private:
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type);
    void onSslHandshake(beast::error_code ec);
    void onWsHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void schedulePing();
    void fail(const std::string& what, beast::error_code ec);
    void reportDown();

    MessageCb m_onMessage;
    StatusCb  m_onStatus;
    ErrorCb   m_onError;

    ssl::context&                               m_sslCtx;
    net::strand<net::io_context::executor_type> m_strand;
    tcp::resolver                               m_resolver;
    std::unique_ptr<Stream>                     m_ws;         // fresh per connect()
    beast::flat_buffer                          m_buffer;
    net::steady_timer                           m_pingTimer;
    std::deque<std::string>                     m_writeQueue;
    const std::chrono::milliseconds             m_pingInterval;

    // Strand-only state
    std::string m_host;
    std::string m_port;
    std::string m_target;
    bool        m_up{false};
    bool        m_closing{false};
    bool        m_reportedDown{false};
};

} // namespace Rampart
