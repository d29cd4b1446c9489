#include "marketdata/ws/BeastWsTransport.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/asio/post.hpp>
#include <openssl/err.h>

namespace Rampart {

BeastWsTransport::BeastWsTransport(net::io_context& ioc, ssl::context& sslCtx, std::chrono::milliseconds pingInterval)
    : m_sslCtx(sslCtx)
    , m_strand(net::make_strand(ioc))
    , m_resolver(m_strand)
    , m_pingTimer(m_strand)
    , m_pingInterval(pingInterval)
{}

void BeastWsTransport::connect(std::string host, std::string port, std::string target) {
    net::post(m_strand, [self = shared_from_this(), h = std::move(host), p = std::move(port), t = std::move(target)]() mutable {
        self->m_host = std::move(h);
        self->m_port = std::move(p);
        self->m_target = std::move(t);
        self->m_closing = false;
        self->m_reportedDown = false;
        self->m_up = false;
        self->m_writeQueue.clear();
        self->m_buffer.consume(self->m_buffer.size());
        self->m_ws = std::make_unique<Stream>(self->m_strand, self->m_sslCtx);   // fresh stream per connection

        self->m_resolver.async_resolve(self->m_host, self->m_port,
            [self](beast::error_code ec, tcp::resolver::results_type results){
                self->onResolve(ec, results);
            });
    });
}

void BeastWsTransport::close() {
    net::post(m_strand, [self = shared_from_this()]{
        if (self->m_closing) return;
        self->m_closing = true;
        self->m_pingTimer.cancel();
        self->m_resolver.cancel();

        if (self->m_ws && self->m_ws->is_open()) {
            self->m_ws->async_close(websocket::close_code::normal, [self](beast::error_code ec){
                if (ec && self->m_onError) self->m_onError("close: " + ec.message());
                self->reportDown();
            });
        } else {
            if (self->m_ws) beast::get_lowest_layer(*self->m_ws).cancel();
            self->reportDown();
        }
    });
}

void BeastWsTransport::send(std::string msg) {
    net::post(m_strand, [self = shared_from_this(), m = std::move(msg)]() mutable {
        if (self->m_closing || !self->m_ws) return;
        self->m_writeQueue.emplace_back(std::move(m));
        if (self->m_writeQueue.size() == 1 && self->m_up) {
            self->doWrite();
        }
    });
}

void BeastWsTransport::fail(const std::string& what, beast::error_code ec) {
    m_pingTimer.cancel();
    if (!m_closing && m_onError) m_onError(what + ": " + ec.message());
    reportDown();
}

void BeastWsTransport::reportDown() {
    m_up = false;
    if (m_reportedDown) return;
    m_reportedDown = true;
    if (m_onStatus) m_onStatus(false);
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail("resolve", ec);
    if (m_closing) return reportDown();
    beast::get_lowest_layer(*m_ws).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(*m_ws).async_connect(results,
        [self = shared_from_this()](beast::error_code ec2, tcp::resolver::results_type::endpoint_type ep){
            self->onConnect(ec2, ep);
        });
}

void BeastWsTransport::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) return fail("connect", ec);
    if (!SSL_set_tlsext_host_name(m_ws->next_layer().native_handle(), m_host.c_str())) {
        beast::error_code sslEc(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail("sni", sslEc);
    }
    if (!SSL_set1_host(m_ws->next_layer().native_handle(), m_host.c_str())) {
        beast::error_code sslEc(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail("verify host", sslEc);
    }
    m_ws->next_layer().set_verify_mode(ssl::verify_peer);
    m_ws->next_layer().async_handshake(ssl::stream_base::client,
        [self = shared_from_this()](beast::error_code ec2){ self->onSslHandshake(ec2); });
}

void BeastWsTransport::onSslHandshake(beast::error_code ec) {
    if (ec) return fail("tls handshake", ec);
    beast::get_lowest_layer(*m_ws).expires_never();
    m_ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    m_ws->async_handshake(m_host, m_target,
        [self = shared_from_this()](beast::error_code ec2){ self->onWsHandshake(ec2); });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (ec) return fail("ws handshake", ec);
    if (m_closing) return reportDown();
    m_up = true;
    if (m_onStatus) m_onStatus(true);
    doRead();
    schedulePing();
    if (!m_writeQueue.empty()) doWrite();
}

void BeastWsTransport::doRead() {
    m_ws->async_read(m_buffer, [self = shared_from_this()](beast::error_code ec, std::size_t bytes){
        self->onRead(ec, bytes);
    });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (ec) return fail("read", ec);

    if (m_onMessage) {
        auto b = m_buffer.data();
        std::string payload(static_cast<const char*>(b.data()), b.size());
        m_buffer.consume(m_buffer.size());
        m_onMessage(std::move(payload));
    } else {
        m_buffer.consume(m_buffer.size());
    }

    if (!m_closing) doRead();
}

void BeastWsTransport::doWrite() {
    if (m_writeQueue.empty()) return;
    const auto& front = m_writeQueue.front();
    m_ws->async_write(net::buffer(front), [self = shared_from_this()](beast::error_code ec, std::size_t){
        if (ec) return self->fail("write", ec);
        self->m_writeQueue.pop_front();
        if (!self->m_writeQueue.empty()) self->doWrite();
    });
}

void BeastWsTransport::schedulePing() {
    m_pingTimer.expires_after(m_pingInterval);
    m_pingTimer.async_wait([self = shared_from_this()](beast::error_code ec){
        if (ec || self->m_closing || !self->m_up) return;
        self->m_ws->async_ping({}, [self](beast::error_code ec2){
            if (ec2) return self->fail("ping", ec2);
            self->schedulePing();
        });
    });
}

} // namespace Rampart
