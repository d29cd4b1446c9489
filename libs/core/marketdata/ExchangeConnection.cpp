#include "marketdata/ExchangeConnection.hpp"
#include "marketdata/dispatch/TickerParser.hpp"
#include "RampartErrors.hpp"
#include "RampartLogging.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>

namespace Rampart {

namespace net = boost::asio;

const char* toString(ConnectionState s) {
    switch (s) {
        case ConnectionState::Idle:             return "idle";
        case ConnectionState::Connecting:       return "connecting";
        case ConnectionState::Streaming:        return "streaming";
        case ConnectionState::ReconnectBackoff: return "reconnect_backoff";
        case ConnectionState::Unhealthy:        return "unhealthy";
        case ConnectionState::Stopped:          return "stopped";
    }
    return "unknown";
}

ExchangeConnection::ExchangeConnection(net::io_context& ioc,
                                       ExchangeConfig config,
                                       std::vector<std::string> symbols,
                                       TransportFactory factory,
                                       TickSink sink,
                                       const Clock& clock,
                                       ConnectionOptions options)
    : m_strand(net::make_strand(ioc))
    , m_reconnectTimer(m_strand)
    , m_watchdogTimer(m_strand)
    , m_config(std::move(config))
    , m_options(options)
    , m_subscriptions(m_config.id)
    , m_factory(std::move(factory))
    , m_sink(std::move(sink))
    , m_clock(clock)
{
    m_config.validate();
    if (!m_factory) throw ConfigError(std::string("exchange '") + toString(m_config.id) + "': transport factory is required");
    if (symbols.size() > m_config.symbolsPerConnection) {
        LOG_W("Data", "{}: {} symbols requested, connection carries the first {}",
              toString(m_config.id), symbols.size(), m_config.symbolsPerConnection);
        symbols.resize(m_config.symbolsPerConnection);
    }
    m_subscriptions.setDesiredSymbols(std::move(symbols));
}

std::chrono::milliseconds ExchangeConnection::backoffDelay(std::chrono::milliseconds reconnectDelay, int attempt,
                                                           std::chrono::milliseconds jitter) {
    const int exponent = std::clamp(attempt, 0, 5);
    return reconnectDelay * (1 << exponent) + jitter;
}

void ExchangeConnection::start() {
    if (m_running.exchange(true)) return;
    rLog_App("{}: starting ticker feed for {} symbols", toString(m_config.id), m_subscriptions.desired().size());
    net::post(m_strand, [self = shared_from_this()]{
        self->connectNow();
        self->scheduleWatchdog();
    });
}

void ExchangeConnection::stop() {
    if (!m_running.exchange(false)) return;
    if (m_state.load() != ConnectionState::Unhealthy) m_state.store(ConnectionState::Stopped);
    net::post(m_strand, [self = shared_from_this()]{
        self->m_reconnectTimer.cancel();
        self->m_watchdogTimer.cancel();
        self->dropTransport();
    });
    rLog_App("{}: ticker feed stopped", toString(m_config.id));
}

void ExchangeConnection::connectNow() {
    if (!m_running.load() || m_state.load() == ConnectionState::Unhealthy) return;

    const std::uint64_t generation = ++m_generation;
    m_state.store(ConnectionState::Connecting);
    m_receivedSinceConnect = false;

    try {
        m_transport = m_factory(m_config);
    } catch (const std::exception& e) {
        m_transport.reset();
        handleFailure(std::string("transport creation failed: ") + e.what());
        return;
    }
    if (!m_transport) {
        handleFailure("transport factory returned no transport");
        return;
    }

    std::weak_ptr<ExchangeConnection> weak = weak_from_this();
    m_transport->onStatus([weak, generation](bool up){
        if (auto self = weak.lock()) {
            net::post(self->m_strand, [self, generation, up]{
                if (up) self->handleUp(generation);
                else    self->handleDown(generation, "connection closed");
            });
        }
    });
    m_transport->onError([weak, generation](std::string err){
        if (auto self = weak.lock()) {
            net::post(self->m_strand, [self, generation, e = std::move(err)]() mutable {
                if (generation != self->m_generation) return;
                rLog_DataN(10, "{}: transport error: {}", toString(self->m_config.id), e);
                self->setLastError(std::move(e));
            });
        }
    });
    m_transport->onMessage([weak, generation](std::string payload){
        if (auto self = weak.lock()) {
            net::post(self->m_strand, [self, generation, p = std::move(payload)]{
                self->handleMessage(generation, p);
            });
        }
    });

    const std::string target = m_subscriptions.target(m_config.path);
    LOG_D("Data", "{}: connecting to {}:{}{} (attempt {})",
          toString(m_config.id), m_config.host, m_config.port, target, m_attempt.load());
    m_transport->connect(m_config.host, m_config.port, target);
}

void ExchangeConnection::handleUp(std::uint64_t generation) {
    if (generation != m_generation || !m_running.load()) return;

    m_state.store(ConnectionState::Streaming);
    m_connects.fetch_add(1, std::memory_order_relaxed);
    m_lastMessageMs.store(m_clock.nowMs());
    rLog_App("{}: streaming", toString(m_config.id));

    for (auto& msg : m_subscriptions.buildSubscribeMsgs()) {
        m_transport->send(std::move(msg));
    }
}

void ExchangeConnection::handleDown(std::uint64_t generation, const std::string& reason) {
    if (generation != m_generation || !m_running.load()) return;
    const auto state = m_state.load();
    if (state != ConnectionState::Connecting && state != ConnectionState::Streaming) return;
    handleFailure(reason);
}

void ExchangeConnection::handleMessage(std::uint64_t generation, const std::string& payload) {
    if (generation != m_generation || !m_running.load()) return;

    m_messages.fetch_add(1, std::memory_order_relaxed);
    m_lastMessageMs.store(m_clock.nowMs());

    std::optional<MarketDataPoint> point;
    try {
        point = TickerParser::parse(m_config.id, payload, m_clock.now());
    } catch (const DataIntegrityError& e) {
        m_malformed.fetch_add(1, std::memory_order_relaxed);
        rLog_DataN(50, "{}: dropping malformed frame: {}", toString(m_config.id), e.what());
        return;
    }
    if (!point) return;

    if (!m_receivedSinceConnect) {
        m_receivedSinceConnect = true;
        m_attempt.store(0);
    }
    m_tickers.fetch_add(1, std::memory_order_relaxed);

    try {
        m_sink(std::move(*point));
    } catch (const std::exception& e) {
        rLog_Error("{}: ticker sink failed: {}", toString(m_config.id), e.what());
    }
}

void ExchangeConnection::handleFailure(const std::string& reason) {
    dropTransport();
    setLastError(reason);
    m_failures.fetch_add(1, std::memory_order_relaxed);

    const int attempt = m_attempt.fetch_add(1) + 1;
    if (attempt >= m_config.maxRetries) {
        m_state.store(ConnectionState::Unhealthy);
        rLog_Error("{}: giving up after {} consecutive failures ({}); exchange marked unhealthy",
                   toString(m_config.id), attempt, reason);
        return;
    }
    LOG_W("Data", "{}: connection lost ({}), attempt {}/{}",
          toString(m_config.id), reason, attempt, m_config.maxRetries);
    scheduleReconnect();
}

void ExchangeConnection::dropTransport() {
    ++m_generation;
    if (m_transport) {
        m_transport->close();
        m_transport.reset();
    }
}

void ExchangeConnection::scheduleReconnect() {
    if (!m_running.load()) return;

    std::uniform_int_distribution<long long> jitter(0, std::max<long long>(0, m_options.maxJitter.count()));
    const auto delay = backoffDelay(m_config.reconnectDelay, m_attempt.load(),
                                    std::chrono::milliseconds(jitter(m_rng)));

    m_state.store(ConnectionState::ReconnectBackoff);
    m_reconnects.fetch_add(1, std::memory_order_relaxed);
    rLog_DataN(1, "{}: reconnecting in {}ms", toString(m_config.id), delay.count());

    m_reconnectTimer.expires_after(delay);
    m_reconnectTimer.async_wait([self = shared_from_this()](const boost::system::error_code& ec){
        if (ec) return;
        self->connectNow();
    });
}

void ExchangeConnection::scheduleWatchdog() {
    m_watchdogTimer.expires_after(m_options.watchdogInterval);
    m_watchdogTimer.async_wait([self = shared_from_this()](const boost::system::error_code& ec){
        if (ec || !self->m_running.load()) return;
        if (self->m_state.load() == ConnectionState::Streaming) {
            const auto silentMs = self->m_clock.nowMs() - self->m_lastMessageMs.load();
            if (silentMs > self->m_options.staleAfter.count()) {
                self->m_staleRecycles.fetch_add(1, std::memory_order_relaxed);
                LOG_W("Data", "{}: no message for {}ms, recycling connection", toString(self->m_config.id), silentMs);
                self->handleFailure("stale connection");
            }
        }
        if (self->m_state.load() != ConnectionState::Unhealthy) self->scheduleWatchdog();
    });
}

void ExchangeConnection::setLastError(std::string err) {
    std::lock_guard lock(m_errorMutex);
    m_lastError = std::move(err);
}

ExchangeStatus ExchangeConnection::status() const {
    ExchangeStatus s;
    s.exchange = toString(m_config.id);
    s.state = m_state.load();
    s.connected = s.state == ConnectionState::Streaming;
    const auto last = m_lastMessageMs.load();
    if (last > 0) s.lastMessageAge = std::chrono::milliseconds(std::max<std::int64_t>(0, m_clock.nowMs() - last));
    s.consecutiveFailures = m_attempt.load();
    s.connects = m_connects.load();
    s.reconnects = m_reconnects.load();
    s.failures = m_failures.load();
    s.staleRecycles = m_staleRecycles.load();
    s.messages = m_messages.load();
    s.tickers = m_tickers.load();
    s.malformed = m_malformed.load();
    {
        std::lock_guard lock(m_errorMutex);
        s.lastError = m_lastError;
    }
    return s;
}

} // namespace Rampart
