/*
Rampart — ExchangeConnection
Role: Supervises one exchange's ticker WebSocket: connect, subscribe, parse, reconnect with backoff.
Inputs/Outputs: Raw frames from a WsTransport in; normalized MarketDataPoint handed to the sink.
Threading: Every state change runs on a strand of the market-data io_context; transport callbacks
           are re-posted onto it. status() reads atomics and may be called from any thread.
Performance: One JSON parse per frame. Backoff timers are non-blocking.
Integration: Created and owned by MarketDataManager, one per enabled exchange.
Observability: Lifecycle at info, transport errors and malformed frames throttled, Unhealthy at error.
Related: WsTransport.hpp, SubscriptionManager.hpp, TickerParser.hpp, MarketDataManager.hpp.
Assumptions: Callbacks from a transport that has been replaced are ignored (generation check).
             maxRetries consecutive failed attempts leave the exchange Unhealthy until
             the process restarts.
*/
#pragma once

#include "marketdata/Exchange.hpp"
#include "marketdata/MarketDataPoint.hpp"
#include "marketdata/ws/SubscriptionManager.hpp"
#include "marketdata/ws/WsTransport.hpp"
#include "runtime/Clock.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace Rampart {

enum class ConnectionState { Idle, Connecting, Streaming, ReconnectBackoff, Unhealthy, Stopped };

const char* toString(ConnectionState s);

struct ExchangeStatus {
    std::string                              exchange;
    ConnectionState                          state{ConnectionState::Idle};
    bool                                     connected{false};
    std::optional<std::chrono::milliseconds> lastMessageAge;
    int                                      consecutiveFailures{0};
    std::uint64_t                            connects{0};
    std::uint64_t                            reconnects{0};
    std::uint64_t                            failures{0};
    std::uint64_t                            staleRecycles{0};
    std::uint64_t                            messages{0};
    std::uint64_t                            tickers{0};
    std::uint64_t                            malformed{0};
    std::string                              lastError;
};

struct ConnectionOptions {
    std::chrono::milliseconds staleAfter{30000};
    std::chrono::milliseconds watchdogInterval{5000};
    std::chrono::milliseconds maxJitter{250};
};

class ExchangeConnection : public std::enable_shared_from_this<ExchangeConnection> {
public:
    using TransportFactory = std::function<std::shared_ptr<WsTransport>(const ExchangeConfig&)>;
    using TickSink         = std::function<void(MarketDataPoint)>;

    ExchangeConnection(boost::asio::io_context& ioc,
                       ExchangeConfig config,
                       std::vector<std::string> symbols,
                       TransportFactory factory,
                       TickSink sink,
                       const Clock& clock,
                       ConnectionOptions options = {});

    ExchangeConnection(const ExchangeConnection&) = delete;
    ExchangeConnection& operator=(const ExchangeConnection&) = delete;

    void start();
    void stop();

    [[nodiscard]] ExchangeStatus status() const;
    [[nodiscard]] ConnectionState state() const noexcept { return m_state.load(); }
    [[nodiscard]] ExchangeId exchange() const noexcept { return m_config.id; }
    [[nodiscard]] const ExchangeConfig& config() const noexcept { return m_config; }

    // reconnectDelay * 2^min(attempt, 5) + jitter
    static std::chrono::milliseconds backoffDelay(std::chrono::milliseconds reconnectDelay, int attempt,
                                                  std::chrono::milliseconds jitter);

private:
    // Strand-only.
    void connectNow();
    void handleUp(std::uint64_t generation);
    void handleDown(std::uint64_t generation, const std::string& reason);
    void handleMessage(std::uint64_t generation, const std::string& payload);
    void handleFailure(const std::string& reason);
    void dropTransport();
    void scheduleReconnect();
    void scheduleWatchdog();
    void setLastError(std::string err);

    boost::asio::strand<boost::asio::io_context::executor_type> m_strand;
    boost::asio::steady_timer                               m_reconnectTimer;
    boost::asio::steady_timer                               m_watchdogTimer;

    const ExchangeConfig    m_config;
    const ConnectionOptions m_options;
    SubscriptionManager     m_subscriptions;
    TransportFactory        m_factory;
    TickSink                m_sink;
    const Clock&            m_clock;
    std::mt19937            m_rng{std::random_device{}()};

    std::shared_ptr<WsTransport> m_transport;
    std::uint64_t                m_generation{0};
    bool                         m_receivedSinceConnect{false};

    std::atomic<bool>            m_running{false};
    std::atomic<ConnectionState> m_state{ConnectionState::Idle};
    std::atomic<int>             m_attempt{0};
    std::atomic<std::int64_t>    m_lastMessageMs{0};
    std::atomic<std::uint64_t>   m_connects{0};
    std::atomic<std::uint64_t>   m_reconnects{0};
    std::atomic<std::uint64_t>   m_failures{0};
    std::atomic<std::uint64_t>   m_staleRecycles{0};
    std::atomic<std::uint64_t>   m_messages{0};
    std::atomic<std::uint64_t>   m_tickers{0};
    std::atomic<std::uint64_t>   m_malformed{0};

    mutable std::mutex m_errorMutex;
    std::string        m_lastError;
};

} // namespace Rampart
