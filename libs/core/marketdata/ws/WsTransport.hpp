/*
Rampart — WsTransport
Role: Byte-level WebSocket seam between ExchangeConnection and the network.
Inputs/Outputs: connect()/send()/close() in; frames, up/down status and error text out through
                callbacks. Knows nothing about exchanges, symbols or subscriptions.
Threading: Callbacks may fire on any thread; ExchangeConnection re-posts them onto its strand.
Integration: BeastWsTransport in production; tests inject an in-process fake through
             ExchangeConnection::TransportFactory.
*/
#pragma once
#include <functional>
#include <string>

namespace Rampart {

// One instance per connection attempt; a closed transport is never reconnected.
class WsTransport {
public:
    using MessageCb = std::function<void(std::string)>;
    using StatusCb  = std::function<void(bool up)>;
    using ErrorCb   = std::function<void(std::string)>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    // Install callbacks before connect().
    virtual void onMessage(MessageCb) = 0;
    virtual void onStatus(StatusCb) = 0;
    virtual void onError(ErrorCb) = 0;

    virtual void connect(std::string host, std::string port, std::string target) = 0;
    // Queued; frames go out in call order.
    virtual void send(std::string msg) = 0;
    virtual void close() = 0;
};

} // namespace Rampart
