#pragma once
#include "streams/StreamBroker.hpp"
#include <functional>
#include <utility>

namespace Rampart {

// Work a service performs for the entries of its bound stream.
// onEvent runs on the executor pool, possibly for several entries of one batch at a time,
// and may see the same entry twice after a reclaim. Throwing leaves the batch unacknowledged.
class ServiceHandler {
public:
    virtual ~ServiceHandler() = default;

    virtual void onEvent(const StreamEntry& entry) = 0;

    // Polling work used while the stream is quiet.
    virtual void onFallback() {}
};

// Adapter for handlers written as plain callables.
class CallbackServiceHandler : public ServiceHandler {
public:
    using EventFn    = std::function<void(const StreamEntry&)>;
    using FallbackFn = std::function<void()>;

    explicit CallbackServiceHandler(EventFn onEvent, FallbackFn onFallback = {})
        : m_onEvent(std::move(onEvent)), m_onFallback(std::move(onFallback)) {}

    void onEvent(const StreamEntry& entry) override {
        if (m_onEvent) m_onEvent(entry);
    }

    void onFallback() override {
        if (m_onFallback) m_onFallback();
    }

private:
    EventFn    m_onEvent;
    FallbackFn m_onFallback;
};

} // namespace Rampart
