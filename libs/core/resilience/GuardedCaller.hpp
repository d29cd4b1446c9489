#pragma once
#include "resilience/BackpressureManager.hpp"
#include "resilience/CircuitBreakerRegistry.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace Rampart {

struct CallOptions {
    Priority                                 priority{Priority::Medium};
    std::optional<std::chrono::milliseconds> timeout;   // breaker's call timeout when empty
    bool                                     useBackpressure{true};
};

// Single entry point for outbound calls: breaker by dependency name, then optional admission control.
// Throws CircuitOpenError / BackpressureError (with retry-after) or CallTimeoutError; fn's own errors
// propagate unchanged.
class GuardedCaller {
public:
    GuardedCaller(CircuitBreakerRegistry& breakers, BackpressureManager* backpressure)
        : m_breakers(breakers), m_backpressure(backpressure) {}

    template <class F>
    auto call(const std::string& name, F&& fn, const CallOptions& options = {}) {
        auto breaker = m_breakers.get(name);
        const auto timeout = options.timeout.value_or(breaker->config().callTimeout);

        if (options.useBackpressure && m_backpressure) {
            return breaker->call(BackpressureManager::holding(m_backpressure->acquire(options.priority, timeout),
                                                              std::forward<F>(fn)),
                                 timeout);
        }
        return breaker->call(std::forward<F>(fn), timeout);
    }

    [[nodiscard]] CircuitBreakerRegistry& breakers() noexcept { return m_breakers; }
    [[nodiscard]] BackpressureManager* backpressure() noexcept { return m_backpressure; }

private:
    CircuitBreakerRegistry& m_breakers;
    BackpressureManager*    m_backpressure;
};

} // namespace Rampart
