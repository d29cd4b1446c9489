/*
Rampart — CircuitBreaker
Role: Per-dependency CLOSED / OPEN / HALF_OPEN state machine guarding outbound calls.
Inputs/Outputs: call(fn) returns fn's result, rethrows fn's error, or throws CircuitOpenError /
                CallTimeoutError.
Threading: One mutex per breaker guards state; fn itself runs on the BlockingExecutor outside the lock.
Performance: Admission and completion are O(window) for pruning; the window holds at most
             failureThreshold-ish timestamps in practice.
Integration: Created by CircuitBreakerRegistry; used through GuardedCaller by market data and
             by application code.
Observability: Every transition and every rejection is logged with before/after counters;
               stats() reports counts, retry-after and latency percentiles.
Related: CircuitBreaker.cpp, CircuitBreakerRegistry.hpp, BlockingExecutor.hpp, RampartErrors.hpp.
Assumptions: Exceptions deriving from PassThroughError, and types registered with
             ignoreException<E>(), describe caller mistakes and never count against health.
*/
#pragma once

#include "RampartErrors.hpp"
#include "resilience/LatencyWindow.hpp"
#include "runtime/BlockingExecutor.hpp"
#include "runtime/Clock.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace Rampart {

enum class CircuitState { Closed, Open, HalfOpen };

const char* toString(CircuitState state);
std::optional<CircuitState> circuitStateFromString(std::string_view s);

struct CircuitBreakerConfig {
    int                       failureThreshold{5};      // failures inside the window that open the circuit
    int                       successThreshold{3};      // consecutive half-open successes that close it
    std::chrono::milliseconds timeout{60000};           // base recovery timeout
    std::chrono::milliseconds maxTimeout{300000};
    std::chrono::milliseconds failureWindow{60000};
    std::chrono::milliseconds slowCallThreshold{5000};
    std::chrono::milliseconds callTimeout{30000};       // deadline for each guarded call
    int                       maxBackoffMultiplier{8};

    void validate(const std::string& name) const;
};

// Persisted form, shared between instances through the KeyValueStore.
struct CircuitBreakerSnapshot {
    CircuitState state{CircuitState::Closed};
    std::int64_t lastStateChangeMs{0};
    int          backoffMultiplier{1};
    int          consecutiveFailures{0};
    int          consecutiveSuccesses{0};
    std::string  owner;
};

struct CircuitBreakerStats {
    std::string               name;
    CircuitState              state{CircuitState::Closed};
    int                       consecutiveFailures{0};
    int                       consecutiveSuccesses{0};
    std::size_t               recentFailures{0};
    std::uint64_t             totalCalls{0};
    std::uint64_t             successfulCalls{0};
    std::uint64_t             failedCalls{0};
    std::uint64_t             rejectedCalls{0};
    std::uint64_t             slowCalls{0};
    std::uint64_t             timeouts{0};
    std::uint64_t             ignoredErrors{0};
    std::uint64_t             stateChanges{0};
    int                       backoffMultiplier{1};
    std::chrono::milliseconds currentTimeout{0};
    std::chrono::milliseconds retryAfter{0};
    std::int64_t              lastStateChangeMs{0};
    LatencySummary            latency;
};

class CircuitBreaker {
public:
    CircuitBreaker(std::string name,
                   CircuitBreakerConfig config,
                   BlockingExecutor& executor,
                   const Clock& clock = SystemClock::instance());

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    template <class F>
    auto call(F&& fn) {
        return call(std::forward<F>(fn), m_config.callTimeout);
    }

    // fn runs on the executor; if the deadline passes it is abandoned, so it must own its state.
    template <class F>
    auto call(F&& fn, std::chrono::milliseconds timeout) -> std::invoke_result_t<std::decay_t<F>&> {
        using R = std::invoke_result_t<std::decay_t<F>&>;
        const Admission admission = admit();
        const auto started = std::chrono::steady_clock::now();
        try {
            if constexpr (std::is_void_v<R>) {
                m_executor.runWithDeadline(std::forward<F>(fn), timeout, m_name);
                onSuccess(admission, elapsedMs(started));
            } else {
                R result = m_executor.runWithDeadline(std::forward<F>(fn), timeout, m_name);
                onSuccess(admission, elapsedMs(started));
                return result;
            }
        } catch (const CallTimeoutError& e) {
            onFailure(admission, e.what(), true);
            throw;
        } catch (const std::exception& e) {
            if (isIgnored(e)) {
                onIgnored(admission);
            } else {
                onFailure(admission, e.what(), false);
            }
            throw;
        } catch (...) {
            onFailure(admission, "non-standard exception", false);
            throw;
        }
    }

    // Registers E as a pass-through error for this breaker.
    template <class E>
    void ignoreException() {
        std::lock_guard lock(m_mutex);
        m_ignored.emplace_back([](const std::exception& e){ return dynamic_cast<const E*>(&e) != nullptr; });
    }

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return m_config; }
    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] CircuitBreakerStats stats() const;
    [[nodiscard]] CircuitBreakerSnapshot snapshot() const;

    // Adopts a snapshot whose state change is newer than ours. Returns true if adopted.
    bool restore(const CircuitBreakerSnapshot& snap);

    // Manual override back to CLOSED (operator action).
    void reset();

private:
    struct Admission {
        bool          trial{false};
        std::uint64_t trialId{0};
    };

    Admission admit();
    void onSuccess(const Admission& admission, double latencyMs);
    void onFailure(const Admission& admission, const std::string& reason, bool timedOut);
    void onIgnored(const Admission& admission);
    bool isIgnored(const std::exception& e) const;

    // Callers hold m_mutex. Only the trial admitted for the current half-open episode qualifies.
    bool isCurrentTrial(const Admission& admission) const;

    // Callers hold m_mutex.
    void transitionTo(CircuitState next, const char* reason);
    void pruneWindow(Clock::time_point now);
    std::chrono::milliseconds currentTimeout() const;
    std::chrono::milliseconds remainingOpen(Clock::time_point now) const;

    static double elapsedMs(std::chrono::steady_clock::time_point started) {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    }

    const std::string          m_name;
    const CircuitBreakerConfig m_config;
    BlockingExecutor&          m_executor;
    const Clock&               m_clock;

    mutable std::mutex            m_mutex;
    CircuitState                  m_state{CircuitState::Closed};
    Clock::time_point             m_lastStateChange;
    std::deque<Clock::time_point> m_failureWindow;
    int                           m_consecutiveFailures{0};
    int                           m_consecutiveSuccesses{0};
    int                           m_backoffMultiplier{1};
    bool                          m_trialInFlight{false};
    std::uint64_t                 m_trialId{0};
    LatencyWindow                 m_latency;
    std::vector<std::function<bool(const std::exception&)>> m_ignored;

    std::uint64_t m_totalCalls{0};
    std::uint64_t m_successfulCalls{0};
    std::uint64_t m_failedCalls{0};
    std::uint64_t m_rejectedCalls{0};
    std::uint64_t m_slowCalls{0};
    std::uint64_t m_timeouts{0};
    std::uint64_t m_ignoredErrors{0};
    std::uint64_t m_stateChanges{0};
};

} // namespace Rampart
