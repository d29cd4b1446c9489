#include "resilience/CircuitBreaker.hpp"
#include "RampartLogging.hpp"
#include <algorithm>

namespace Rampart {

const char* toString(CircuitState state) {
    switch (state) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "unknown";
}

std::optional<CircuitState> circuitStateFromString(std::string_view s) {
    if (s == "closed")    return CircuitState::Closed;
    if (s == "open")      return CircuitState::Open;
    if (s == "half_open") return CircuitState::HalfOpen;
    return std::nullopt;
}

void CircuitBreakerConfig::validate(const std::string& name) const {
    auto fail = [&](const std::string& what) {
        throw ConfigError("breaker '" + name + "': " + what);
    };
    if (failureThreshold < 1) fail("failure_threshold must be >= 1");
    if (successThreshold < 1) fail("success_threshold must be >= 1");
    if (timeout.count() <= 0) fail("timeout_ms must be positive");
    if (maxTimeout < timeout) fail("max_timeout_ms must be >= timeout_ms");
    if (failureWindow.count() <= 0) fail("failure_window_ms must be positive");
    if (slowCallThreshold.count() <= 0) fail("slow_call_threshold_ms must be positive");
    if (callTimeout.count() <= 0) fail("call_timeout_ms must be positive");
    if (maxBackoffMultiplier < 1) fail("max_backoff_multiplier must be >= 1");
}

CircuitBreaker::CircuitBreaker(std::string name,
                               CircuitBreakerConfig config,
                               BlockingExecutor& executor,
                               const Clock& clock)
    : m_name(std::move(name))
    , m_config(std::move(config))
    , m_executor(executor)
    , m_clock(clock)
    , m_lastStateChange(clock.now())
{
    m_config.validate(m_name);
    rLog_Guard("Circuit breaker '{}' created (threshold={} window={}ms timeout={}ms max={}ms)",
               m_name, m_config.failureThreshold, m_config.failureWindow.count(),
               m_config.timeout.count(), m_config.maxTimeout.count());
}

// =============================================================================
// Admission
// =============================================================================

CircuitBreaker::Admission CircuitBreaker::admit() {
    std::lock_guard lock(m_mutex);
    const auto now = m_clock.now();

    switch (m_state) {
        case CircuitState::Closed:
            ++m_totalCalls;
            return Admission{false};

        case CircuitState::Open: {
            const auto remaining = remainingOpen(now);
            if (remaining.count() > 0) {
                ++m_rejectedCalls;
                rLog_Guard("Circuit '{}' rejected call: open, retry in {}ms (failures={} rejected={})",
                           m_name, remaining.count(), m_failureWindow.size(), m_rejectedCalls);
                throw CircuitOpenError(m_name, remaining);
            }
            transitionTo(CircuitState::HalfOpen, "recovery timeout elapsed");
            m_trialInFlight = true;
            ++m_totalCalls;
            return Admission{true, ++m_trialId};
        }

        case CircuitState::HalfOpen:
            if (m_trialInFlight) {
                ++m_rejectedCalls;
                rLog_Guard("Circuit '{}' rejected call: half-open trial in flight (successes={}/{})",
                           m_name, m_consecutiveSuccesses, m_config.successThreshold);
                throw CircuitOpenError(m_name, m_config.callTimeout);
            }
            m_trialInFlight = true;
            ++m_totalCalls;
            return Admission{true, ++m_trialId};
    }
    return Admission{false};
}

// =============================================================================
// Completion
// =============================================================================

void CircuitBreaker::onSuccess(const Admission& admission, double latencyMs) {
    std::lock_guard lock(m_mutex);
    ++m_successfulCalls;
    m_latency.record(latencyMs);

    if (latencyMs > static_cast<double>(m_config.slowCallThreshold.count())) {
        ++m_slowCalls;
        LOG_W("Guard", "Circuit '{}' slow call: {:.1f}ms > {}ms (slow calls={})",
              m_name, latencyMs, m_config.slowCallThreshold.count(), m_slowCalls);
    }

    const bool trial = isCurrentTrial(admission);
    if (m_state == CircuitState::HalfOpen && !trial) {
        rLog_GuardN(10, "Circuit '{}' half-open: success of a call admitted earlier does not count",
                    m_name);
        return;
    }

    m_consecutiveFailures = 0;
    ++m_consecutiveSuccesses;

    if (trial) {
        m_trialInFlight = false;
        if (m_consecutiveSuccesses >= m_config.successThreshold) {
            transitionTo(CircuitState::Closed, "half-open trials succeeded");
        } else {
            rLog_Guard("Circuit '{}' half-open trial succeeded ({}/{})",
                       m_name, m_consecutiveSuccesses, m_config.successThreshold);
        }
    }
}

void CircuitBreaker::onFailure(const Admission& admission, const std::string& reason, bool timedOut) {
    std::lock_guard lock(m_mutex);
    const auto now = m_clock.now();
    ++m_failedCalls;
    if (timedOut) ++m_timeouts;

    m_failureWindow.push_back(now);
    pruneWindow(now);
    LOG_D("Guard", "Circuit '{}' failure detail: {}", m_name, reason);

    const bool trial = isCurrentTrial(admission);
    if (m_state == CircuitState::HalfOpen && !trial) {
        LOG_W("Guard", "Circuit '{}' half-open: failure ({}) of a call admitted earlier, state unchanged",
              m_name, timedOut ? "timeout" : "error");
        return;
    }

    ++m_consecutiveFailures;
    m_consecutiveSuccesses = 0;

    LOG_W("Guard", "Circuit '{}' recorded failure ({}): {} in window, {} consecutive",
          m_name, timedOut ? "timeout" : "error", m_failureWindow.size(), m_consecutiveFailures);

    if (trial) {
        m_trialInFlight = false;
        transitionTo(CircuitState::Open, "half-open trial failed");
        return;
    }

    if (m_state == CircuitState::Closed
        && static_cast<int>(m_failureWindow.size()) >= m_config.failureThreshold) {
        transitionTo(CircuitState::Open, "failure threshold reached");
    }
}

void CircuitBreaker::onIgnored(const Admission& admission) {
    std::lock_guard lock(m_mutex);
    ++m_ignoredErrors;
    if (isCurrentTrial(admission)) {
        m_trialInFlight = false;
    }
}

bool CircuitBreaker::isCurrentTrial(const Admission& admission) const {
    return admission.trial && m_trialInFlight && admission.trialId == m_trialId
        && m_state == CircuitState::HalfOpen;
}

bool CircuitBreaker::isIgnored(const std::exception& e) const {
    if (dynamic_cast<const PassThroughError*>(&e)) return true;
    std::lock_guard lock(m_mutex);
    return std::any_of(m_ignored.begin(), m_ignored.end(), [&](const auto& pred){ return pred(e); });
}

// =============================================================================
// State helpers (m_mutex held)
// =============================================================================

void CircuitBreaker::transitionTo(CircuitState next, const char* reason) {
    const CircuitState before = m_state;
    const int beforeMultiplier = m_backoffMultiplier;
    const std::size_t beforeWindow = m_failureWindow.size();

    m_state = next;
    m_lastStateChange = m_clock.now();
    ++m_stateChanges;

    if (next == CircuitState::Closed) {
        m_backoffMultiplier = 1;
        m_failureWindow.clear();
        m_consecutiveFailures = 0;
        m_consecutiveSuccesses = 0;
        m_trialInFlight = false;
    } else if (next == CircuitState::HalfOpen) {
        m_consecutiveSuccesses = 0;
    } else if (before == CircuitState::HalfOpen) {
        m_backoffMultiplier = std::min(m_backoffMultiplier * 2, m_config.maxBackoffMultiplier);
    }

    LOG_W("Guard", "Circuit '{}' {} -> {} ({}): window {} -> {}, multiplier {} -> {}, next timeout {}ms",
          m_name, toString(before), toString(next), reason,
          beforeWindow, m_failureWindow.size(), beforeMultiplier, m_backoffMultiplier,
          currentTimeout().count());
}

void CircuitBreaker::pruneWindow(Clock::time_point now) {
    const auto cutoff = now - m_config.failureWindow;
    while (!m_failureWindow.empty() && m_failureWindow.front() < cutoff) {
        m_failureWindow.pop_front();
    }
}

std::chrono::milliseconds CircuitBreaker::currentTimeout() const {
    return std::min(m_config.timeout * m_backoffMultiplier, m_config.maxTimeout);
}

std::chrono::milliseconds CircuitBreaker::remainingOpen(Clock::time_point now) const {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_lastStateChange);
    const auto remaining = currentTimeout() - elapsed;
    return remaining.count() > 0 ? remaining : std::chrono::milliseconds(0);
}

// =============================================================================
// Introspection & persistence
// =============================================================================

CircuitState CircuitBreaker::state() const {
    std::lock_guard lock(m_mutex);
    return m_state;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard lock(m_mutex);
    const auto cutoff = m_clock.now() - m_config.failureWindow;

    CircuitBreakerStats s;
    s.name                 = m_name;
    s.state                = m_state;
    s.consecutiveFailures  = m_consecutiveFailures;
    s.consecutiveSuccesses = m_consecutiveSuccesses;
    s.recentFailures       = static_cast<std::size_t>(std::count_if(
                                 m_failureWindow.begin(), m_failureWindow.end(),
                                 [&](const auto& ts){ return ts >= cutoff; }));
    s.totalCalls           = m_totalCalls;
    s.successfulCalls      = m_successfulCalls;
    s.failedCalls          = m_failedCalls;
    s.rejectedCalls        = m_rejectedCalls;
    s.slowCalls            = m_slowCalls;
    s.timeouts             = m_timeouts;
    s.ignoredErrors        = m_ignoredErrors;
    s.stateChanges         = m_stateChanges;
    s.backoffMultiplier    = m_backoffMultiplier;
    s.currentTimeout       = currentTimeout();
    s.retryAfter           = m_state == CircuitState::Open ? remainingOpen(m_clock.now()) : std::chrono::milliseconds(0);
    s.lastStateChangeMs    = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 m_lastStateChange.time_since_epoch()).count();
    s.latency              = m_latency.summary();
    return s;
}

CircuitBreakerSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard lock(m_mutex);
    CircuitBreakerSnapshot snap;
    snap.state                = m_state;
    snap.lastStateChangeMs    = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    m_lastStateChange.time_since_epoch()).count();
    snap.backoffMultiplier    = m_backoffMultiplier;
    snap.consecutiveFailures  = m_consecutiveFailures;
    snap.consecutiveSuccesses = m_consecutiveSuccesses;
    return snap;
}

bool CircuitBreaker::restore(const CircuitBreakerSnapshot& snap) {
    std::lock_guard lock(m_mutex);
    const auto ours = std::chrono::duration_cast<std::chrono::milliseconds>(
                          m_lastStateChange.time_since_epoch()).count();
    if (snap.lastStateChangeMs <= ours) return false;

    const CircuitState before = m_state;
    m_state                = snap.state;
    m_lastStateChange      = Clock::time_point(std::chrono::milliseconds(snap.lastStateChangeMs));
    m_backoffMultiplier    = std::clamp(snap.backoffMultiplier, 1, m_config.maxBackoffMultiplier);
    m_consecutiveFailures  = snap.consecutiveFailures;
    m_consecutiveSuccesses = snap.consecutiveSuccesses;
    m_trialInFlight        = false;
    if (m_state == CircuitState::Closed) m_failureWindow.clear();
    ++m_stateChanges;

    LOG_I("Guard", "Circuit '{}' adopted shared state {} -> {} (owner={}, multiplier={})",
          m_name, toString(before), toString(m_state), snap.owner, m_backoffMultiplier);
    return true;
}

void CircuitBreaker::reset() {
    std::lock_guard lock(m_mutex);
    if (m_state != CircuitState::Closed) {
        transitionTo(CircuitState::Closed, "manual reset");
    }
}

} // namespace Rampart
