/*
Rampart — Error taxonomy
Role: Exception hierarchy shared by every component.
Inputs/Outputs: Thrown by breakers, backpressure, config loading and parsers.
Threading: Value types; safe to copy across threads via std::exception_ptr.
Integration: Capacity and configuration errors cross component boundaries; transient and
             data-integrity errors are handled where they occur.
Related: CircuitBreaker.hpp, BackpressureManager.hpp, ConfigLoader.hpp, TickerParser.hpp.
*/
#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace Rampart {

class RampartError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Rejected for lack of capacity; carries a retry-after hint for the caller.
class CapacityError : public RampartError {
public:
    CapacityError(const std::string& what, std::chrono::milliseconds retryAfter)
        : RampartError(what), m_retryAfter(retryAfter) {}

    [[nodiscard]] std::chrono::milliseconds retryAfter() const noexcept { return m_retryAfter; }

private:
    std::chrono::milliseconds m_retryAfter;
};

class CircuitOpenError : public CapacityError {
public:
    CircuitOpenError(std::string breaker, std::chrono::milliseconds retryAfter)
        : CapacityError("circuit '" + breaker + "' is open, retry after "
                        + std::to_string(retryAfter.count()) + "ms", retryAfter)
        , m_breaker(std::move(breaker)) {}

    [[nodiscard]] const std::string& breaker() const noexcept { return m_breaker; }

private:
    std::string m_breaker;
};

class BackpressureError : public CapacityError {
public:
    using CapacityError::CapacityError;
};

// Operation missed its deadline. Counted as a failure by the breaker.
class CallTimeoutError : public RampartError {
public:
    CallTimeoutError(const std::string& operation, std::chrono::milliseconds timeout)
        : RampartError(operation + " timed out after " + std::to_string(timeout.count()) + "ms")
        , m_timeout(timeout) {}

    [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return m_timeout; }

private:
    std::chrono::milliseconds m_timeout;
};

class ConfigError : public RampartError {
public:
    using RampartError::RampartError;
};

// Malformed upstream payloads (exchange messages, cached records).
class DataIntegrityError : public RampartError {
public:
    using RampartError::RampartError;
};

// Expected caller-side errors (validation and the like). Circuit breakers let these
// through without touching circuit health.
class PassThroughError : public RampartError {
public:
    using RampartError::RampartError;
};

} // namespace Rampart
