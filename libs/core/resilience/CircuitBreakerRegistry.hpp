/*
Rampart — CircuitBreakerRegistry
Role: Name-keyed home of every circuit breaker; creates them lazily with per-name profiles.
Inputs/Outputs: get(name) returns a shared breaker; stats() reports all of them.
Threading: Double-checked locking over a shared_mutex (lookups take the shared lock).
           Optional store sync runs as one task in the registry's TaskGroup.
Performance: Lookup of an existing breaker is one shared lock + hash lookup.
Integration: Owned by RampartRuntime; consumed by GuardedCaller.
Observability: Logs breaker creation, adoption of shared state and store failures.
Related: CircuitBreakerRegistry.cpp, CircuitBreaker.hpp, KeyValueStore.hpp.
Assumptions: Without a KeyValueStore breakers are process-local; with one, state converges across
             instances on the sync interval (last state change wins).
*/
#pragma once

#include "resilience/CircuitBreaker.hpp"
#include "runtime/TaskGroup.hpp"
#include "store/KeyValueStore.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Rampart {

struct CircuitBreakerRegistryConfig {
    CircuitBreakerConfig                        defaults;
    std::map<std::string, CircuitBreakerConfig> profiles{builtinProfiles()};
    std::chrono::milliseconds                   syncInterval{5000};
    std::string                                 instanceId{"rampart"};

    // redis_operations, database_operations, external_apis, websocket_connections, trading_execution
    static std::map<std::string, CircuitBreakerConfig> builtinProfiles();

    void validate() const;
};

class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(CircuitBreakerRegistryConfig config,
                           BlockingExecutor& executor,
                           std::shared_ptr<KeyValueStore> store = nullptr,
                           const Clock& clock = SystemClock::instance());
    ~CircuitBreakerRegistry();

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    [[nodiscard]] std::shared_ptr<CircuitBreaker> get(const std::string& name);
    [[nodiscard]] std::vector<CircuitBreakerStats> stats() const;
    [[nodiscard]] std::size_t size() const;

    // Creates every configured profile up front so they show up in status reports.
    void preload();

    void start();
    void stop();

    // One store round-trip for every breaker. No-op without a store.
    void syncWithStore();

    static std::string storeKey(const std::string& name) { return "circuit_breaker:" + name; }
    static std::string encode(const CircuitBreakerSnapshot& snap);
    static CircuitBreakerSnapshot decode(const std::string& payload);   // throws DataIntegrityError

private:
    const CircuitBreakerConfig& configFor(const std::string& name) const;

    const CircuitBreakerRegistryConfig m_config;
    BlockingExecutor&                  m_executor;
    std::shared_ptr<KeyValueStore>     m_store;
    const Clock&                       m_clock;

    mutable std::shared_mutex                                        m_mutex;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> m_breakers;

    std::atomic<bool>          m_running{false};
    std::unique_ptr<TaskGroup> m_tasks;
};

} // namespace Rampart
