#include "resilience/CircuitBreakerRegistry.hpp"
#include "RampartLogging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>

namespace Rampart {

using namespace std::chrono_literals;

std::map<std::string, CircuitBreakerConfig> CircuitBreakerRegistryConfig::builtinProfiles() {
    std::map<std::string, CircuitBreakerConfig> p;

    CircuitBreakerConfig redis;
    redis.failureThreshold = 10;        // tolerant: the shared cache is on every hot path
    redis.timeout          = 30s;
    redis.maxTimeout       = 120s;
    redis.failureWindow    = 60s;
    p["redis_operations"]  = redis;

    CircuitBreakerConfig db;
    db.failureThreshold      = 5;
    db.timeout               = 60s;
    db.maxTimeout            = 300s;
    db.failureWindow         = 120s;
    p["database_operations"] = db;

    CircuitBreakerConfig external;
    external.failureThreshold  = 3;
    external.timeout           = 120s;
    external.maxTimeout        = 600s;
    external.failureWindow     = 300s;
    external.slowCallThreshold = 3000ms;
    p["external_apis"]         = external;

    CircuitBreakerConfig ws;
    ws.failureThreshold        = 5;
    ws.timeout                 = 30s;
    ws.maxTimeout              = 180s;
    ws.failureWindow           = 60s;
    p["websocket_connections"] = ws;

    CircuitBreakerConfig trading;
    trading.failureThreshold  = 2;
    trading.timeout           = 10s;
    trading.maxTimeout        = 60s;
    trading.failureWindow     = 30s;
    trading.slowCallThreshold = 1000ms;
    p["trading_execution"]    = trading;

    return p;
}

void CircuitBreakerRegistryConfig::validate() const {
    defaults.validate("defaults");
    for (const auto& [name, cfg] : profiles) {
        if (name.empty()) throw ConfigError("breaker profile with empty name");
        cfg.validate(name);
    }
    if (syncInterval.count() <= 0) throw ConfigError("breakers.sync_interval_ms must be positive");
    if (instanceId.empty()) throw ConfigError("breakers.instance_id must not be empty");
}

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerRegistryConfig config,
                                               BlockingExecutor& executor,
                                               std::shared_ptr<KeyValueStore> store,
                                               const Clock& clock)
    : m_config(std::move(config))
    , m_executor(executor)
    , m_store(std::move(store))
    , m_clock(clock)
{
    m_config.validate();
    if (!m_store) {
        rLog_App("CircuitBreakerRegistry running without a shared store; breaker state is process-local");
    }
}

CircuitBreakerRegistry::~CircuitBreakerRegistry() {
    stop();
}

const CircuitBreakerConfig& CircuitBreakerRegistry::configFor(const std::string& name) const {
    auto it = m_config.profiles.find(name);
    return it != m_config.profiles.end() ? it->second : m_config.defaults;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string& name) {
    {
        std::shared_lock lock(m_mutex);
        auto it = m_breakers.find(name);
        if (it != m_breakers.end()) return it->second;
    }

    std::unique_lock lock(m_mutex);
    auto [it, inserted] = m_breakers.try_emplace(name, nullptr);
    if (inserted) {
        it->second = std::make_shared<CircuitBreaker>(name, configFor(name), m_executor, m_clock);
    }
    return it->second;
}

void CircuitBreakerRegistry::preload() {
    for (const auto& profile : m_config.profiles) {
        (void)get(profile.first);
    }
}

std::vector<CircuitBreakerStats> CircuitBreakerRegistry::stats() const {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::shared_lock lock(m_mutex);
        breakers.reserve(m_breakers.size());
        for (const auto& [name, b] : m_breakers) breakers.push_back(b);
    }
    std::vector<CircuitBreakerStats> out;
    out.reserve(breakers.size());
    for (const auto& b : breakers) out.push_back(b->stats());
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.name < b.name; });
    return out;
}

std::size_t CircuitBreakerRegistry::size() const {
    std::shared_lock lock(m_mutex);
    return m_breakers.size();
}

void CircuitBreakerRegistry::start() {
    if (!m_store || m_running.exchange(true)) return;

    rLog_App("CircuitBreakerRegistry syncing with store every {}ms", m_config.syncInterval.count());
    m_tasks = std::make_unique<TaskGroup>("breaker-sync");
    m_tasks->spawn("sync", [this](CancellationToken& token){
        while (token.sleepFor(m_config.syncInterval)) {
            syncWithStore();
        }
    });
}

void CircuitBreakerRegistry::stop() {
    if (!m_running.exchange(false)) return;
    if (m_tasks) {
        m_tasks->shutdown(m_config.syncInterval);
        m_tasks.reset();
    }
    syncWithStore();   // publish final state for the other instances
}

void CircuitBreakerRegistry::syncWithStore() {
    if (!m_store) return;

    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::shared_lock lock(m_mutex);
        for (const auto& [name, b] : m_breakers) breakers.push_back(b);
    }

    for (const auto& breaker : breakers) {
        const auto key = storeKey(breaker->name());
        try {
            std::optional<CircuitBreakerSnapshot> stored;
            if (auto raw = m_store->get(key)) {
                try {
                    stored = decode(*raw);
                } catch (const DataIntegrityError& e) {
                    LOG_W("Guard", "Discarding unreadable breaker state for '{}': {}", breaker->name(), e.what());
                }
            }

            if (stored && stored->owner != m_config.instanceId && breaker->restore(*stored)) {
                continue;
            }

            auto local = breaker->snapshot();
            if (stored && stored->lastStateChangeMs > local.lastStateChangeMs) continue;

            local.owner = m_config.instanceId;
            const auto& cfg = breaker->config();
            const auto ttl = 2 * std::max(cfg.failureWindow, cfg.maxTimeout);
            m_store->set(key, encode(local), ttl);
        } catch (const std::exception& e) {
            LOG_W("Guard", "Breaker state sync failed for '{}': {}", breaker->name(), e.what());
        }
    }
}

std::string CircuitBreakerRegistry::encode(const CircuitBreakerSnapshot& snap) {
    nlohmann::json j;
    j["state"]                 = toString(snap.state);
    j["last_state_change_ms"]  = snap.lastStateChangeMs;
    j["backoff_multiplier"]    = snap.backoffMultiplier;
    j["consecutive_failures"]  = snap.consecutiveFailures;
    j["consecutive_successes"] = snap.consecutiveSuccesses;
    j["owner"]                 = snap.owner;
    return j.dump();
}

CircuitBreakerSnapshot CircuitBreakerRegistry::decode(const std::string& payload) {
    try {
        const auto j = nlohmann::json::parse(payload);
        const auto state = circuitStateFromString(j.at("state").get<std::string>());
        if (!state) throw DataIntegrityError("unknown circuit state in " + payload);

        CircuitBreakerSnapshot snap;
        snap.state                = *state;
        snap.lastStateChangeMs    = j.at("last_state_change_ms").get<std::int64_t>();
        snap.backoffMultiplier    = j.value("backoff_multiplier", 1);
        snap.consecutiveFailures  = j.value("consecutive_failures", 0);
        snap.consecutiveSuccesses = j.value("consecutive_successes", 0);
        snap.owner                = j.value("owner", std::string{});
        return snap;
    } catch (const nlohmann::json::exception& e) {
        throw DataIntegrityError(std::string("malformed breaker snapshot: ") + e.what());
    }
}

} // namespace Rampart
