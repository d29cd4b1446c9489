#include "config/ConfigLoader.hpp"
#include "RampartErrors.hpp"
#include "RampartLogging.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <type_traits>

namespace Rampart {

using json = nlohmann::json;

namespace {

// ============================================================================
// Field readers. Each one leaves the target untouched when the key is absent.
// ============================================================================

const json* child(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

std::string at(const std::string& path, const char* key) {
    return path.empty() ? std::string(key) : path + "." + key;
}

void requireObject(const json& j, const std::string& path) {
    if (!j.is_object()) throw ConfigError("'" + path + "' must be an object");
}

void readBool(const json& obj, const char* key, const std::string& path, bool& out) {
    if (auto* v = child(obj, key)) {
        if (!v->is_boolean()) throw ConfigError("'" + at(path, key) + "' must be a boolean");
        out = v->get<bool>();
    }
}

void readDouble(const json& obj, const char* key, const std::string& path, double& out) {
    if (auto* v = child(obj, key)) {
        if (!v->is_number()) throw ConfigError("'" + at(path, key) + "' must be a number");
        out = v->get<double>();
    }
}

template <class Int>
void readInt(const json& obj, const char* key, const std::string& path, Int& out) {
    if (auto* v = child(obj, key)) {
        if (!v->is_number_integer()) throw ConfigError("'" + at(path, key) + "' must be an integer");
        if constexpr (std::is_unsigned_v<Int>) {
            if (v->get<long long>() < 0) throw ConfigError("'" + at(path, key) + "' must not be negative");
        }
        out = v->get<Int>();
    }
}

template <class Duration>
void readDuration(const json& obj, const char* key, const std::string& path, Duration& out) {
    if (auto* v = child(obj, key)) {
        if (!v->is_number_integer()) throw ConfigError("'" + at(path, key) + "' must be an integer");
        out = Duration(v->get<long long>());
    }
}

void readString(const json& obj, const char* key, const std::string& path, std::string& out) {
    if (auto* v = child(obj, key)) {
        if (!v->is_string()) throw ConfigError("'" + at(path, key) + "' must be a string");
        out = v->get<std::string>();
    }
}

void readStringList(const json& obj, const char* key, const std::string& path, std::vector<std::string>& out) {
    if (auto* v = child(obj, key)) {
        if (!v->is_array()) throw ConfigError("'" + at(path, key) + "' must be an array of strings");
        std::vector<std::string> values;
        for (const auto& item : *v) {
            if (!item.is_string()) throw ConfigError("'" + at(path, key) + "' must be an array of strings");
            values.push_back(item.get<std::string>());
        }
        out = std::move(values);
    }
}

void readStringSet(const json& obj, const char* key, const std::string& path, std::set<std::string>& out) {
    std::vector<std::string> values(out.begin(), out.end());
    readStringList(obj, key, path, values);
    out = std::set<std::string>(values.begin(), values.end());
}

void readServicePriority(const json& obj, const char* key, const std::string& path, ServicePriority& out) {
    std::string s;
    readString(obj, key, path, s);
    if (s.empty()) return;
    auto p = servicePriorityFromString(s);
    if (!p) throw ConfigError("'" + at(path, key) + "': unknown priority '" + s + "'");
    out = *p;
}

// ============================================================================
// Sections
// ============================================================================

void applyThresholds(const json& j, const std::string& path, ResourceThresholds& t) {
    requireObject(j, path);
    readDouble(j, "cpu_percent", path, t.cpuPercent);
    readDouble(j, "memory_percent", path, t.memoryPercent);
    readDouble(j, "disk_percent", path, t.diskPercent);
}

void applyRuntime(const json& j, RuntimeConfig& c) {
    const std::string path = "runtime";
    requireObject(j, path);
    readInt(j, "executor_threads", path, c.executorThreads);
    readDuration(j, "shutdown_grace_ms", path, c.shutdownGrace);
    readDuration(j, "status_interval_ms", path, c.statusInterval);
    readString(j, "log_level", path, c.logLevel);
}

void applyResources(const json& j, ResourceMonitorConfig& c) {
    const std::string path = "resources";
    requireObject(j, path);
    readDuration(j, "sample_interval_ms", path, c.sampleInterval);
    readString(j, "proc_root", path, c.procRoot);
    readString(j, "disk_path", path, c.diskPath);
}

void applyBreaker(const json& j, const std::string& path, CircuitBreakerConfig& c) {
    requireObject(j, path);
    readInt(j, "failure_threshold", path, c.failureThreshold);
    readInt(j, "success_threshold", path, c.successThreshold);
    readDuration(j, "timeout_ms", path, c.timeout);
    readDuration(j, "max_timeout_ms", path, c.maxTimeout);
    readDuration(j, "failure_window_ms", path, c.failureWindow);
    readDuration(j, "slow_call_threshold_ms", path, c.slowCallThreshold);
    readDuration(j, "call_timeout_ms", path, c.callTimeout);
    readInt(j, "max_backoff_multiplier", path, c.maxBackoffMultiplier);
}

void applyBreakers(const json& j, CircuitBreakerRegistryConfig& c) {
    const std::string path = "circuit_breakers";
    requireObject(j, path);
    readDuration(j, "sync_interval_ms", path, c.syncInterval);
    readString(j, "instance_id", path, c.instanceId);
    if (auto* d = child(j, "defaults")) applyBreaker(*d, path + ".defaults", c.defaults);
    if (auto* profiles = child(j, "profiles")) {
        requireObject(*profiles, path + ".profiles");
        for (const auto& [name, body] : profiles->items()) {
            auto it = c.profiles.find(name);
            CircuitBreakerConfig profile = it != c.profiles.end() ? it->second : c.defaults;
            applyBreaker(body, path + ".profiles." + name, profile);
            c.profiles[name] = profile;
        }
    }
}

void applyBackpressure(const json& j, RampartConfig& root) {
    const std::string path = "backpressure";
    requireObject(j, path);
    auto& c = root.backpressure;
    readBool(j, "enabled", path, root.enableBackpressure);
    readInt(j, "max_concurrent", path, c.maxConcurrent);
    readDuration(j, "default_timeout_ms", path, c.defaultTimeout);
    readDuration(j, "reject_retry_after_ms", path, c.rejectRetryAfter);
    if (auto* caps = child(j, "queue_capacity")) {
        const std::string capPath = path + ".queue_capacity";
        requireObject(*caps, capPath);
        for (const auto& [name, value] : caps->items()) {
            auto p = priorityFromString(name);
            if (!p) throw ConfigError("'" + capPath + "': unknown priority '" + name + "'");
            if (!value.is_number_unsigned()) throw ConfigError("'" + capPath + "." + name + "' must be a non-negative integer");
            c.queueCapacity[static_cast<std::size_t>(*p)] = value.get<std::size_t>();
        }
    }
    if (auto* severe = child(j, "severe")) applyThresholds(*severe, path + ".severe", c.severe);
}

void applyStream(const json& j, const std::string& path, EventStreamConfig& s) {
    requireObject(j, path);
    readInt(j, "max_length", path, s.maxLength);
    readDuration(j, "retention_s", path, s.retention);
    readString(j, "consumer_group", path, s.consumerGroup);
    readServicePriority(j, "priority", path, s.priority);
}

void applyService(const json& j, const std::string& path, ServiceConsumerConfig& s) {
    requireObject(j, path);
    readString(j, "stream", path, s.stream);
    readServicePriority(j, "priority", path, s.priority);
    readInt(j, "batch_size", path, s.batchSize);
    readDuration(j, "batch_timeout_ms", path, s.batchTimeout);
    readDuration(j, "fallback_interval_ms", path, s.fallbackInterval);
}

void applyStreams(const json& j, RampartConfig& root) {
    const std::string path = "streams";
    requireObject(j, path);
    auto& c = root.streams;
    readBool(j, "enabled", path, root.enableStreams);
    readDuration(j, "poll_timeout_ms", path, c.pollTimeout);
    readDuration(j, "min_idle_ms", path, c.minIdle);
    readInt(j, "claim_batch", path, c.claimBatch);
    readDuration(j, "reclaim_interval_ms", path, c.reclaimInterval);
    readDuration(j, "cleanup_interval_ms", path, c.cleanupInterval);
    readDuration(j, "backoff_delay_ms", path, c.backoffDelay);
    readDuration(j, "resource_wait_delay_ms", path, c.resourceWaitDelay);
    readDuration(j, "activity_window_ms", path, c.activityWindow);
    readDuration(j, "fallback_timeout_ms", path, c.fallbackTimeout);
    readDuration(j, "critical_stagger_ms", path, c.criticalStagger);
    readDuration(j, "default_stagger_ms", path, c.defaultStagger);
    readDuration(j, "min_fallback_critical_ms", path, c.minFallbackCritical);
    readDuration(j, "min_fallback_important_ms", path, c.minFallbackImportant);
    readDuration(j, "min_fallback_background_ms", path, c.minFallbackBackground);
    readDuration(j, "max_fallback_interval_ms", path, c.maxFallbackInterval);
    readDuration(j, "shutdown_grace_ms", path, c.shutdownGrace);
    readString(j, "consumer_prefix", path, c.consumerPrefix);
    if (auto* alert = child(j, "health_alert")) applyThresholds(*alert, path + ".health_alert", root.healthAlert);

    if (auto* catalog = child(j, "catalog")) {
        requireObject(*catalog, path + ".catalog");
        for (const auto& [name, body] : catalog->items()) {
            auto it = std::find_if(c.streams.begin(), c.streams.end(),
                                   [key = std::string(name)](const EventStreamConfig& s){ return s.name == key; });
            if (it == c.streams.end()) {
                EventStreamConfig added;
                added.name = name;
                added.consumerGroup = name + "_group";
                applyStream(body, path + ".catalog." + name, added);
                c.streams.push_back(std::move(added));
            } else {
                applyStream(body, path + ".catalog." + name, *it);
            }
        }
    }
    if (auto* services = child(j, "services")) {
        requireObject(*services, path + ".services");
        for (const auto& [name, body] : services->items()) {
            auto it = std::find_if(c.services.begin(), c.services.end(),
                                   [key = std::string(name)](const ServiceConsumerConfig& s){ return s.service == key; });
            if (it == c.services.end()) {
                ServiceConsumerConfig added;
                added.service = name;
                applyService(body, path + ".services." + name, added);
                c.services.push_back(std::move(added));
            } else {
                applyService(body, path + ".services." + name, *it);
            }
        }
    }
}

void applyExchange(const json& j, const std::string& path, ExchangeConfig& e) {
    requireObject(j, path);
    readBool(j, "enabled", path, e.enabled);
    readString(j, "host", path, e.host);
    readString(j, "port", path, e.port);
    readString(j, "path", path, e.path);
    readDuration(j, "reconnect_delay_ms", path, e.reconnectDelay);
    readInt(j, "max_retries", path, e.maxRetries);
    readDuration(j, "ping_interval_ms", path, e.pingInterval);
    readInt(j, "symbols_per_connection", path, e.symbolsPerConnection);
}

void applyMarketData(const json& j, RampartConfig& root) {
    const std::string path = "market_data";
    requireObject(j, path);
    auto& c = root.marketData;
    readBool(j, "enabled", path, root.enableMarketData);
    readStringList(j, "symbols", path, c.symbols);
    readDuration(j, "staleness_threshold_ms", path, c.stalenessThreshold);
    readDuration(j, "stale_after_ms", path, c.staleAfter);
    readDuration(j, "watchdog_interval_ms", path, c.watchdogInterval);
    readDuration(j, "healthy_recheck_ms", path, c.healthyRecheck);
    readDuration(j, "hot_fallback_base_ms", path, c.hotFallbackBase);
    readDuration(j, "warm_fallback_base_ms", path, c.warmFallbackBase);
    readDuration(j, "cold_fallback_base_ms", path, c.coldFallbackBase);
    readDuration(j, "min_fallback_interval_ms", path, c.minFallbackInterval);
    readDuration(j, "max_fallback_interval_ms", path, c.maxFallbackInterval);
    readInt(j, "max_failure_multiplier", path, c.maxFailureMultiplier);
    readDouble(j, "fallback_jitter", path, c.fallbackJitter);
    readDuration(j, "hot_rest_timeout_ms", path, c.hotRestTimeout);
    readDuration(j, "warm_rest_timeout_ms", path, c.warmRestTimeout);
    readDuration(j, "cold_rest_timeout_ms", path, c.coldRestTimeout);
    readString(j, "rest_breaker", path, c.restBreaker);
    readInt(j, "subscriber_threads", path, c.subscriberThreads);
    readInt(j, "subscriber_backlog", path, c.subscriberBacklog);
    readBool(j, "enable_websockets", path, c.enableWebSockets);
    readBool(j, "enable_fallback_pollers", path, c.enableFallbackPollers);
    readBool(j, "publish_to_streams", path, c.publishToStreams);

    if (auto* cache = child(j, "cache")) {
        const std::string cachePath = path + ".cache";
        requireObject(*cache, cachePath);
        readDuration(*cache, "hot_ttl_ms", cachePath, c.cache.hotTtl);
        readDuration(*cache, "warm_ttl_ms", cachePath, c.cache.warmTtl);
        readDuration(*cache, "cold_ttl_ms", cachePath, c.cache.coldTtl);
        readStringSet(*cache, "hot_symbols", cachePath, c.cache.hot);
        readStringSet(*cache, "warm_symbols", cachePath, c.cache.warm);
    }

    if (auto* exchanges = child(j, "exchanges")) {
        const std::string exPath = path + ".exchanges";
        requireObject(*exchanges, exPath);
        for (const auto& [name, body] : exchanges->items()) {
            auto id = exchangeFromString(name);
            if (!id) throw ConfigError("'" + exPath + "': unknown exchange '" + name + "'");
            auto it = std::find_if(c.exchanges.begin(), c.exchanges.end(),
                                   [&](const ExchangeConfig& e){ return e.id == *id; });
            if (it == c.exchanges.end()) {
                c.exchanges.push_back(ExchangeConfig::defaultsFor(*id));
                it = std::prev(c.exchanges.end());
            }
            applyExchange(body, exPath + "." + name, *it);
        }
    }

    if (auto* rest = child(j, "rest")) {
        const std::string restPath = path + ".rest";
        requireObject(*rest, restPath);
        readString(*rest, "host", restPath, root.rest.host);
        readString(*rest, "port", restPath, root.rest.port);
        readDuration(*rest, "timeout_ms", restPath, root.rest.timeout);
    }
}

} // namespace

RampartConfig ConfigLoader::fromJson(const json& root) {
    if (!root.is_object()) throw ConfigError("configuration root must be a JSON object");

    static const std::set<std::string> kSections = {
        "runtime", "resources", "circuit_breakers", "backpressure", "streams", "market_data"};
    for (const auto& [key, value] : root.items()) {
        if (!kSections.count(key)) LOG_W("App", "Ignoring unknown configuration section '{}'", key);
    }

    RampartConfig config;
    if (auto* v = child(root, "runtime"))          applyRuntime(*v, config.runtime);
    if (auto* v = child(root, "resources"))        applyResources(*v, config.resources);
    if (auto* v = child(root, "circuit_breakers")) applyBreakers(*v, config.breakers);
    if (auto* v = child(root, "backpressure"))     applyBackpressure(*v, config);
    if (auto* v = child(root, "streams"))          applyStreams(*v, config);
    if (auto* v = child(root, "market_data"))      applyMarketData(*v, config);
    return config;
}

RampartConfig ConfigLoader::fromString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("configuration is not valid JSON: ") + e.what());
    }
    return fromJson(root);
}

RampartConfig ConfigLoader::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open configuration file '" + path + "'");
    std::ostringstream buffer;
    buffer << in.rdbuf();
    rLog_App("Loading configuration from {}", path);
    return fromString(buffer.str());
}

std::optional<std::string> ConfigLoader::resolvePath(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) throw ConfigError("--config requires a path");
            return std::string(argv[i + 1]);
        }
        if (arg.rfind("--config=", 0) == 0) return arg.substr(9);
        if (!arg.empty() && arg.front() != '-') return arg;
    }
    if (const char* env = std::getenv("RAMPART_CONFIG"); env && *env) return std::string(env);
    return std::nullopt;
}

} // namespace Rampart
