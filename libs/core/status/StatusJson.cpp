#include "status/StatusJson.hpp"

namespace Rampart {

namespace {

std::int64_t epochMs(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

nlohmann::json toJson(const ResourceSnapshot& s) {
    return {
        {"valid",          s.valid},
        {"cpu_percent",    s.cpuPercent},
        {"memory_percent", s.memoryPercent},
        {"disk_percent",   s.diskPercent},
        {"last_update_ms", s.valid ? epochMs(s.lastUpdate) : 0},
    };
}

nlohmann::json toJson(const LatencySummary& l) {
    return {
        {"samples", l.samples},
        {"p50_ms",  l.p50Ms},
        {"p95_ms",  l.p95Ms},
        {"p99_ms",  l.p99Ms},
        {"avg_ms",  l.avgMs},
        {"max_ms",  l.maxMs},
    };
}

nlohmann::json toJson(const CircuitBreakerStats& s) {
    return {
        {"name",                  s.name},
        {"state",                 toString(s.state)},
        {"consecutive_failures",  s.consecutiveFailures},
        {"consecutive_successes", s.consecutiveSuccesses},
        {"recent_failures",       s.recentFailures},
        {"total_calls",           s.totalCalls},
        {"successful_calls",      s.successfulCalls},
        {"failed_calls",          s.failedCalls},
        {"rejected_calls",        s.rejectedCalls},
        {"slow_calls",            s.slowCalls},
        {"timeouts",              s.timeouts},
        {"ignored_errors",        s.ignoredErrors},
        {"state_changes",         s.stateChanges},
        {"backoff_multiplier",    s.backoffMultiplier},
        {"current_timeout_ms",    s.currentTimeout.count()},
        {"retry_after_ms",        s.retryAfter.count()},
        {"last_state_change_ms",  s.lastStateChangeMs},
        {"latency",               toJson(s.latency)},
    };
}

nlohmann::json toJson(const BackpressureStats& s) {
    nlohmann::json queues = nlohmann::json::object();
    for (std::size_t i = 0; i < kPriorityCount; ++i) {
        queues[toString(static_cast<Priority>(i))] = s.queueLengths[i];
    }
    return {
        {"active",            s.active},
        {"max_concurrent",    s.maxConcurrent},
        {"queue_lengths",     queues},
        {"admitted",          s.admitted},
        {"queued",            s.queued},
        {"rejected",          s.rejected},
        {"queue_timeouts",    s.queueTimeouts},
        {"completed",         s.completed},
        {"critical_bypasses", s.criticalBypasses},
        {"pressure_events",   s.pressureEvents},
        {"under_pressure",    s.underPressure},
        {"queue_wait",        toJson(s.queueWait)},
    };
}

nlohmann::json toJson(const StreamManagerStatus& s) {
    nlohmann::json consumers = nlohmann::json::array();
    for (const auto& c : s.consumers) {
        consumers.push_back({
            {"service",                   c.service},
            {"stream",                    c.stream},
            {"group",                     c.group},
            {"consumer",                  c.consumer},
            {"priority",                  toString(c.priority)},
            {"state",                     toString(c.state)},
            {"processed",                 c.processed},
            {"acknowledged",              c.acknowledged},
            {"failed_batches",            c.failedBatches},
            {"timed_out_batches",         c.timedOutBatches},
            {"reclaimed",                 c.reclaimed},
            {"fallback_runs",             c.fallbackRuns},
            {"gated_polls",               c.gatedPolls},
            {"last_fallback_interval_ms", c.lastFallbackInterval.count()},
        });
    }

    nlohmann::json streams = nlohmann::json::array();
    for (const auto& st : s.streams) {
        nlohmann::json entry = {{"name", st.name}, {"available", st.available}};
        if (!st.available) {
            entry["error"] = st.error;
            streams.push_back(std::move(entry));
            continue;
        }
        nlohmann::json groups = nlohmann::json::array();
        for (const auto& g : st.info.groups) {
            groups.push_back({
                {"name",              g.name},
                {"pending",           g.pending},
                {"lag",               g.lag},
                {"last_delivered_id", g.lastDeliveredId.toString()},
            });
        }
        entry["length"] = st.info.length;
        entry["first_entry_id"] = st.info.firstEntryId.toString();
        entry["last_generated_id"] = st.info.lastGeneratedId.toString();
        entry["groups"] = std::move(groups);
        streams.push_back(std::move(entry));
    }

    return {
        {"running",           s.running},
        {"consumers",         std::move(consumers)},
        {"streams",           std::move(streams)},
        {"skipped_services",  s.skippedServices},
        {"published",         s.published},
        {"publish_failures",  s.publishFailures},
        {"trimmed_by_age",    s.trimmedByAge},
        {"trimmed_by_length", s.trimmedByLength},
    };
}

nlohmann::json toJson(const ExchangeStatus& s) {
    nlohmann::json j = {
        {"exchange",             s.exchange},
        {"state",                toString(s.state)},
        {"connected",            s.connected},
        {"consecutive_failures", s.consecutiveFailures},
        {"connects",             s.connects},
        {"reconnects",           s.reconnects},
        {"failures",             s.failures},
        {"stale_recycles",       s.staleRecycles},
        {"messages",             s.messages},
        {"tickers",              s.tickers},
        {"malformed",            s.malformed},
    };
    j["last_message_age_ms"] = s.lastMessageAge ? nlohmann::json(s.lastMessageAge->count()) : nlohmann::json();
    if (!s.lastError.empty()) j["last_error"] = s.lastError;
    return j;
}

nlohmann::json toJson(const MarketDataStatus& s) {
    nlohmann::json exchanges = nlohmann::json::array();
    for (const auto& e : s.exchanges) exchanges.push_back(toJson(e));

    nlohmann::json bySource = nlohmann::json::object();
    for (std::size_t i = 0; i < s.updatesBySource.size(); ++i) {
        bySource[toString(static_cast<DataSource>(i))] = s.updatesBySource[i];
    }

    return {
        {"running",               s.running},
        {"exchanges",             std::move(exchanges)},
        {"total_updates",         s.totalUpdates},
        {"updates_by_source",     std::move(bySource)},
        {"rest_calls",            s.restCalls},
        {"rest_failures",         s.restFailures},
        {"cache_hits",            s.cacheHits},
        {"publish_failures",      s.publishFailures},
        {"subscribers",           s.subscribers},
        {"dropped_notifications", s.droppedNotifications},
        {"subscriber_errors",     s.subscriberErrors},
        {"fallback_pollers",      s.fallbackPollers},
        {"cached_symbols",        s.cachedSymbols},
        {"store_errors",          s.storeErrors},
    };
}

nlohmann::json toJson(const RuntimeStatus& s) {
    nlohmann::json breakers = nlohmann::json::array();
    for (const auto& b : s.breakers) breakers.push_back(toJson(b));

    nlohmann::json j = {
        {"running",         s.running},
        {"resources",       toJson(s.resources)},
        {"circuit_breakers", std::move(breakers)},
        {"disabled",        s.disabled},
        {"abandoned_calls", s.abandonedCalls},
    };
    j["backpressure"] = s.backpressure ? toJson(*s.backpressure) : nlohmann::json();
    j["streams"]      = s.streams ? toJson(*s.streams) : nlohmann::json();
    j["market_data"]  = s.marketData ? toJson(*s.marketData) : nlohmann::json();
    return j;
}

} // namespace Rampart
