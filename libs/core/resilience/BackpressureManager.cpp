#include "resilience/BackpressureManager.hpp"
#include "RampartLogging.hpp"
#include <algorithm>

namespace Rampart {

const char* toString(Priority p) {
    switch (p) {
        case Priority::Critical: return "critical";
        case Priority::High:     return "high";
        case Priority::Medium:   return "medium";
        case Priority::Low:      return "low";
    }
    return "unknown";
}

std::optional<Priority> priorityFromString(std::string_view s) {
    if (s == "critical") return Priority::Critical;
    if (s == "high")     return Priority::High;
    if (s == "medium")   return Priority::Medium;
    if (s == "low")      return Priority::Low;
    return std::nullopt;
}

void BackpressureConfig::validate() const {
    if (maxConcurrent < 1) throw ConfigError("backpressure.max_concurrent must be >= 1");
    for (std::size_t i = 0; i < queueCapacity.size(); ++i) {
        if (queueCapacity[i] == 0) {
            throw ConfigError(std::string("backpressure queue capacity for ")
                              + toString(static_cast<Priority>(i)) + " must be >= 1");
        }
    }
    severe.validate("backpressure.severe");
    if (defaultTimeout.count() <= 0) throw ConfigError("backpressure.default_timeout_ms must be positive");
    if (rejectRetryAfter.count() <= 0) throw ConfigError("backpressure.reject_retry_after_ms must be positive");
}

void BackpressureManager::Permit::release() {
    if (m_owner) {
        auto* owner = m_owner;
        m_owner = nullptr;
        owner->release(m_priority);
    }
}

BackpressureManager::BackpressureManager(BackpressureConfig config,
                                         const ResourceMonitor& monitor,
                                         BlockingExecutor& executor)
    : m_config(std::move(config))
    , m_monitor(monitor)
    , m_executor(executor)
{
    m_config.validate();
    rLog_App("BackpressureManager: max_concurrent={} queues={}/{}/{}/{}",
             m_config.maxConcurrent, m_config.queueCapacity[0], m_config.queueCapacity[1],
             m_config.queueCapacity[2], m_config.queueCapacity[3]);
}

BackpressureManager::Permit BackpressureManager::acquire(Priority priority, std::chrono::milliseconds timeout) {
    // 1. Severe resource pressure sheds everything below HIGH.
    if (priority == Priority::Medium || priority == Priority::Low) {
        const auto snap = m_monitor.snapshot();
        if (ResourceMonitor::exceeds(snap, m_config.severe)) {
            m_rejected.fetch_add(1);
            m_pressureEvents.fetch_add(1);
            rLog_GuardN(10, "Backpressure rejected {} request under pressure (cpu={:.1f}% mem={:.1f}% disk={:.1f}%)",
                        toString(priority), snap.cpuPercent, snap.memoryPercent, snap.diskPercent);
            throw BackpressureError(std::string("system under resource pressure, rejecting ")
                                    + toString(priority) + " request", m_config.rejectRetryAfter);
        }
    }

    std::unique_lock lock(m_mutex);
    const int limit = m_config.maxConcurrent;

    // 2. Free slot.
    if (m_active.load() < limit) {
        m_active.fetch_add(1);
        m_admitted.fetch_add(1);
        return Permit(this, priority);
    }

    // 3. Saturated: CRITICAL goes through anyway.
    if (priority == Priority::Critical) {
        const int now = m_active.fetch_add(1) + 1;
        m_admitted.fetch_add(1);
        m_bypasses.fetch_add(1);
        LOG_W("Guard", "Backpressure: critical request bypassing limit (active={} limit={})", now, limit);
        return Permit(this, priority);
    }

    // 4. Everyone else waits in their queue for up to half the caller's timeout.
    const auto waitBudget = timeout / 2;
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + waitBudget;
    auto& queue = m_queues[index(priority)];
    const auto capacity = m_config.queueCapacity[index(priority)];

    const bool hasSpace = m_queueSpaceCv.wait_until(lock, deadline, [&]{
        return queue.size() < capacity || m_active.load() < limit;
    });
    if (!hasSpace) {
        m_rejected.fetch_add(1);
        m_queueTimeouts.fetch_add(1);
        LOG_W("Guard", "Backpressure: {} queue full ({}), rejected after {}ms",
              toString(priority), capacity, waitBudget.count());
        throw BackpressureError(std::string(toString(priority)) + " queue full", waitBudget);
    }
    if (m_active.load() < limit) {
        m_active.fetch_add(1);
        m_admitted.fetch_add(1);
        return Permit(this, priority);
    }

    Waiter waiter{priority};
    queue.push_back(&waiter);
    m_queued.fetch_add(1);
    rLog_GuardN(20, "Backpressure: queued {} request (depth={} active={})",
                toString(priority), queue.size(), m_active.load());

    const bool granted = waiter.cv.wait_until(lock, deadline, [&]{ return waiter.granted; });
    if (!granted) {
        queue.erase(std::remove(queue.begin(), queue.end(), &waiter), queue.end());
        m_queueSpaceCv.notify_one();
        m_rejected.fetch_add(1);
        m_queueTimeouts.fetch_add(1);
        LOG_W("Guard", "Backpressure: {} request timed out in queue after {}ms",
              toString(priority), waitBudget.count());
        throw BackpressureError(std::string(toString(priority)) + " request timed out in queue", waitBudget);
    }

    m_queueWait.record(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
    m_admitted.fetch_add(1);
    return Permit(this, priority);
}

BackpressureManager::Waiter* BackpressureManager::nextWaiter(Priority completed) {
    // Highest priority at or above the completed one first.
    for (std::size_t i = 0; i <= index(completed); ++i) {
        if (!m_queues[i].empty()) {
            Waiter* w = m_queues[i].front();
            m_queues[i].pop_front();
            return w;
        }
    }
    // Never leave a freed slot idle while lower tiers are waiting.
    for (std::size_t i = index(completed) + 1; i < kPriorityCount; ++i) {
        if (!m_queues[i].empty()) {
            Waiter* w = m_queues[i].front();
            m_queues[i].pop_front();
            return w;
        }
    }
    return nullptr;
}

void BackpressureManager::release(Priority completed) {
    std::lock_guard lock(m_mutex);
    m_active.fetch_sub(1);
    m_completed.fetch_add(1);

    // Bypassed CRITICAL work may still hold us above the limit.
    if (m_active.load() >= m_config.maxConcurrent) return;

    if (Waiter* next = nextWaiter(completed)) {
        next->granted = true;
        m_active.fetch_add(1);
        next->cv.notify_one();
    }
    m_queueSpaceCv.notify_one();
}

BackpressureStats BackpressureManager::stats() const {
    BackpressureStats s;
    s.active           = m_active.load();
    s.maxConcurrent    = m_config.maxConcurrent;
    s.admitted         = m_admitted.load();
    s.queued           = m_queued.load();
    s.rejected         = m_rejected.load();
    s.queueTimeouts    = m_queueTimeouts.load();
    s.completed        = m_completed.load();
    s.criticalBypasses = m_bypasses.load();
    s.pressureEvents   = m_pressureEvents.load();
    s.underPressure    = m_monitor.isUnderSeverePressure(m_config.severe);
    {
        std::lock_guard lock(m_mutex);
        for (std::size_t i = 0; i < kPriorityCount; ++i) s.queueLengths[i] = m_queues[i].size();
        s.queueWait = m_queueWait.summary();
    }
    return s;
}

} // namespace Rampart
