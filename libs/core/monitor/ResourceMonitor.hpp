/*
Rampart — ResourceMonitor
Role: Samples host CPU, memory and disk utilization and serves the latest ResourceSnapshot.
Inputs/Outputs: Reads through a ResourceSampler; exposes snapshot() copies and pressure predicates.
Threading: One sampling task in its own TaskGroup is the single writer; readers load an
           atomic shared_ptr and never block.
Performance: snapshot() is one atomic load. Sampling never blocks on a CPU measurement window;
             CPU utilization is the delta since the previous sample.
Integration: Read by BackpressureManager, EventStreamManager and the health monitor handler.
Observability: Logs sampler failures; each sample at debug level (throttled).
Related: ResourceMonitor.cpp, ProcResourceSampler.hpp, BackpressureManager.hpp.
Assumptions: The first sample after startup only primes the CPU window and is discarded.
*/
#pragma once

#include "runtime/Clock.hpp"
#include "runtime/TaskGroup.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace Rampart {

struct ResourceSnapshot {
    double            cpuPercent{0.0};
    double            memoryPercent{0.0};
    double            diskPercent{0.0};
    Clock::time_point lastUpdate{};
    bool              valid{false};   // false until the first usable sample lands
};

struct ResourceThresholds {
    double cpuPercent{90.0};
    double memoryPercent{85.0};
    double diskPercent{95.0};

    void validate(const std::string& context) const;
};

struct ResourceMonitorConfig {
    std::chrono::milliseconds sampleInterval{5000};
    std::string               procRoot{"/proc"};
    std::string               diskPath{"/"};

    void validate() const;
};

// Raw reading; cpuPercent is empty when the sampler has no previous window yet.
struct ResourceReading {
    std::optional<double> cpuPercent;
    double                memoryPercent{0.0};
    double                diskPercent{0.0};
};

class ResourceSampler {
public:
    virtual ~ResourceSampler() = default;
    virtual ResourceReading sample() = 0;
};

class ResourceMonitor {
public:
    ResourceMonitor(ResourceMonitorConfig config,
                    std::unique_ptr<ResourceSampler> sampler,
                    const Clock& clock = SystemClock::instance());
    ~ResourceMonitor();

    // Non-copyable, non-movable (manages a task)
    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;
    ResourceMonitor(ResourceMonitor&&) = delete;
    ResourceMonitor& operator=(ResourceMonitor&&) = delete;

    void start();
    void stop();

    // Takes one sample and publishes it. Called by the sampling loop; public for tests and
    // for an initial synchronous read at startup.
    void sampleOnce();

    [[nodiscard]] ResourceSnapshot snapshot() const;
    [[nodiscard]] bool isUnderSeverePressure(const ResourceThresholds& thresholds) const;
    [[nodiscard]] bool isStale() const;
    [[nodiscard]] std::uint64_t samplesTaken() const noexcept { return m_samples.load(); }
    [[nodiscard]] const ResourceMonitorConfig& config() const noexcept { return m_config; }

    static bool exceeds(const ResourceSnapshot& s, const ResourceThresholds& thresholds);

private:
    void run(CancellationToken& token);

    const ResourceMonitorConfig                          m_config;
    std::unique_ptr<ResourceSampler>                     m_sampler;
    const Clock&                                         m_clock;
    std::atomic<std::shared_ptr<const ResourceSnapshot>> m_snapshot;
    std::atomic<std::uint64_t>                           m_samples{0};
    std::atomic<bool>                                    m_running{false};
    std::unique_ptr<TaskGroup>                           m_tasks;
};

} // namespace Rampart
