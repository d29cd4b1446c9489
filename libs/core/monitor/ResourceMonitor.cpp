#include "monitor/ResourceMonitor.hpp"
#include "RampartErrors.hpp"
#include "RampartLogging.hpp"

namespace Rampart {

void ResourceThresholds::validate(const std::string& context) const {
    auto check = [&](double v, const char* field) {
        if (!(v > 0.0 && v <= 100.0)) {
            throw ConfigError(fmt::format("{}.{} must be in (0, 100], got {}", context, field, v));
        }
    };
    check(cpuPercent, "cpu_percent");
    check(memoryPercent, "memory_percent");
    check(diskPercent, "disk_percent");
}

void ResourceMonitorConfig::validate() const {
    if (sampleInterval.count() <= 0) throw ConfigError("resources.sample_interval_ms must be positive");
    if (procRoot.empty()) throw ConfigError("resources.proc_root must not be empty");
    if (diskPath.empty()) throw ConfigError("resources.disk_path must not be empty");
}

ResourceMonitor::ResourceMonitor(ResourceMonitorConfig config,
                                 std::unique_ptr<ResourceSampler> sampler,
                                 const Clock& clock)
    : m_config(std::move(config))
    , m_sampler(std::move(sampler))
    , m_clock(clock)
    , m_snapshot(std::make_shared<const ResourceSnapshot>())
{
    m_config.validate();
    if (!m_sampler) throw ConfigError("ResourceMonitor requires a sampler");
}

ResourceMonitor::~ResourceMonitor() {
    stop();
}

void ResourceMonitor::start() {
    if (m_running.exchange(true)) return;

    rLog_App("Starting ResourceMonitor (interval {}ms)", m_config.sampleInterval.count());
    sampleOnce();   // primes the CPU window
    m_tasks = std::make_unique<TaskGroup>("resource-monitor");
    m_tasks->spawn("sampler", [this](CancellationToken& token){ run(token); });
}

void ResourceMonitor::stop() {
    if (!m_running.exchange(false)) return;
    if (m_tasks) {
        m_tasks->shutdown(m_config.sampleInterval);
        m_tasks.reset();
    }
    rLog_App("ResourceMonitor stopped after {} samples", m_samples.load());
}

void ResourceMonitor::run(CancellationToken& token) {
    while (token.sleepFor(m_config.sampleInterval)) {
        sampleOnce();
    }
}

void ResourceMonitor::sampleOnce() {
    ResourceReading reading;
    try {
        reading = m_sampler->sample();
    } catch (const std::exception& e) {
        LOG_W("Guard", "Resource sampling failed, keeping previous snapshot: {}", e.what());
        return;
    }

    if (!reading.cpuPercent) {
        LOG_D("Guard", "Resource sampler primed; first sample discarded");
        return;
    }

    auto next = std::make_shared<ResourceSnapshot>();
    next->cpuPercent    = *reading.cpuPercent;
    next->memoryPercent = reading.memoryPercent;
    next->diskPercent   = reading.diskPercent;
    next->lastUpdate    = m_clock.now();
    next->valid         = true;
    m_snapshot.store(std::move(next), std::memory_order_release);

    const auto n = m_samples.fetch_add(1) + 1;
    LOG_EVERY_N(DEBUG, 12, "Guard", "Resources: cpu={:.1f}% mem={:.1f}% disk={:.1f}% (sample {})",
                *reading.cpuPercent, reading.memoryPercent, reading.diskPercent, n);
}

ResourceSnapshot ResourceMonitor::snapshot() const {
    return *m_snapshot.load(std::memory_order_acquire);
}

bool ResourceMonitor::exceeds(const ResourceSnapshot& s, const ResourceThresholds& t) {
    if (!s.valid) return false;
    return s.cpuPercent > t.cpuPercent
        || s.memoryPercent > t.memoryPercent
        || s.diskPercent > t.diskPercent;
}

bool ResourceMonitor::isUnderSeverePressure(const ResourceThresholds& thresholds) const {
    return exceeds(snapshot(), thresholds);
}

bool ResourceMonitor::isStale() const {
    const auto s = snapshot();
    if (!s.valid) return true;
    return m_clock.now() - s.lastUpdate > 2 * m_config.sampleInterval;
}

} // namespace Rampart
