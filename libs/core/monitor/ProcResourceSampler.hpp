#pragma once
#include "monitor/ResourceMonitor.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Rampart {

// Linux sampler: /proc/stat, /proc/meminfo and statvfs().
class ProcResourceSampler : public ResourceSampler {
public:
    struct CpuTimes {
        std::uint64_t busy{0};
        std::uint64_t total{0};
    };

    explicit ProcResourceSampler(std::string procRoot = "/proc", std::string diskPath = "/");

    ResourceReading sample() override;

    // Parsers are static so they can be exercised against canned /proc text.
    static std::optional<CpuTimes> parseCpuTimes(std::string_view procStat);
    static std::optional<double> parseMemoryPercent(std::string_view procMeminfo);
    static double cpuPercentBetween(const CpuTimes& previous, const CpuTimes& current);

private:
    double diskPercent() const;

    const std::string       m_procRoot;
    const std::string       m_diskPath;
    std::optional<CpuTimes> m_previous;
};

} // namespace Rampart
