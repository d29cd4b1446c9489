#include "monitor/ProcResourceSampler.hpp"
#include "RampartErrors.hpp"
#include <sys/statvfs.h>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

namespace Rampart {

namespace {

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw RampartError("cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

ProcResourceSampler::ProcResourceSampler(std::string procRoot, std::string diskPath)
    : m_procRoot(std::move(procRoot))
    , m_diskPath(std::move(diskPath))
{}

std::optional<ProcResourceSampler::CpuTimes> ProcResourceSampler::parseCpuTimes(std::string_view procStat) {
    // First line: "cpu  user nice system idle iowait irq softirq steal ..."
    const auto eol = procStat.find('\n');
    std::istringstream line(std::string(procStat.substr(0, eol)));
    std::string label;
    line >> label;
    if (label != "cpu") return std::nullopt;

    std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
    line >> user >> nice >> system >> idle;
    if (!line) return std::nullopt;
    line >> iowait >> irq >> softirq >> steal;   // absent on very old kernels

    CpuTimes t;
    t.busy  = user + nice + system + irq + softirq + steal;
    t.total = t.busy + idle + iowait;
    return t;
}

std::optional<double> ProcResourceSampler::parseMemoryPercent(std::string_view procMeminfo) {
    std::istringstream in{std::string(procMeminfo)};
    std::string key;
    std::uint64_t value = 0;
    std::string unit;
    std::optional<std::uint64_t> total, available, free, buffers, cached;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ls(line);
        if (!(ls >> key >> value)) continue;
        ls >> unit;
        if (key == "MemTotal:")          total = value;
        else if (key == "MemAvailable:") available = value;
        else if (key == "MemFree:")      free = value;
        else if (key == "Buffers:")      buffers = value;
        else if (key == "Cached:")       cached = value;
    }

    if (!total || *total == 0) return std::nullopt;
    std::uint64_t avail = 0;
    if (available) {
        avail = *available;
    } else if (free) {
        avail = *free + buffers.value_or(0) + cached.value_or(0);
    } else {
        return std::nullopt;
    }
    if (avail > *total) avail = *total;
    return 100.0 * static_cast<double>(*total - avail) / static_cast<double>(*total);
}

double ProcResourceSampler::cpuPercentBetween(const CpuTimes& previous, const CpuTimes& current) {
    if (current.total <= previous.total || current.busy < previous.busy) return 0.0;
    const double dTotal = static_cast<double>(current.total - previous.total);
    const double dBusy  = static_cast<double>(current.busy - previous.busy);
    return 100.0 * dBusy / dTotal;
}

double ProcResourceSampler::diskPercent() const {
    struct statvfs vfs{};
    if (::statvfs(m_diskPath.c_str(), &vfs) != 0) {
        throw std::system_error(errno, std::generic_category(), "statvfs(" + m_diskPath + ")");
    }
    const double frsize = static_cast<double>(vfs.f_frsize);
    const double used   = static_cast<double>(vfs.f_blocks - vfs.f_bfree) * frsize;
    const double avail  = static_cast<double>(vfs.f_bavail) * frsize;
    if (used + avail <= 0.0) return 0.0;
    return 100.0 * used / (used + avail);
}

ResourceReading ProcResourceSampler::sample() {
    ResourceReading r;

    const auto cpu = parseCpuTimes(readFile(m_procRoot + "/stat"));
    if (!cpu) throw DataIntegrityError("unrecognized " + m_procRoot + "/stat format");
    if (m_previous) {
        r.cpuPercent = cpuPercentBetween(*m_previous, *cpu);
    }
    m_previous = cpu;

    const auto mem = parseMemoryPercent(readFile(m_procRoot + "/meminfo"));
    if (!mem) throw DataIntegrityError("unrecognized " + m_procRoot + "/meminfo format");
    r.memoryPercent = *mem;

    r.diskPercent = diskPercent();
    return r;
}

} // namespace Rampart
