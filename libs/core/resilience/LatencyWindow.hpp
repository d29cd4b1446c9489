#pragma once
// ─────────────────────────────────────────────────────────────
// LatencyWindow – fixed-size ring of recent samples + percentiles.
// ─────────────────────────────────────────────────────────────
#include <algorithm>
#include <cstddef>
#include <numeric>
#include <vector>

namespace Rampart {

template <typename T, std::size_t MaxN>
class RingBuffer {
public:
    void push_back(T val) {
        if (m_data.size() == MaxN) {
            m_data[m_head] = std::move(val);
        } else {
            m_data.emplace_back(std::move(val));
        }
        m_head = (m_head + 1) % MaxN;
    }

    [[nodiscard]] std::vector<T> snapshot() const {
        return m_data;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return m_data.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return m_data.empty();
    }

private:
    std::vector<T> m_data;
    std::size_t    m_head{0};
};

struct LatencySummary {
    double p50Ms{0.0};
    double p95Ms{0.0};
    double p99Ms{0.0};
    double avgMs{0.0};
    double maxMs{0.0};
    std::size_t samples{0};
};

// Not thread-safe; owners guard it with their own mutex.
class LatencyWindow {
public:
    void record(double ms) { m_samples.push_back(ms); }

    [[nodiscard]] LatencySummary summary() const {
        LatencySummary out;
        auto v = m_samples.snapshot();
        if (v.empty()) return out;
        std::sort(v.begin(), v.end());
        auto at = [&](double q) {
            const auto idx = static_cast<std::size_t>(q * static_cast<double>(v.size() - 1));
            return v[idx];
        };
        out.p50Ms   = at(0.50);
        out.p95Ms   = at(0.95);
        out.p99Ms   = at(0.99);
        out.avgMs   = std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
        out.maxMs   = v.back();
        out.samples = v.size();
        return out;
    }

private:
    RingBuffer<double, 1000> m_samples;
};

} // namespace Rampart
