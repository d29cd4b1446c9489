#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

namespace Rampart {

// Wall-clock source. Components take a Clock& so tests can freeze time.
class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;
    using duration   = std::chrono::system_clock::duration;

    virtual ~Clock() = default;
    [[nodiscard]] virtual time_point now() const = 0;

    [[nodiscard]] std::int64_t nowMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now().time_since_epoch()).count();
    }
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override { return std::chrono::system_clock::now(); }

    static SystemClock& instance() {
        static SystemClock clock;
        return clock;
    }
};

// Frozen clock that only moves when told to.
class ManualClock final : public Clock {
public:
    explicit ManualClock(time_point start = std::chrono::system_clock::now())
        : m_ticks(start.time_since_epoch().count()) {}

    [[nodiscard]] time_point now() const override {
        return time_point(duration(m_ticks.load(std::memory_order_acquire)));
    }

    void set(time_point tp) { m_ticks.store(tp.time_since_epoch().count(), std::memory_order_release); }

    template <class Rep, class Period>
    void advance(std::chrono::duration<Rep, Period> d) {
        m_ticks.fetch_add(std::chrono::duration_cast<duration>(d).count(), std::memory_order_acq_rel);
    }

private:
    std::atomic<duration::rep> m_ticks;
};

} // namespace Rampart
