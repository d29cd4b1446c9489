/*
Rampart — BackpressureManager
Role: Priority-tiered admission control bounding in-flight work and queue depth.
Inputs/Outputs: acquire(priority, timeout) returns a Permit or throws BackpressureError;
                execute(fn, priority, timeout) wraps acquire + a deadline-bound call.
Threading: Admission decisions and queues sit behind one mutex; the active counter is atomic so
           stats readers never take the lock. Each waiter parks on its own condition variable.
Performance: O(1) admission; a release hands its slot directly to one waiter.
Integration: Reads ResourceMonitor snapshots; used by GuardedCaller.
Observability: Logs rejections, critical bypasses and queue timeouts; stats() has queue depths
               and wait-time percentiles.
Related: BackpressureManager.cpp, ResourceMonitor.hpp, GuardedCaller.hpp.
Assumptions: Only CRITICAL work may push the active count above maxConcurrent. A permit taken for
             executor work is held by that work, so abandoned calls keep counting until they end.
*/
#pragma once

#include "RampartErrors.hpp"
#include "monitor/ResourceMonitor.hpp"
#include "resilience/LatencyWindow.hpp"
#include "runtime/BlockingExecutor.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace Rampart {

enum class Priority { Critical = 0, High = 1, Medium = 2, Low = 3 };

inline constexpr std::size_t kPriorityCount = 4;

const char* toString(Priority p);
std::optional<Priority> priorityFromString(std::string_view s);

struct BackpressureConfig {
    int                                     maxConcurrent{50};
    std::array<std::size_t, kPriorityCount> queueCapacity{200, 150, 100, 50};
    ResourceThresholds                      severe{85.0, 80.0, 90.0};
    std::chrono::milliseconds               defaultTimeout{30000};
    std::chrono::milliseconds               rejectRetryAfter{5000};

    void validate() const;
};

struct BackpressureStats {
    int                                     active{0};
    int                                     maxConcurrent{0};
    std::array<std::size_t, kPriorityCount> queueLengths{};
    std::uint64_t                           admitted{0};
    std::uint64_t                           queued{0};
    std::uint64_t                           rejected{0};
    std::uint64_t                           queueTimeouts{0};
    std::uint64_t                           completed{0};
    std::uint64_t                           criticalBypasses{0};
    std::uint64_t                           pressureEvents{0};
    bool                                    underPressure{false};
    LatencySummary                          queueWait;
};

class BackpressureManager {
public:
    // Holds one concurrency slot; releasing it wakes the next eligible waiter.
    class Permit {
    public:
        Permit() = default;
        Permit(BackpressureManager* owner, Priority priority) : m_owner(owner), m_priority(priority) {}
        ~Permit() { release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept : m_owner(other.m_owner), m_priority(other.m_priority) { other.m_owner = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                m_owner = other.m_owner;
                m_priority = other.m_priority;
                other.m_owner = nullptr;
            }
            return *this;
        }

        void release();
        [[nodiscard]] bool held() const noexcept { return m_owner != nullptr; }
        [[nodiscard]] Priority priority() const noexcept { return m_priority; }

    private:
        BackpressureManager* m_owner{nullptr};
        Priority             m_priority{Priority::Medium};
    };

    BackpressureManager(BackpressureConfig config,
                        const ResourceMonitor& monitor,
                        BlockingExecutor& executor);

    BackpressureManager(const BackpressureManager&) = delete;
    BackpressureManager& operator=(const BackpressureManager&) = delete;

    [[nodiscard]] Permit acquire(Priority priority, std::chrono::milliseconds timeout);
    [[nodiscard]] Permit acquire(Priority priority) { return acquire(priority, m_config.defaultTimeout); }

    // The slot stays taken until fn returns, even after the caller gave up with CallTimeoutError.
    template <class F>
    auto execute(F&& fn, Priority priority, std::chrono::milliseconds timeout) {
        return m_executor.runWithDeadline(holding(acquire(priority, timeout), std::forward<F>(fn)), timeout,
                                          std::string("backpressure[") + toString(priority) + "]");
    }

    template <class F>
    auto execute(F&& fn, Priority priority) {
        return execute(std::forward<F>(fn), priority, m_config.defaultTimeout);
    }

    // Binds a permit to the work it admitted: the returned callable releases it when fn finishes,
    // or when the callable is destroyed without running.
    template <class F>
    static auto holding(Permit permit, F&& fn) {
        auto slot = std::make_shared<Permit>(std::move(permit));
        return [slot, fn = std::forward<F>(fn)]() mutable -> std::invoke_result_t<std::decay_t<F>&> {
            Permit held = std::move(*slot);
            return fn();
        };
    }

    [[nodiscard]] int active() const noexcept { return m_active.load(std::memory_order_acquire); }
    [[nodiscard]] BackpressureStats stats() const;
    [[nodiscard]] const BackpressureConfig& config() const noexcept { return m_config; }

private:
    struct Waiter {
        Priority                priority;
        bool                    granted{false};
        std::condition_variable cv;
    };

    void release(Priority completed);
    Waiter* nextWaiter(Priority completed);   // m_mutex held

    static std::size_t index(Priority p) { return static_cast<std::size_t>(p); }

    const BackpressureConfig m_config;
    const ResourceMonitor&   m_monitor;
    BlockingExecutor&        m_executor;

    mutable std::mutex                                m_mutex;
    std::condition_variable                           m_queueSpaceCv;
    std::array<std::deque<Waiter*>, kPriorityCount>   m_queues;
    std::atomic<int>                                  m_active{0};
    LatencyWindow                                     m_queueWait;

    std::atomic<std::uint64_t> m_admitted{0};
    std::atomic<std::uint64_t> m_queued{0};
    std::atomic<std::uint64_t> m_rejected{0};
    std::atomic<std::uint64_t> m_queueTimeouts{0};
    std::atomic<std::uint64_t> m_completed{0};
    std::atomic<std::uint64_t> m_bypasses{0};
    std::atomic<std::uint64_t> m_pressureEvents{0};
};

} // namespace Rampart
