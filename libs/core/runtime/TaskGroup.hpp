/*
Rampart — TaskGroup
Role: Structured supervisor for a component's long-running loops.
Inputs/Outputs: spawn(name, body) starts a thread; shutdown(grace) cancels and joins all of them.
Threading: One std::thread per task. Each body receives a CancellationToken whose sleepFor()
           wakes immediately when the group is cancelled.
Performance: Intended for a handful of supervisory loops per component, not per-request work.
Integration: Owned by ResourceMonitor, CircuitBreakerRegistry, EventStreamManager, MarketDataManager.
Observability: Logs task start/exit, uncaught exceptions and tasks that overrun the grace period.
Related: TaskGroup.cpp, BlockingExecutor.hpp.
Assumptions: Task bodies poll the token or sleep through it; blocking calls inside carry their own
             timeouts so a join after cancellation is bounded. A task may call shutdown() on its
             own group; its thread is then joined by the destructor, so the group must not be
             destroyed from inside one of its tasks.
*/
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Rampart {

class CancellationToken {
public:
    [[nodiscard]] bool cancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

    void cancel();

    // Sleeps for d or until cancelled. Returns false if cancelled.
    template <class Rep, class Period>
    bool sleepFor(std::chrono::duration<Rep, Period> d) {
        std::unique_lock lock(m_mutex);
        return !m_cv.wait_for(lock, d, [this]{ return cancelled(); });
    }

private:
    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool>       m_cancelled{false};
};

class TaskGroup {
public:
    using Body = std::function<void(CancellationToken&)>;

    struct TaskInfo {
        std::string name;
        bool        finished{false};
    };

    explicit TaskGroup(std::string name);
    ~TaskGroup();

    // Non-copyable, non-movable (manages threads)
    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
    TaskGroup(TaskGroup&&) = delete;
    TaskGroup& operator=(TaskGroup&&) = delete;

    void spawn(std::string taskName, Body body);

    // Cancels every task, waits up to grace for them to exit, then joins. Called from a task, it
    // joins the others and leaves the caller's own thread to the destructor.
    void shutdown(std::chrono::milliseconds grace = std::chrono::seconds(5));

    [[nodiscard]] bool cancelled() const noexcept { return m_token.cancelled(); }
    [[nodiscard]] std::size_t running() const;
    [[nodiscard]] std::vector<TaskInfo> tasks() const;
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

private:
    struct Task {
        std::string name;
        std::thread thread;
        bool        finished{false};
    };

    void markFinished(Task& task);

    const std::string       m_name;
    CancellationToken       m_token;
    mutable std::mutex      m_mutex;
    std::condition_variable m_finishedCv;
    std::list<Task>         m_tasks;   // stable addresses for the running threads
    bool                    m_shutDown{false};
    std::thread             m_deferredJoin;   // task that called shutdown() on its own group
};

} // namespace Rampart
