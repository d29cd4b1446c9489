/*
Rampart — BlockingExecutor
Role: Runs blocking work (external calls, stream handlers) on a shared pool and waits with a deadline.
Inputs/Outputs: runWithDeadline(fn, timeout) returns fn's result or throws CallTimeoutError;
                runAllWithDeadline(batch, timeout) reports how a parallel batch finished.
Threading: boost::asio::thread_pool; callers block on std::future::wait_for.
Performance: One post + one future per call. Work that misses its deadline keeps running on the
             pool and its result is discarded, so callables must own their state.
Integration: Shared by CircuitBreaker and EventStreamManager through RampartRuntime.
Observability: Counts abandoned (timed-out) tasks.
Related: BlockingExecutor.cpp, CircuitBreaker.hpp, EventStreamManager.hpp.
*/
#pragma once

#include "RampartErrors.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace Rampart {

class BlockingExecutor {
public:
    struct BatchOutcome {
        std::size_t completed{0};
        std::size_t failed{0};
        bool        timedOut{false};
        std::vector<std::exception_ptr> errors;

        [[nodiscard]] bool allSucceeded() const noexcept { return !timedOut && failed == 0; }
    };

    explicit BlockingExecutor(std::size_t threads);
    ~BlockingExecutor();

    BlockingExecutor(const BlockingExecutor&) = delete;
    BlockingExecutor& operator=(const BlockingExecutor&) = delete;

    template <class F>
    auto runWithDeadline(F&& fn, std::chrono::milliseconds timeout, const std::string& what)
        -> std::invoke_result_t<std::decay_t<F>&>
    {
        using R = std::invoke_result_t<std::decay_t<F>&>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        boost::asio::post(m_pool, [task]{ (*task)(); });

        if (future.wait_for(timeout) == std::future_status::timeout) {
            m_abandoned.fetch_add(1, std::memory_order_relaxed);
            throw CallTimeoutError(what, timeout);
        }
        return future.get();
    }

    // Runs every job in parallel and waits for all of them until the shared deadline.
    BatchOutcome runAllWithDeadline(std::vector<std::function<void()>> jobs,
                                    std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t threads() const noexcept { return m_threads; }
    [[nodiscard]] std::uint64_t abandoned() const noexcept { return m_abandoned.load(std::memory_order_relaxed); }

    void shutdown();

private:
    const std::size_t          m_threads;
    boost::asio::thread_pool   m_pool;
    std::atomic<std::uint64_t> m_abandoned{0};
    std::atomic<bool>          m_joined{false};
};

} // namespace Rampart
