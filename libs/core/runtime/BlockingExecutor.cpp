#include "runtime/BlockingExecutor.hpp"
#include "RampartLogging.hpp"

namespace Rampart {

BlockingExecutor::BlockingExecutor(std::size_t threads)
    : m_threads(threads == 0 ? 1 : threads)
    , m_pool(m_threads)
{
    rLog_App("BlockingExecutor started with {} threads", m_threads);
}

BlockingExecutor::~BlockingExecutor() {
    shutdown();
}

void BlockingExecutor::shutdown() {
    if (m_joined.exchange(true)) return;
    m_pool.stop();
    m_pool.join();
    const auto abandoned = m_abandoned.load();
    if (abandoned > 0) {
        LOG_W("App", "BlockingExecutor stopped; {} tasks had missed their deadline", abandoned);
    }
}

BlockingExecutor::BatchOutcome BlockingExecutor::runAllWithDeadline(std::vector<std::function<void()>> jobs,
                                                                    std::chrono::milliseconds timeout) {
    BatchOutcome outcome;
    std::vector<std::future<void>> futures;
    futures.reserve(jobs.size());

    for (auto& job : jobs) {
        auto task = std::make_shared<std::packaged_task<void()>>(std::move(job));
        futures.push_back(task->get_future());
        boost::asio::post(m_pool, [task]{ (*task)(); });
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (auto& f : futures) {
        if (f.wait_until(deadline) == std::future_status::timeout) {
            outcome.timedOut = true;
            break;
        }
    }

    if (outcome.timedOut) {
        for (auto& f : futures) {
            if (f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                m_abandoned.fetch_add(1, std::memory_order_relaxed);
            }
        }
        return outcome;
    }

    for (auto& f : futures) {
        try {
            f.get();
            ++outcome.completed;
        } catch (...) {
            ++outcome.failed;
            outcome.errors.push_back(std::current_exception());
        }
    }
    return outcome;
}

} // namespace Rampart
