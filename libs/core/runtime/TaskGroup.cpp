#include "TaskGroup.hpp"
#include "RampartLogging.hpp"
#include <algorithm>

namespace Rampart {

void CancellationToken::cancel() {
    {
        std::lock_guard lock(m_mutex);
        m_cancelled.store(true, std::memory_order_release);
    }
    m_cv.notify_all();
}

TaskGroup::TaskGroup(std::string name)
    : m_name(std::move(name))
{}

TaskGroup::~TaskGroup() {
    shutdown();

    std::thread self;
    {
        std::lock_guard lock(m_mutex);
        self = std::move(m_deferredJoin);
    }
    if (!self.joinable()) return;
    if (self.get_id() == std::this_thread::get_id()) {
        LOG_E("App", "TaskGroup {}: destroyed from inside its own task, detaching it", m_name);
        self.detach();
        return;
    }
    self.join();
}

void TaskGroup::spawn(std::string taskName, Body body) {
    std::lock_guard lock(m_mutex);
    if (m_shutDown || m_token.cancelled()) {
        LOG_W("App", "TaskGroup {}: refusing to spawn '{}' after shutdown", m_name, taskName);
        return;
    }

    Task& task = m_tasks.emplace_back();
    task.name = std::move(taskName);
    task.thread = std::thread([this, &task, body = std::move(body)]() mutable {
        LOG_D("App", "TaskGroup {}: task '{}' started", m_name, task.name);
        try {
            body(m_token);
        } catch (const std::exception& e) {
            LOG_E("App", "TaskGroup {}: task '{}' terminated with exception: {}", m_name, task.name, e.what());
        }
        markFinished(task);
    });
}

void TaskGroup::markFinished(Task& task) {
    {
        std::lock_guard lock(m_mutex);
        task.finished = true;
        LOG_D("App", "TaskGroup {}: task '{}' exited", m_name, task.name);
    }
    m_finishedCv.notify_all();
}

void TaskGroup::shutdown(std::chrono::milliseconds grace) {
    m_token.cancel();

    const auto self = std::this_thread::get_id();
    std::vector<std::thread> toJoin;
    {
        std::unique_lock lock(m_mutex);
        if (m_shutDown) return;
        m_shutDown = true;

        // A task shutting down its own group never finishes inside this wait.
        const bool allDone = m_finishedCv.wait_for(lock, grace, [this, self]{
            return std::all_of(m_tasks.begin(), m_tasks.end(), [self](const Task& t){
                return t.finished || t.thread.get_id() == self;
            });
        });
        if (!allDone) {
            for (const auto& t : m_tasks) {
                if (!t.finished && t.thread.get_id() != self) {
                    LOG_E("App", "TaskGroup {}: task '{}' did not stop within {}ms, joining",
                          m_name, t.name, grace.count());
                }
            }
        }
        for (auto& t : m_tasks) {
            if (!t.thread.joinable()) continue;
            if (t.thread.get_id() == self) {
                m_deferredJoin = std::move(t.thread);   // joined by the destructor
            } else {
                toJoin.emplace_back(std::move(t.thread));
            }
        }
    }

    for (auto& th : toJoin) th.join();
}

std::size_t TaskGroup::running() const {
    std::lock_guard lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(m_tasks.begin(), m_tasks.end(),
                                                  [](const Task& t){ return !t.finished; }));
}

std::vector<TaskGroup::TaskInfo> TaskGroup::tasks() const {
    std::lock_guard lock(m_mutex);
    std::vector<TaskInfo> out;
    out.reserve(m_tasks.size());
    for (const auto& t : m_tasks) out.push_back({t.name, t.finished});
    return out;
}

} // namespace Rampart
