/*
Rampart — EventStreamManager
Role: Runs one consumer loop and one adaptive fallback loop per registered service over the
      stream catalog, publishes events and keeps every stream trimmed by age and length.
Inputs/Outputs: Consumes a StreamBroker; hands entries to ServiceHandlers; publishEvent() appends.
Threading: Each loop is a task in one TaskGroup. Handlers run on the shared BlockingExecutor,
           a batch in parallel, bounded by the service's batch timeout.
Performance: Consumers block in readGroup for at most pollTimeout so cancellation is prompt.
             Resource gating keeps background work off a loaded host.
Integration: Owned by RampartRuntime. MarketDataManager publishes price updates through it; the
             built-in handlers call back into it for cleanup and health events.
Observability: Per-consumer counters and per-stream length/lag in status(); logs every reclaim,
               timed-out batch and broker error.
Related: StreamBroker.hpp, ServiceHandler.hpp, StreamCatalog.hpp, BuiltinHandlers.hpp.
Assumptions: Delivery is at-least-once. A batch is acknowledged only when every handler in it
             returned normally; anything else stays pending and is reclaimed after minIdle.
*/
#pragma once

#include "streams/ServiceHandler.hpp"
#include "streams/StreamBroker.hpp"
#include "streams/StreamCatalog.hpp"
#include "monitor/ResourceMonitor.hpp"
#include "runtime/BlockingExecutor.hpp"
#include "runtime/Clock.hpp"
#include "runtime/TaskGroup.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Rampart {

struct StreamManagerConfig {
    std::chrono::milliseconds pollTimeout{1000};
    std::chrono::milliseconds minIdle{60000};
    std::size_t               claimBatch{100};
    std::chrono::milliseconds reclaimInterval{60000};
    std::chrono::milliseconds cleanupInterval{300000};
    std::chrono::milliseconds backoffDelay{1000};
    std::chrono::milliseconds resourceWaitDelay{1000};
    std::chrono::milliseconds activityWindow{30000};
    std::chrono::milliseconds fallbackTimeout{30000};
    std::chrono::milliseconds criticalStagger{100};
    std::chrono::milliseconds defaultStagger{500};
    std::chrono::milliseconds minFallbackCritical{1000};
    std::chrono::milliseconds minFallbackImportant{30000};
    std::chrono::milliseconds minFallbackBackground{300000};
    std::chrono::milliseconds maxFallbackInterval{3600000};
    std::chrono::milliseconds shutdownGrace{5000};
    std::string               consumerPrefix{"rampart"};

    std::vector<EventStreamConfig>     streams  = StreamCatalog::defaultStreams();
    std::vector<ServiceConsumerConfig> services = StreamCatalog::defaultServices();

    void validate() const;
    [[nodiscard]] const EventStreamConfig* findStream(const std::string& name) const;
    [[nodiscard]] std::chrono::milliseconds minFallbackFor(ServicePriority p) const;
};

enum class ConsumerState { Starting, RecoveringPending, Consuming, BackingOff, Stopped };

const char* toString(ConsumerState s);

struct ConsumerStats {
    std::string               service;
    std::string               stream;
    std::string               group;
    std::string               consumer;
    ServicePriority           priority{ServicePriority::Important};
    ConsumerState             state{ConsumerState::Starting};
    std::uint64_t             processed{0};
    std::uint64_t             acknowledged{0};
    std::uint64_t             failedBatches{0};
    std::uint64_t             timedOutBatches{0};
    std::uint64_t             reclaimed{0};
    std::uint64_t             fallbackRuns{0};
    std::uint64_t             gatedPolls{0};
    std::chrono::milliseconds lastFallbackInterval{0};
};

struct StreamStatus {
    std::string name;
    bool        available{false};
    StreamInfo  info;
    std::string error;
};

struct StreamManagerStatus {
    bool                       running{false};
    std::vector<ConsumerStats> consumers;
    std::vector<StreamStatus>  streams;
    std::vector<std::string>   skippedServices;
    std::uint64_t              published{0};
    std::uint64_t              publishFailures{0};
    std::uint64_t              trimmedByAge{0};
    std::uint64_t              trimmedByLength{0};
};

struct CleanupResult {
    std::size_t trimmedByAge{0};
    std::size_t trimmedByLength{0};
};

class EventStreamManager {
public:
    EventStreamManager(StreamManagerConfig config,
                       std::shared_ptr<StreamBroker> broker,
                       BlockingExecutor& executor,
                       const ResourceMonitor* resources = nullptr,
                       const Clock& clock = SystemClock::instance());
    ~EventStreamManager();

    // Non-copyable, non-movable (manages tasks)
    EventStreamManager(const EventStreamManager&) = delete;
    EventStreamManager& operator=(const EventStreamManager&) = delete;
    EventStreamManager(EventStreamManager&&) = delete;
    EventStreamManager& operator=(EventStreamManager&&) = delete;

    // Must be called before start(); the service must be in the configured service table.
    void registerHandler(const std::string& service, std::shared_ptr<ServiceHandler> handler);
    [[nodiscard]] bool hasHandler(const std::string& service) const;

    void start();
    void stop();

    // Appends an event to the stream for its type (or the override) with event_type and
    // timestamp fields added. Broker failures are logged and reported as nullopt.
    std::optional<StreamEntryId> publishEvent(EventType type, StreamFields data,
                                              const std::optional<std::string>& streamOverride = std::nullopt);

    // Trims every catalog stream to its retention window, then to its max length.
    CleanupResult runCleanupPass();

    // Fallback sleep for a service: base scaled by priority, memory and CPU pressure, clamped to
    // [minFallbackFor(priority), maxFallbackInterval].
    [[nodiscard]] std::chrono::milliseconds adaptiveInterval(std::chrono::milliseconds base,
                                                             ServicePriority priority,
                                                             const ResourceSnapshot& snapshot) const;

    // True when the stream has had no append within activityWindow, is empty, or is unreadable.
    [[nodiscard]] bool shouldRunFallback(const std::string& stream) const;

    static bool canProcess(ServicePriority priority, const ResourceSnapshot& snapshot);

    [[nodiscard]] StreamManagerStatus status() const;
    [[nodiscard]] bool isRunning() const noexcept { return m_running.load(); }
    [[nodiscard]] const StreamManagerConfig& config() const noexcept { return m_config; }
    [[nodiscard]] StreamBroker& broker() noexcept { return *m_broker; }

private:
    struct Consumer {
        ServiceConsumerConfig           config;
        std::string                     group;
        std::string                     name;
        std::shared_ptr<ServiceHandler> handler;

        std::atomic<ConsumerState>      state{ConsumerState::Starting};
        std::atomic<std::uint64_t>      processed{0};
        std::atomic<std::uint64_t>      acknowledged{0};
        std::atomic<std::uint64_t>      failedBatches{0};
        std::atomic<std::uint64_t>      timedOutBatches{0};
        std::atomic<std::uint64_t>      reclaimed{0};
        std::atomic<std::uint64_t>      fallbackRuns{0};
        std::atomic<std::uint64_t>      gatedPolls{0};
        std::atomic<std::int64_t>       lastFallbackIntervalMs{0};
    };

    void runConsumer(Consumer& c, std::chrono::milliseconds startDelay, CancellationToken& token);
    void runFallback(Consumer& c, std::chrono::milliseconds startDelay, CancellationToken& token);
    void runCleanup(CancellationToken& token);

    void reclaimPending(Consumer& c, const CancellationToken& token);
    void processBatch(Consumer& c, const std::vector<StreamEntry>& entries);
    [[nodiscard]] ResourceSnapshot resourceSnapshot() const;

    StreamManagerConfig                             m_config;
    std::shared_ptr<StreamBroker>                   m_broker;
    BlockingExecutor&                               m_executor;
    const ResourceMonitor*                          m_resources;
    const Clock&                                    m_clock;

    std::map<std::string, std::shared_ptr<ServiceHandler>> m_handlers;

    mutable std::mutex                              m_consumersMutex;
    std::vector<std::unique_ptr<Consumer>>          m_consumers;
    std::vector<std::string>                        m_skipped;

    std::atomic<std::uint64_t>                      m_published{0};
    std::atomic<std::uint64_t>                      m_publishFailures{0};
    std::atomic<std::uint64_t>                      m_trimmedByAge{0};
    std::atomic<std::uint64_t>                      m_trimmedByLength{0};

    std::atomic<bool>                               m_running{false};
    std::unique_ptr<TaskGroup>                      m_tasks;
};

} // namespace Rampart
