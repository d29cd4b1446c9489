/*
Rampart — InMemoryStreamBroker
Role: In-process StreamBroker with full consumer-group semantics.
Inputs/Outputs: Same primitives as StreamBroker; entries, groups and pending lists live in memory.
Threading: One mutex for all streams; readGroup waits on a condition variable for appends.
Performance: Entries in ordered maps keyed by id, so trims and range scans are O(log n + k).
Integration: Default broker for RampartRuntime and the broker used in tests.
Observability: None internally; EventStreamManager logs around every call.
Related: StreamBroker.hpp, EventStreamManager.hpp.
Assumptions: Groups created by ensureGroup start at id 0, so entries appended before a consumer
             exists are still delivered.
*/
#pragma once

#include "streams/StreamBroker.hpp"
#include "runtime/Clock.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <unordered_map>

namespace Rampart {

class InMemoryStreamBroker : public StreamBroker {
public:
    explicit InMemoryStreamBroker(const Clock& clock = SystemClock::instance());

    StreamEntryId append(const std::string& stream, const StreamFields& fields, std::size_t maxLength) override;
    void ensureGroup(const std::string& stream, const std::string& group) override;
    std::vector<StreamEntry> readGroup(const std::string& stream, const std::string& group,
                                       const std::string& consumer, std::size_t count,
                                       std::chrono::milliseconds block) override;
    std::size_t acknowledge(const std::string& stream, const std::string& group,
                            const std::vector<StreamEntryId>& ids) override;
    ClaimResult claimIdle(const std::string& stream, const std::string& group,
                          const std::string& consumer, std::chrono::milliseconds minIdle,
                          StreamEntryId start, std::size_t count) override;
    std::size_t trimByMinId(const std::string& stream, StreamEntryId minId) override;
    std::size_t trimByMaxLength(const std::string& stream, std::size_t maxLength) override;
    StreamInfo info(const std::string& stream) override;

    // Pending entries owned by one consumer (test and diagnostics helper).
    [[nodiscard]] std::size_t pendingFor(const std::string& stream, const std::string& group,
                                         const std::string& consumer) const;

private:
    struct PendingEntry {
        std::string       consumer;
        Clock::time_point deliveredAt;
        std::uint32_t     deliveryCount{1};
    };

    struct Group {
        StreamEntryId                         lastDelivered;
        std::map<StreamEntryId, PendingEntry> pending;
    };

    struct Stream {
        std::map<StreamEntryId, StreamFields> entries;
        StreamEntryId                         lastId;
        std::map<std::string, Group>          groups;
    };

    Group& groupOrThrow(const std::string& stream, const std::string& group);
    static std::size_t trimToLength(Stream& s, std::size_t maxLength);

    const Clock&                            m_clock;
    mutable std::mutex                      m_mutex;
    std::condition_variable                 m_appended;
    std::unordered_map<std::string, Stream> m_streams;
};

} // namespace Rampart
