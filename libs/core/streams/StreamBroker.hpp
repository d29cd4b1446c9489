/*
Rampart — StreamBroker
Role: Consumer-group stream substrate used by the event stream manager.
Inputs/Outputs: Seven primitives: append (with max length), readGroup (blocking), acknowledge,
                claimIdle, trimByMinId, trimByMaxLength, info; ensureGroup for setup.
Threading: Implementations must be safe to call from many consumer threads at once.
Integration: InMemoryStreamBroker is the in-process implementation; a networked broker plugs in
             behind the same interface.
Related: InMemoryStreamBroker.hpp, EventStreamManager.hpp.
Assumptions: Entry ids are "<ms>-<seq>", strictly increasing per stream; the ms part is the
             append time, which is what age-based trimming and activity checks rely on.
*/
#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Rampart {

struct StreamEntryId {
    std::uint64_t ms{0};
    std::uint64_t seq{0};

    auto operator<=>(const StreamEntryId&) const = default;

    [[nodiscard]] std::string toString() const;
    [[nodiscard]] bool isZero() const noexcept { return ms == 0 && seq == 0; }

    static std::optional<StreamEntryId> parse(std::string_view s);
    static StreamEntryId zero() { return {}; }
};

using StreamFields = std::map<std::string, std::string>;

struct StreamEntry {
    StreamEntryId id;
    StreamFields  fields;
    std::uint32_t deliveryCount{1};
};

struct ClaimResult {
    StreamEntryId            nextCursor;   // zero when the scan is complete
    std::vector<StreamEntry> entries;
    std::vector<StreamEntryId> deleted;   // pending ids whose entries were trimmed away
};

struct GroupInfo {
    std::string   name;
    std::size_t   pending{0};
    std::size_t   lag{0};              // entries never delivered to the group
    StreamEntryId lastDeliveredId;
};

struct StreamInfo {
    std::string            stream;
    std::size_t            length{0};
    StreamEntryId          firstEntryId;
    StreamEntryId          lastGeneratedId;
    std::vector<GroupInfo> groups;
};

class StreamBroker {
public:
    virtual ~StreamBroker() = default;

    virtual StreamEntryId append(const std::string& stream, const StreamFields& fields, std::size_t maxLength) = 0;

    // Creates the stream (if missing) and the group starting at id 0, so entries already in the
    // stream are delivered to it.
    virtual void ensureGroup(const std::string& stream, const std::string& group) = 0;

    // New entries only (">" semantics). Blocks up to block when nothing is available.
    virtual std::vector<StreamEntry> readGroup(const std::string& stream, const std::string& group,
                                               const std::string& consumer, std::size_t count,
                                               std::chrono::milliseconds block) = 0;

    virtual std::size_t acknowledge(const std::string& stream, const std::string& group,
                                    const std::vector<StreamEntryId>& ids) = 0;

    // Transfers pending entries idle for at least minIdle to consumer, scanning from start.
    virtual ClaimResult claimIdle(const std::string& stream, const std::string& group,
                                  const std::string& consumer, std::chrono::milliseconds minIdle,
                                  StreamEntryId start, std::size_t count) = 0;

    // Removes entries with id < minId.
    virtual std::size_t trimByMinId(const std::string& stream, StreamEntryId minId) = 0;
    virtual std::size_t trimByMaxLength(const std::string& stream, std::size_t maxLength) = 0;

    virtual StreamInfo info(const std::string& stream) = 0;
};

} // namespace Rampart
