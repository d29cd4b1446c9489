#include "streams/InMemoryStreamBroker.hpp"
#include "RampartErrors.hpp"
#include <algorithm>

namespace Rampart {

InMemoryStreamBroker::InMemoryStreamBroker(const Clock& clock)
    : m_clock(clock)
{}

StreamEntryId InMemoryStreamBroker::append(const std::string& stream, const StreamFields& fields, std::size_t maxLength) {
    StreamEntryId id;
    {
        std::lock_guard lock(m_mutex);
        auto& s = m_streams[stream];

        const auto ms = static_cast<std::uint64_t>(std::max<std::int64_t>(m_clock.nowMs(), 0));
        if (ms > s.lastId.ms) {
            id = {ms, 0};
        } else {
            id = {s.lastId.ms, s.lastId.seq + 1};   // same millisecond or clock stepped back
        }
        s.entries.emplace(id, fields);
        s.lastId = id;
        if (maxLength > 0) trimToLength(s, maxLength);
    }
    m_appended.notify_all();
    return id;
}

void InMemoryStreamBroker::ensureGroup(const std::string& stream, const std::string& group) {
    std::lock_guard lock(m_mutex);
    auto& s = m_streams[stream];
    s.groups.try_emplace(group);
}

InMemoryStreamBroker::Group& InMemoryStreamBroker::groupOrThrow(const std::string& stream, const std::string& group) {
    auto sit = m_streams.find(stream);
    if (sit == m_streams.end()) throw RampartError("NOGROUP no such stream '" + stream + "'");
    auto git = sit->second.groups.find(group);
    if (git == sit->second.groups.end()) {
        throw RampartError("NOGROUP no such consumer group '" + group + "' on stream '" + stream + "'");
    }
    return git->second;
}

std::vector<StreamEntry> InMemoryStreamBroker::readGroup(const std::string& stream, const std::string& group,
                                                         const std::string& consumer, std::size_t count,
                                                         std::chrono::milliseconds block) {
    std::unique_lock lock(m_mutex);
    Group& g = groupOrThrow(stream, group);

    auto hasNew = [&]{
        const auto& entries = m_streams[stream].entries;
        return entries.upper_bound(g.lastDelivered) != entries.end();
    };
    if (!hasNew() && block.count() > 0) {
        m_appended.wait_for(lock, block, hasNew);
    }

    std::vector<StreamEntry> out;
    auto& entries = m_streams[stream].entries;
    const auto now = m_clock.now();
    for (auto it = entries.upper_bound(g.lastDelivered); it != entries.end() && out.size() < count; ++it) {
        g.pending[it->first] = PendingEntry{consumer, now, 1};
        g.lastDelivered = it->first;
        out.push_back(StreamEntry{it->first, it->second, 1});
    }
    return out;
}

std::size_t InMemoryStreamBroker::acknowledge(const std::string& stream, const std::string& group,
                                              const std::vector<StreamEntryId>& ids) {
    std::lock_guard lock(m_mutex);
    Group& g = groupOrThrow(stream, group);
    std::size_t acked = 0;
    for (const auto& id : ids) acked += g.pending.erase(id);
    return acked;
}

ClaimResult InMemoryStreamBroker::claimIdle(const std::string& stream, const std::string& group,
                                            const std::string& consumer, std::chrono::milliseconds minIdle,
                                            StreamEntryId start, std::size_t count) {
    std::lock_guard lock(m_mutex);
    Group& g = groupOrThrow(stream, group);
    auto& entries = m_streams[stream].entries;
    const auto now = m_clock.now();

    ClaimResult result;
    auto it = g.pending.lower_bound(start);
    while (it != g.pending.end() && result.entries.size() < count) {
        if (now - it->second.deliveredAt < minIdle) {
            ++it;
            continue;
        }
        auto entry = entries.find(it->first);
        if (entry == entries.end()) {
            result.deleted.push_back(it->first);
            it = g.pending.erase(it);
            continue;
        }
        it->second.consumer = consumer;
        it->second.deliveredAt = now;
        it->second.deliveryCount += 1;
        result.entries.push_back(StreamEntry{it->first, entry->second, it->second.deliveryCount});
        ++it;
    }
    result.nextCursor = it == g.pending.end() ? StreamEntryId::zero() : it->first;
    return result;
}

std::size_t InMemoryStreamBroker::trimToLength(Stream& s, std::size_t maxLength) {
    std::size_t removed = 0;
    while (s.entries.size() > maxLength) {
        s.entries.erase(s.entries.begin());
        ++removed;
    }
    return removed;
}

std::size_t InMemoryStreamBroker::trimByMinId(const std::string& stream, StreamEntryId minId) {
    std::lock_guard lock(m_mutex);
    auto sit = m_streams.find(stream);
    if (sit == m_streams.end()) return 0;
    auto& entries = sit->second.entries;
    const auto end = entries.lower_bound(minId);
    const auto removed = static_cast<std::size_t>(std::distance(entries.begin(), end));
    entries.erase(entries.begin(), end);
    return removed;
}

std::size_t InMemoryStreamBroker::trimByMaxLength(const std::string& stream, std::size_t maxLength) {
    std::lock_guard lock(m_mutex);
    auto sit = m_streams.find(stream);
    if (sit == m_streams.end()) return 0;
    return trimToLength(sit->second, maxLength);
}

StreamInfo InMemoryStreamBroker::info(const std::string& stream) {
    std::lock_guard lock(m_mutex);
    auto sit = m_streams.find(stream);
    if (sit == m_streams.end()) throw RampartError("no such stream '" + stream + "'");

    const auto& s = sit->second;
    StreamInfo out;
    out.stream = stream;
    out.length = s.entries.size();
    out.lastGeneratedId = s.lastId;
    if (!s.entries.empty()) out.firstEntryId = s.entries.begin()->first;
    for (const auto& [name, g] : s.groups) {
        GroupInfo gi;
        gi.name = name;
        gi.pending = g.pending.size();
        gi.lastDeliveredId = g.lastDelivered;
        gi.lag = static_cast<std::size_t>(std::distance(s.entries.upper_bound(g.lastDelivered), s.entries.end()));
        out.groups.push_back(std::move(gi));
    }
    return out;
}

std::size_t InMemoryStreamBroker::pendingFor(const std::string& stream, const std::string& group,
                                             const std::string& consumer) const {
    std::lock_guard lock(m_mutex);
    auto sit = m_streams.find(stream);
    if (sit == m_streams.end()) return 0;
    auto git = sit->second.groups.find(group);
    if (git == sit->second.groups.end()) return 0;
    return static_cast<std::size_t>(std::count_if(git->second.pending.begin(), git->second.pending.end(),
                                                  [&](const auto& p){ return p.second.consumer == consumer; }));
}

} // namespace Rampart
