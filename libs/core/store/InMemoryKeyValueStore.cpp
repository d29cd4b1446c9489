#include "store/InMemoryKeyValueStore.hpp"
#include "RampartErrors.hpp"
#include <mutex>

namespace Rampart {

InMemoryKeyValueStore::InMemoryKeyValueStore(const Clock& clock)
    : m_clock(clock)
{}

std::optional<std::string> InMemoryKeyValueStore::get(const std::string& key) {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end() || it->second.expiresAt <= m_clock.now()) return std::nullopt;
    return it->second.value;
}

void InMemoryKeyValueStore::set(const std::string& key, std::string value, std::chrono::milliseconds ttl) {
    if (ttl.count() <= 0) throw RampartError("store ttl must be positive for key " + key);
    std::unique_lock lock(m_mutex);
    m_entries[key] = Entry{std::move(value), m_clock.now() + ttl};
}

bool InMemoryKeyValueStore::erase(const std::string& key) {
    std::unique_lock lock(m_mutex);
    return m_entries.erase(key) > 0;
}

std::size_t InMemoryKeyValueStore::purgeExpired() {
    std::unique_lock lock(m_mutex);
    const auto now = m_clock.now();
    std::size_t removed = 0;
    for (auto it = m_entries.begin(); it != m_entries.end();) {
        if (it->second.expiresAt <= now) {
            it = m_entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t InMemoryKeyValueStore::size() const {
    std::shared_lock lock(m_mutex);
    return m_entries.size();
}

} // namespace Rampart
