#pragma once
#include "store/KeyValueStore.hpp"
#include "runtime/Clock.hpp"
#include <shared_mutex>
#include <unordered_map>

namespace Rampart {

// Process-local store with lazy TTL expiry.
class InMemoryKeyValueStore : public KeyValueStore {
public:
    explicit InMemoryKeyValueStore(const Clock& clock = SystemClock::instance());

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, std::string value, std::chrono::milliseconds ttl) override;
    bool erase(const std::string& key) override;

    // Drops every expired key. Returns how many were removed.
    std::size_t purgeExpired();
    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        std::string       value;
        Clock::time_point expiresAt;
    };

    const Clock&                           m_clock;
    mutable std::shared_mutex              m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
};

} // namespace Rampart
