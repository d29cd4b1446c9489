#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace Rampart {

// Shared key/value cache used for cross-instance state (breaker snapshots, latest prices).
// Components hold a nullable pointer: without a store they run in-memory only.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, std::string value, std::chrono::milliseconds ttl) = 0;
    virtual bool erase(const std::string& key) = 0;
};

} // namespace Rampart
