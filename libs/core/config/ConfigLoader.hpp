/*
Rampart — ConfigLoader
Role: Reads a JSON document into RampartConfig; absent keys keep their defaults.
Inputs/Outputs: File path or parsed JSON in; RampartConfig out. Every type mismatch or unknown
                enum value throws ConfigError naming the key. Range checks are left to each
                section's validate() so RampartRuntime can disable one subsystem and keep the rest.
Threading: Stateless; called once at startup.
Integration: rampartd resolves the path from argv or RAMPART_CONFIG and passes the result to
             RampartRuntime. Named sections merge into the built-in tables: a breaker profile,
             stream, service or exchange with a known name overrides that entry, a new name adds one.
Related: RampartConfig.hpp.
*/
#pragma once

#include "config/RampartConfig.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Rampart {

class ConfigLoader {
public:
    static RampartConfig loadFile(const std::string& path);
    static RampartConfig fromString(const std::string& text);
    static RampartConfig fromJson(const nlohmann::json& root);

    // --config <path>, a single positional argument, or RAMPART_CONFIG; nullopt means built-in defaults.
    static std::optional<std::string> resolvePath(int argc, const char* const* argv);
};

} // namespace Rampart
