/*
Rampart — StatusJson
Role: nlohmann::json renderings of every component's status() for rampartd's periodic report.
Inputs/Outputs: Status structs in; JSON objects out. Durations are *_ms integers, times are epoch ms.
Threading: Pure functions.
Related: RampartRuntime.hpp.
*/
#pragma once

#include "runtime/RampartRuntime.hpp"
#include <nlohmann/json.hpp>

namespace Rampart {

nlohmann::json toJson(const ResourceSnapshot& s);
nlohmann::json toJson(const LatencySummary& l);
nlohmann::json toJson(const CircuitBreakerStats& s);
nlohmann::json toJson(const BackpressureStats& s);
nlohmann::json toJson(const StreamManagerStatus& s);
nlohmann::json toJson(const ExchangeStatus& s);
nlohmann::json toJson(const MarketDataStatus& s);
nlohmann::json toJson(const RuntimeStatus& s);

} // namespace Rampart
