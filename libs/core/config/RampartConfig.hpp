/*
Rampart — RampartConfig
Role: One typed, validated configuration tree for every component.
Inputs/Outputs: Built from defaults and overridden by ConfigLoader; validate() throws ConfigError.
Threading: Plain value; copied into components at construction.
Integration: RampartRuntime takes it whole and hands each component its own section.
Related: ConfigLoader.hpp, RampartRuntime.hpp.
*/
#pragma once

#include "marketdata/MarketDataManager.hpp"
#include "marketdata/rest/CoinGeckoPriceClient.hpp"
#include "monitor/ResourceMonitor.hpp"
#include "resilience/BackpressureManager.hpp"
#include "resilience/CircuitBreakerRegistry.hpp"
#include "streams/EventStreamManager.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace Rampart {

struct RuntimeConfig {
    std::size_t               executorThreads{16};
    std::chrono::milliseconds shutdownGrace{5000};
    std::chrono::milliseconds statusInterval{60000};   // rampartd status log cadence
    std::string               logLevel{"info"};

    void validate() const;
};

struct RampartConfig {
    RuntimeConfig                runtime;
    ResourceMonitorConfig        resources;
    CircuitBreakerRegistryConfig breakers;

    bool                         enableBackpressure{true};
    BackpressureConfig           backpressure;

    bool                         enableStreams{true};
    StreamManagerConfig          streams;
    ResourceThresholds           healthAlert{85.0, 85.0, 90.0};

    bool                         enableMarketData{true};
    MarketDataConfig             marketData;
    CoinGeckoConfig              rest;

    void validate() const;
};

} // namespace Rampart
