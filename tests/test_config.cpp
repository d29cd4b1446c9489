/*
Rampart — Configuration Tests
Role: Verify JSON overrides land in the right sections and bad documents are rejected by key
Testing Strategy: Inline JSON documents through ConfigLoader; the shipped example file is loaded as-is
Coverage: Defaults, section overrides, named-table merging, type errors, path resolution,
          whole-tree validation
*/
#include <gtest/gtest.h>
#include "config/ConfigLoader.hpp"
#include "RampartErrors.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

using namespace Rampart;
using namespace std::chrono_literals;

namespace {

const EventStreamConfig* streamNamed(const RampartConfig& c, const std::string& name) {
    return c.streams.findStream(name);
}

const ServiceConsumerConfig* serviceNamed(const RampartConfig& c, const std::string& name) {
    auto it = std::find_if(c.streams.services.begin(), c.streams.services.end(),
                           [&](const ServiceConsumerConfig& s){ return s.service == name; });
    return it == c.streams.services.end() ? nullptr : &*it;
}

const ExchangeConfig* exchangeNamed(const RampartConfig& c, ExchangeId id) {
    auto it = std::find_if(c.marketData.exchanges.begin(), c.marketData.exchanges.end(),
                           [&](const ExchangeConfig& e){ return e.id == id; });
    return it == c.marketData.exchanges.end() ? nullptr : &*it;
}

std::string errorFor(const std::string& text) {
    try {
        (void)ConfigLoader::fromString(text);
    } catch (const ConfigError& e) {
        return e.what();
    }
    return {};
}

} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST(ConfigLoader, EmptyDocumentKeepsDefaults) {
    const auto config = ConfigLoader::fromString("{}");
    EXPECT_NO_THROW(config.validate());

    EXPECT_EQ(config.runtime.executorThreads, 16u);
    EXPECT_EQ(config.runtime.logLevel, "info");
    EXPECT_EQ(config.breakers.profiles.size(), 5u);
    EXPECT_EQ(config.streams.streams.size(), 7u);
    EXPECT_TRUE(config.enableBackpressure);
    EXPECT_TRUE(config.enableStreams);
    EXPECT_TRUE(config.enableMarketData);
    EXPECT_EQ(config.marketData.symbols.size(), 8u);
    EXPECT_EQ(config.marketData.exchanges.size(), 3u);
    EXPECT_EQ(config.rest.host, "api.coingecko.com");
    EXPECT_DOUBLE_EQ(config.healthAlert.diskPercent, 90.0);
}

TEST(ConfigLoader, ExampleFileLoadsAndValidates) {
    const auto config = ConfigLoader::loadFile(RAMPART_EXAMPLE_CONFIG);
    EXPECT_NO_THROW(config.validate());
    const auto* kraken = exchangeNamed(config, ExchangeId::Kraken);
    ASSERT_NE(kraken, nullptr);
    EXPECT_FALSE(kraken->enabled);
    EXPECT_EQ(exchangeNamed(config, ExchangeId::Binance)->symbolsPerConnection, 200u);
}

// =============================================================================
// Section overrides
// =============================================================================

TEST(ConfigLoader, RuntimeAndResourceOverrides) {
    const auto config = ConfigLoader::fromString(R"({
        "runtime":   {"executor_threads": 4, "shutdown_grace_ms": 250, "log_level": "debug"},
        "resources": {"sample_interval_ms": 1000, "proc_root": "/host/proc"}
    })");
    EXPECT_EQ(config.runtime.executorThreads, 4u);
    EXPECT_EQ(config.runtime.shutdownGrace, 250ms);
    EXPECT_EQ(config.runtime.logLevel, "debug");
    EXPECT_EQ(config.resources.sampleInterval, 1000ms);
    EXPECT_EQ(config.resources.procRoot, "/host/proc");
    EXPECT_EQ(config.resources.diskPath, "/");
}

TEST(ConfigLoader, BreakerProfileOverrideKeepsOtherFields) {
    const auto config = ConfigLoader::fromString(R"({
        "circuit_breakers": {
            "instance_id": "node-7",
            "defaults": {"call_timeout_ms": 2000},
            "profiles": {
                "external_apis": {"failure_threshold": 4},
                "payments":      {"timeout_ms": 15000}
            }
        }
    })");
    EXPECT_EQ(config.breakers.instanceId, "node-7");
    EXPECT_EQ(config.breakers.defaults.callTimeout, 2000ms);

    const auto& external = config.breakers.profiles.at("external_apis");
    EXPECT_EQ(external.failureThreshold, 4);
    EXPECT_EQ(external.timeout, 120s);
    EXPECT_EQ(external.slowCallThreshold, 3000ms);

    // A new profile starts from the (already overridden) defaults.
    const auto& payments = config.breakers.profiles.at("payments");
    EXPECT_EQ(payments.timeout, 15s);
    EXPECT_EQ(payments.callTimeout, 2000ms);
    EXPECT_EQ(payments.failureThreshold, 5);
    EXPECT_EQ(config.breakers.profiles.size(), 6u);
}

TEST(ConfigLoader, BackpressureQueueCapacityByName) {
    const auto config = ConfigLoader::fromString(R"({
        "backpressure": {
            "enabled": false,
            "max_concurrent": 8,
            "queue_capacity": {"low": 5, "critical": 400},
            "severe": {"cpu_percent": 80}
        }
    })");
    EXPECT_FALSE(config.enableBackpressure);
    EXPECT_EQ(config.backpressure.maxConcurrent, 8);
    EXPECT_EQ(config.backpressure.queueCapacity[static_cast<std::size_t>(Priority::Critical)], 400u);
    EXPECT_EQ(config.backpressure.queueCapacity[static_cast<std::size_t>(Priority::High)], 150u);
    EXPECT_EQ(config.backpressure.queueCapacity[static_cast<std::size_t>(Priority::Low)], 5u);
    EXPECT_DOUBLE_EQ(config.backpressure.severe.cpuPercent, 80.0);
}

TEST(ConfigLoader, StreamCatalogAndServicesMerge) {
    const auto config = ConfigLoader::fromString(R"({
        "streams": {
            "poll_timeout_ms": 250,
            "min_fallback_critical_ms": 500,
            "health_alert": {"memory_percent": 70},
            "catalog": {
                "risk_alerts":   {"max_length": 2000},
                "order_fills":   {"max_length": 3000, "retention_s": 600, "priority": "critical"}
            },
            "services": {
                "trade_execution": {"batch_size": 10},
                "fill_recorder":   {"stream": "order_fills", "priority": "important",
                                    "batch_size": 20, "batch_timeout_ms": 200, "fallback_interval_ms": 60000}
            }
        }
    })");
    EXPECT_EQ(config.streams.pollTimeout, 250ms);
    EXPECT_EQ(config.streams.minFallbackCritical, 500ms);
    EXPECT_DOUBLE_EQ(config.healthAlert.memoryPercent, 70.0);
    EXPECT_DOUBLE_EQ(config.healthAlert.cpuPercent, 85.0);

    const auto* risk = streamNamed(config, "risk_alerts");
    ASSERT_NE(risk, nullptr);
    EXPECT_EQ(risk->maxLength, 2000u);
    EXPECT_EQ(risk->retention, 900s);
    EXPECT_EQ(risk->consumerGroup, "risk_services");

    const auto* fills = streamNamed(config, "order_fills");
    ASSERT_NE(fills, nullptr);
    EXPECT_EQ(fills->consumerGroup, "order_fills_group");
    EXPECT_EQ(fills->retention, 600s);
    EXPECT_EQ(fills->priority, ServicePriority::Critical);
    EXPECT_EQ(config.streams.streams.size(), 8u);

    EXPECT_EQ(serviceNamed(config, "trade_execution")->batchSize, 10u);
    const auto* recorder = serviceNamed(config, "fill_recorder");
    ASSERT_NE(recorder, nullptr);
    EXPECT_EQ(recorder->stream, "order_fills");
    EXPECT_EQ(recorder->priority, ServicePriority::Important);
    EXPECT_EQ(recorder->fallbackInterval, 60s);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigLoader, MarketDataOverrides) {
    const auto config = ConfigLoader::fromString(R"({
        "market_data": {
            "symbols": ["BTCUSDT", "XRPUSDT"],
            "staleness_threshold_ms": 4000,
            "publish_to_streams": false,
            "cache": {"hot_ttl_ms": 500, "hot_symbols": ["BTCUSDT"]},
            "exchanges": {"coinbase": {"enabled": false, "reconnect_delay_ms": 1000}},
            "rest": {"host": "rest.example.test", "timeout_ms": 3000}
        }
    })");
    EXPECT_EQ(config.marketData.symbols, (std::vector<std::string>{"BTCUSDT", "XRPUSDT"}));
    EXPECT_EQ(config.marketData.stalenessThreshold, 4000ms);
    EXPECT_FALSE(config.marketData.publishToStreams);
    EXPECT_EQ(config.marketData.cache.hotTtl, 500ms);
    EXPECT_EQ(config.marketData.cache.hot, (std::set<std::string>{"BTCUSDT"}));
    EXPECT_EQ(config.marketData.cache.warm.size(), 4u);

    const auto* coinbase = exchangeNamed(config, ExchangeId::Coinbase);
    ASSERT_NE(coinbase, nullptr);
    EXPECT_FALSE(coinbase->enabled);
    EXPECT_EQ(coinbase->reconnectDelay, 1000ms);
    EXPECT_EQ(coinbase->host, "ws-feed.exchange.coinbase.com");

    EXPECT_EQ(config.rest.host, "rest.example.test");
    EXPECT_EQ(config.rest.port, "443");
    EXPECT_EQ(config.rest.timeout, 3000ms);
}

TEST(ConfigLoader, UnknownSectionIsIgnored) {
    const auto config = ConfigLoader::fromString(R"({"dashboards": {"port": 8080}})");
    EXPECT_NO_THROW(config.validate());
}

// =============================================================================
// Rejections
// =============================================================================

TEST(ConfigLoader, TypeMismatchNamesTheKey) {
    EXPECT_EQ(errorFor(R"({"runtime": {"executor_threads": "many"}})"),
              "'runtime.executor_threads' must be an integer");
    EXPECT_EQ(errorFor(R"({"streams": {"enabled": "yes"}})"),
              "'streams.enabled' must be a boolean");
    EXPECT_EQ(errorFor(R"({"market_data": {"symbols": ["BTCUSDT", 7]}})"),
              "'market_data.symbols' must be an array of strings");
    EXPECT_EQ(errorFor(R"({"circuit_breakers": {"profiles": {"x": {"failure_threshold": 1.5}}}})"),
              "'circuit_breakers.profiles.x.failure_threshold' must be an integer");
    EXPECT_EQ(errorFor(R"({"streams": {"catalog": {"fills": {"max_length": -1}}}})"),
              "'streams.catalog.fills.max_length' must not be negative");
    EXPECT_EQ(errorFor(R"({"resources": []})"), "'resources' must be an object");
}

TEST(ConfigLoader, UnknownEnumValuesRejected) {
    EXPECT_NE(errorFor(R"({"market_data": {"exchanges": {"bitmex": {}}}})").find("unknown exchange 'bitmex'"),
              std::string::npos);
    EXPECT_NE(errorFor(R"({"backpressure": {"queue_capacity": {"urgent": 3}}})").find("unknown priority 'urgent'"),
              std::string::npos);
    EXPECT_NE(errorFor(R"({"streams": {"services": {"s": {"priority": "whenever"}}}})").find("unknown priority"),
              std::string::npos);
}

TEST(ConfigLoader, MalformedDocumentsRejected) {
    EXPECT_THROW((void)ConfigLoader::fromString("{ not json"), ConfigError);
    EXPECT_THROW((void)ConfigLoader::fromString("[1, 2, 3]"), ConfigError);
    EXPECT_THROW((void)ConfigLoader::loadFile("/nonexistent/rampart.json"), ConfigError);
}

// =============================================================================
// Whole-tree validation
// =============================================================================

TEST(RampartConfig, ValidateRejectsBadLogLevel) {
    auto config = ConfigLoader::fromString(R"({"runtime": {"log_level": "verbose"}})");
    EXPECT_THROW(config.validate(), ConfigError);
    config.runtime.logLevel = "warn";
    EXPECT_NO_THROW(config.validate());
}

TEST(RampartConfig, DisabledSectionsSkipValidation) {
    auto config = ConfigLoader::fromString(R"({
        "streams":     {"enabled": false, "poll_timeout_ms": 0},
        "market_data": {"enabled": false, "symbols": []}
    })");
    EXPECT_NO_THROW(config.validate());

    config.enableStreams = true;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(RampartConfig, ServiceOnUnknownStreamRejected) {
    const auto config = ConfigLoader::fromString(R"({
        "streams": {"services": {"orphan": {"stream": "nowhere"}}}
    })");
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST(RampartConfig, ZeroExecutorThreadsRejected) {
    const auto config = ConfigLoader::fromString(R"({"runtime": {"executor_threads": 0}})");
    EXPECT_THROW(config.validate(), ConfigError);
}

// =============================================================================
// Path resolution
// =============================================================================

TEST(ConfigPath, FlagFormsAndPositional) {
    ::unsetenv("RAMPART_CONFIG");
    {
        const char* argv[] = {"rampartd", "--config", "/etc/rampart.json"};
        EXPECT_EQ(ConfigLoader::resolvePath(3, argv), "/etc/rampart.json");
    }
    {
        const char* argv[] = {"rampartd", "--config=/tmp/a.json"};
        EXPECT_EQ(ConfigLoader::resolvePath(2, argv), "/tmp/a.json");
    }
    {
        const char* argv[] = {"rampartd", "local.json"};
        EXPECT_EQ(ConfigLoader::resolvePath(2, argv), "local.json");
    }
    {
        const char* argv[] = {"rampartd"};
        EXPECT_FALSE(ConfigLoader::resolvePath(1, argv).has_value());
    }
    {
        const char* argv[] = {"rampartd", "--config"};
        EXPECT_THROW((void)ConfigLoader::resolvePath(2, argv), ConfigError);
    }
}

TEST(ConfigPath, EnvironmentIsTheLastResort) {
    ::setenv("RAMPART_CONFIG", "/from/env.json", 1);
    {
        const char* argv[] = {"rampartd"};
        EXPECT_EQ(ConfigLoader::resolvePath(1, argv), "/from/env.json");
    }
    {
        const char* argv[] = {"rampartd", "--config=/from/flag.json"};
        EXPECT_EQ(ConfigLoader::resolvePath(2, argv), "/from/flag.json");
    }
    ::unsetenv("RAMPART_CONFIG");
}
