#include "config/RampartConfig.hpp"
#include "RampartErrors.hpp"

namespace Rampart {

void RuntimeConfig::validate() const {
    if (executorThreads == 0) throw ConfigError("runtime.executor_threads must be >= 1");
    if (shutdownGrace.count() < 0) throw ConfigError("runtime.shutdown_grace_ms must not be negative");
    if (statusInterval.count() <= 0) throw ConfigError("runtime.status_interval_ms must be positive");
    static constexpr const char* kLevels[] = {"trace", "debug", "info", "warn", "error"};
    for (const char* level : kLevels) {
        if (logLevel == level) return;
    }
    throw ConfigError("runtime.log_level '" + logLevel + "' is not one of trace|debug|info|warn|error");
}

void RampartConfig::validate() const {
    runtime.validate();
    resources.validate();
    breakers.validate();
    if (enableBackpressure) backpressure.validate();
    if (enableStreams) {
        streams.validate();
        healthAlert.validate("streams.health_alert");
    }
    if (enableMarketData) {
        marketData.validate();
        rest.validate();
    }
}

} // namespace Rampart
