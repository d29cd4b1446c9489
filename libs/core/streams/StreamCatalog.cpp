#include "streams/StreamCatalog.hpp"
#include "RampartErrors.hpp"

namespace Rampart {

using namespace std::chrono_literals;

const char* toString(ServicePriority p) {
    switch (p) {
        case ServicePriority::Critical:   return "critical";
        case ServicePriority::Important:  return "important";
        case ServicePriority::Background: return "background";
    }
    return "unknown";
}

std::optional<ServicePriority> servicePriorityFromString(std::string_view s) {
    if (s == "critical")   return ServicePriority::Critical;
    if (s == "important")  return ServicePriority::Important;
    if (s == "background") return ServicePriority::Background;
    return std::nullopt;
}

const char* toString(EventType t) {
    switch (t) {
        case EventType::TradeSignal:     return "trade_signal";
        case EventType::RiskAlert:       return "risk_alert";
        case EventType::PriceUpdate:     return "price_update";
        case EventType::PortfolioChange: return "portfolio_change";
        case EventType::BalanceUpdate:   return "balance_update";
        case EventType::SystemHealth:    return "system_health";
        case EventType::CleanupRequest:  return "cleanup_request";
    }
    return "unknown";
}

std::optional<EventType> eventTypeFromString(std::string_view s) {
    if (s == "trade_signal")     return EventType::TradeSignal;
    if (s == "risk_alert")       return EventType::RiskAlert;
    if (s == "price_update")     return EventType::PriceUpdate;
    if (s == "portfolio_change") return EventType::PortfolioChange;
    if (s == "balance_update")   return EventType::BalanceUpdate;
    if (s == "system_health")    return EventType::SystemHealth;
    if (s == "cleanup_request")  return EventType::CleanupRequest;
    return std::nullopt;
}

void EventStreamConfig::validate() const {
    if (name.empty()) throw ConfigError("stream with empty name");
    if (maxLength == 0) throw ConfigError("stream '" + name + "': max_length must be >= 1");
    if (retention.count() <= 0) throw ConfigError("stream '" + name + "': retention_s must be positive");
    if (consumerGroup.empty()) throw ConfigError("stream '" + name + "': consumer_group must not be empty");
}

void ServiceConsumerConfig::validate() const {
    if (service.empty()) throw ConfigError("service with empty name");
    if (stream.empty()) throw ConfigError("service '" + service + "': stream must not be empty");
    if (batchSize == 0) throw ConfigError("service '" + service + "': batch_size must be >= 1");
    if (batchTimeout.count() <= 0) throw ConfigError("service '" + service + "': batch_timeout_ms must be positive");
    if (fallbackInterval.count() <= 0) throw ConfigError("service '" + service + "': fallback_interval_ms must be positive");
}

namespace StreamCatalog {

std::vector<EventStreamConfig> defaultStreams() {
    return {
        {"trade_signals",     50000,  1800s,  "trading_services",   ServicePriority::Critical},
        {"risk_alerts",       10000,  900s,   "risk_services",      ServicePriority::Critical},
        {"market_updates",    100000, 3600s,  "market_services",    ServicePriority::Important},
        {"portfolio_changes", 25000,  1800s,  "portfolio_services", ServicePriority::Important},
        {"balance_updates",   20000,  1800s,  "balance_services",   ServicePriority::Important},
        {"system_events",     15000,  7200s,  "system_services",    ServicePriority::Background},
        {"cleanup_events",    5000,   14400s, "cleanup_services",   ServicePriority::Background},
    };
}

std::vector<ServiceConsumerConfig> defaultServices() {
    return {
        {"trade_execution",       "trade_signals",     ServicePriority::Critical,   1,  100ms,   1s},
        {"risk_monitor",          "portfolio_changes", ServicePriority::Critical,   5,  500ms,   5s},
        {"portfolio_sync",        "market_updates",    ServicePriority::Important,  10, 2000ms,  120s},
        {"balance_sync",          "balance_updates",   ServicePriority::Important,  15, 3000ms,  300s},
        {"market_data_processor", "market_updates",    ServicePriority::Important,  25, 1500ms,  60s},
        {"health_monitor",        "system_events",     ServicePriority::Background, 20, 5000ms,  300s},
        {"cleanup_service",       "cleanup_events",    ServicePriority::Background, 50, 10000ms, 3600s},
        {"metrics_collector",     "system_events",     ServicePriority::Background, 30, 8000ms,  600s},
    };
}

const char* streamFor(EventType type) {
    switch (type) {
        case EventType::TradeSignal:     return "trade_signals";
        case EventType::RiskAlert:       return "risk_alerts";
        case EventType::PriceUpdate:     return "market_updates";
        case EventType::PortfolioChange: return "portfolio_changes";
        case EventType::BalanceUpdate:   return "balance_updates";
        case EventType::SystemHealth:    return "system_events";
        case EventType::CleanupRequest:  return "cleanup_events";
    }
    return "system_events";
}

} // namespace StreamCatalog

} // namespace Rampart
