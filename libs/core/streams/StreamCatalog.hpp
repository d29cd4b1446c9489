#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Rampart {

enum class ServicePriority { Critical = 0, Important = 1, Background = 2 };

const char* toString(ServicePriority p);
std::optional<ServicePriority> servicePriorityFromString(std::string_view s);

enum class EventType {
    TradeSignal,
    RiskAlert,
    PriceUpdate,
    PortfolioChange,
    BalanceUpdate,
    SystemHealth,
    CleanupRequest,
};

const char* toString(EventType t);
std::optional<EventType> eventTypeFromString(std::string_view s);

struct EventStreamConfig {
    std::string               name;
    std::size_t               maxLength{10000};
    std::chrono::seconds      retention{3600};
    std::string               consumerGroup;
    ServicePriority           priority{ServicePriority::Important};

    void validate() const;
};

struct ServiceConsumerConfig {
    std::string               service;
    std::string               stream;
    ServicePriority           priority{ServicePriority::Important};
    std::size_t               batchSize{10};
    std::chrono::milliseconds batchTimeout{1000};
    std::chrono::milliseconds fallbackInterval{60000};

    void validate() const;
};

namespace StreamCatalog {

// The fixed stream catalog and the service table that binds consumers to it.
std::vector<EventStreamConfig> defaultStreams();
std::vector<ServiceConsumerConfig> defaultServices();

// Stream that carries events of the given type.
const char* streamFor(EventType type);

} // namespace StreamCatalog

} // namespace Rampart
