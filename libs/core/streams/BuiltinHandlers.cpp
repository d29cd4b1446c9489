#include "streams/BuiltinHandlers.hpp"
#include "store/InMemoryKeyValueStore.hpp"
#include "RampartLogging.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>

namespace Rampart {

namespace {

std::optional<double> parsePrice(const std::string& s) {
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size() || !(v > 0.0)) return std::nullopt;
    return v;
}

std::string field(const StreamEntry& entry, const std::string& key) {
    auto it = entry.fields.find(key);
    return it == entry.fields.end() ? std::string{} : it->second;
}

} // namespace

// ============================================================================
// cleanup_service
// ============================================================================

void CleanupHandler::onEvent(const StreamEntry& entry) {
    LOG_D("Stream", "Cleanup requested by {}", entry.id.toString());
    onFallback();
}

void CleanupHandler::onFallback() {
    const auto r = m_manager.runCleanupPass();
    LOG_D("Stream", "Cleanup cycle completed ({} expired, {} over length)", r.trimmedByAge, r.trimmedByLength);
}

// ============================================================================
// health_monitor
// ============================================================================

HealthMonitorHandler::HealthMonitorHandler(EventStreamManager& manager, const ResourceMonitor* resources,
                                           ResourceThresholds alertAt)
    : m_manager(manager)
    , m_resources(resources)
    , m_alertAt(alertAt)
{
    m_alertAt.validate("health_monitor");
}

void HealthMonitorHandler::onEvent(const StreamEntry& entry) {
    const auto alert = field(entry, "alert");
    if (!alert.empty()) {
        LOG_W("Guard", "Health alert '{}': cpu={}% mem={}% disk={}%", alert,
              field(entry, "cpu_percent"), field(entry, "memory_percent"), field(entry, "disk_percent"));
    }
}

void HealthMonitorHandler::onFallback() {
    if (!m_resources) return;
    const auto s = m_resources->snapshot();
    if (!s.valid) return;

    LOG_D("Guard", "Health check: cpu={:.1f}% mem={:.1f}% disk={:.1f}%", s.cpuPercent, s.memoryPercent, s.diskPercent);
    if (!ResourceMonitor::exceeds(s, m_alertAt)) return;

    m_manager.publishEvent(EventType::SystemHealth, {
        {"cpu_percent",    fmt::format("{:.1f}", s.cpuPercent)},
        {"memory_percent", fmt::format("{:.1f}", s.memoryPercent)},
        {"disk_percent",   fmt::format("{:.1f}", s.diskPercent)},
        {"alert",          "high_resource_usage"},
    });
}

// ============================================================================
// metrics_collector
// ============================================================================

void MetricsCollectorHandler::onEvent(const StreamEntry& entry) {
    LOG_T("Stream", "metrics_collector saw {} ({})", entry.id.toString(), field(entry, "event_type"));
}

void MetricsCollectorHandler::onFallback() {
    const auto st = m_manager.status();

    std::size_t active = 0;
    std::uint64_t processed = 0;
    for (const auto& c : st.consumers) {
        if (c.state != ConsumerState::Stopped) ++active;
        processed += c.processed;
    }
    std::size_t backlog = 0;
    for (const auto& s : st.streams) {
        for (const auto& g : s.info.groups) backlog += g.pending + g.lag;
    }

    const auto r = m_resources ? m_resources->snapshot() : ResourceSnapshot{};
    rLog_App("Metrics: {} active consumers, {} processed, {} published, backlog {}, cpu={:.1f}% mem={:.1f}%",
             active, processed, st.published, backlog, r.cpuPercent, r.memoryPercent);
}

// ============================================================================
// market_data_processor
// ============================================================================

MarketDataProcessorHandler::MarketDataProcessorHandler(EventStreamManager& manager,
                                                       std::shared_ptr<KeyValueStore> store)
    : m_manager(manager)
    , m_store(std::move(store))
{
    if (!m_store) m_store = std::make_shared<InMemoryKeyValueStore>();
}

double MarketDataProcessorHandler::thresholdPercentFor(const std::string& symbol) {
    return (symbol == "BTCUSDT" || symbol == "ETHUSDT") ? 0.5 : 1.0;
}

bool MarketDataProcessorHandler::isSignificantChange(const std::string& symbol, double price) {
    const auto key = "last_price:" + symbol;
    const auto ttl = std::chrono::duration_cast<std::chrono::milliseconds>(kLastPriceTtl);

    std::optional<double> last;
    if (auto raw = m_store->get(key)) last = parsePrice(*raw);

    if (!last) {
        m_store->set(key, fmt::format("{}", price), ttl);
        return false;
    }

    const double changePercent = std::abs((price - *last) / *last) * 100.0;
    if (changePercent <= thresholdPercentFor(symbol)) return false;

    m_store->set(key, fmt::format("{}", price), ttl);
    return true;
}

void MarketDataProcessorHandler::onEvent(const StreamEntry& entry) {
    const auto symbol = field(entry, "symbol");
    const auto priceText = field(entry, "price");
    if (symbol.empty() || priceText.empty()) return;

    const auto price = parsePrice(priceText);
    if (!price) {
        LOG_W("Data", "Ignoring market update {} with unusable price '{}'", entry.id.toString(), priceText);
        return;
    }

    rLog_Data("Market update {} = {}", symbol, priceText);
    if (isSignificantChange(symbol, *price)) {
        m_manager.publishEvent(EventType::PortfolioChange, {
            {"symbol",  symbol},
            {"price",   priceText},
            {"trigger", "price_change"},
        });
    }
}

void MarketDataProcessorHandler::onFallback() {
    LOG_D("Data", "Market data processing fallback");
}

// ============================================================================
// Business-service placeholder
// ============================================================================

void LoggingServiceHandler::onEvent(const StreamEntry& entry) {
    rLog_Stream("{} received {} ({})", m_service, entry.id.toString(), field(entry, "event_type"));
}

void LoggingServiceHandler::onFallback() {
    LOG_D("Stream", "{} fallback check", m_service);
}

void installBuiltinHandlers(EventStreamManager& manager,
                            std::shared_ptr<KeyValueStore> store,
                            const ResourceMonitor* resources,
                            const ResourceThresholds& healthAlert) {
    auto install = [&](const std::string& service, std::shared_ptr<ServiceHandler> handler) {
        const auto& services = manager.config().services;
        const bool configured = std::any_of(services.begin(), services.end(),
                                            [&](const auto& s){ return s.service == service; });
        if (configured) manager.registerHandler(service, std::move(handler));
    };
    install("cleanup_service", std::make_shared<CleanupHandler>(manager));
    install("health_monitor", std::make_shared<HealthMonitorHandler>(manager, resources, healthAlert));
    install("metrics_collector", std::make_shared<MetricsCollectorHandler>(manager, resources));
    install("market_data_processor", std::make_shared<MarketDataProcessorHandler>(manager, std::move(store)));
}

} // namespace Rampart
