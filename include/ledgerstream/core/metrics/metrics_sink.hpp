#pragma once
#include <ledgerstream/core/metrics/registry.hpp>
#include <memory>
#include <string_view>

namespace LedgerStream {

// Compile-time metric names shared by the ledger and the orchestrator
namespace MetricNames {
    constexpr std::string_view LEDGER_TRANSITIONS = "ledgerstream_ledger_state_transitions_total";
    constexpr std::string_view LEDGER_INIT = "ledgerstream_ledger_initialization_total";
    constexpr std::string_view LEDGER_INIT_SECONDS = "ledgerstream_ledger_initialization_seconds";
    constexpr std::string_view LEDGER_DOCUMENTS_BY_STATE = "ledgerstream_ledger_documents_by_state";
    constexpr std::string_view LEDGER_STUCK = "ledgerstream_ledger_stuck_documents";
    constexpr std::string_view LEDGER_STATE_SECONDS = "ledgerstream_ledger_state_duration_seconds";
    constexpr std::string_view LEDGER_ERRORS = "ledgerstream_ledger_errors_total";
    constexpr std::string_view LEDGER_SNAPSHOTS = "ledgerstream_ledger_snapshots_total";

    constexpr std::string_view PIPELINE_EVENTS = "ledgerstream_pipeline_events_total";
    constexpr std::string_view PIPELINE_RUN_SECONDS = "ledgerstream_pipeline_run_seconds";
    constexpr std::string_view PIPELINE_QUEUE_DEPTH = "ledgerstream_pipeline_queue_depth";
    constexpr std::string_view PIPELINE_CHECKPOINT_SECONDS = "ledgerstream_pipeline_checkpoint_interval_seconds";
    constexpr std::string_view PIPELINE_BACKPRESSURE_SECONDS = "ledgerstream_pipeline_backpressure_wait_seconds";
}

/**
 * @class MetricsSink
 * @brief Where the core reports metrics. Chosen once at startup and injected.
 *
 * The core never checks whether a metrics backend exists; it always talks to a
 * sink, which may be the registry-backed one or NoopMetricsSink.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void incrementCounter(std::string_view name, const MetricLabels& labels = {},
                                  uint64_t amount = 1) = 0;
    virtual void setGauge(std::string_view name, const MetricLabels& labels, int64_t value) = 0;
    virtual void observeSeconds(std::string_view name, const MetricLabels& labels, double seconds) = 0;
};

using MetricsSinkPtr = std::shared_ptr<MetricsSink>;

class RegistryMetricsSink : public MetricsSink {
public:
    explicit RegistryMetricsSink(MetricRegistry& registry = MetricRegistry::getInstance())
        : registry_(registry) {}

    void incrementCounter(std::string_view name, const MetricLabels& labels = {},
                          uint64_t amount = 1) override {
        registry_.counter(MetricRegistry::seriesKey(name, labels))
            .fetch_add(amount, std::memory_order_relaxed);
    }

    void setGauge(std::string_view name, const MetricLabels& labels, int64_t value) override {
        registry_.gauge(MetricRegistry::seriesKey(name, labels))
            .store(value, std::memory_order_relaxed);
    }

    void observeSeconds(std::string_view name, const MetricLabels& labels, double seconds) override {
        registry_.histogram(MetricRegistry::seriesKey(name, labels)).recordSeconds(seconds);
    }

    MetricRegistry& registry() { return registry_; }

private:
    MetricRegistry& registry_;
};

class NoopMetricsSink : public MetricsSink {
public:
    void incrementCounter(std::string_view, const MetricLabels&, uint64_t) override {}
    void setGauge(std::string_view, const MetricLabels&, int64_t) override {}
    void observeSeconds(std::string_view, const MetricLabels&, double) override {}
};

/// Registry-backed sink when @p enabled, otherwise a no-op sink
MetricsSinkPtr makeMetricsSink(bool enabled, MetricRegistry& registry = MetricRegistry::getInstance());

} // namespace LedgerStream
