#pragma once
#include <ledgerstream/core/metrics/histogram.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace LedgerStream {

/// Label pairs in declaration order, e.g. {{"state", "FETCHING"}}
using MetricLabels = std::vector<std::pair<std::string, std::string>>;

enum class MetricKind : uint8_t {
    COUNTER = 0,
    GAUGE = 1,
    HISTOGRAM = 2
};

/**
 * Non-atomic copy of one series for reporting.
 * value is the counter/gauge value; histogram series fill count/sum/p50/p99.
 */
struct MetricSnapshot {
    MetricKind kind = MetricKind::COUNTER;
    double value = 0.0;
    uint64_t count = 0;
    double sum_seconds = 0.0;
    double p50_seconds = 0.0;
    double p99_seconds = 0.0;
};

/**
 * @class MetricRegistry
 * @brief In-process store of named counters, gauges and histograms.
 *
 * A series is identified by its key, name{label="value",...}. Series are created
 * lazily and never removed (except by reset()), so references returned by
 * counter()/gauge()/histogram() stay valid for the registry's lifetime and can
 * be cached by hot paths.
 */
class MetricRegistry {
public:
    /// Process-wide default used by the application
    static MetricRegistry& getInstance();

    MetricRegistry() = default;
    ~MetricRegistry() = default;
    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    static std::string seriesKey(std::string_view name, const MetricLabels& labels = {});

    std::atomic<uint64_t>& counter(const std::string& key);
    std::atomic<int64_t>& gauge(const std::string& key);
    DurationHistogram& histogram(const std::string& key);

    uint64_t counterValue(const std::string& key) const;
    int64_t gaugeValue(const std::string& key) const;
    std::optional<MetricSnapshot> getSnapshot(const std::string& key) const;
    std::map<std::string, MetricSnapshot> getSnapshots() const;

    /// Drop every series (tests only; invalidates cached references)
    void reset();

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::atomic<uint64_t>> counters_;
    std::unordered_map<std::string, std::atomic<int64_t>> gauges_;
    std::unordered_map<std::string, std::unique_ptr<DurationHistogram>> histograms_;
};

} // namespace LedgerStream
