#include <ledgerstream/core/metrics/registry.hpp>

namespace LedgerStream {

MetricRegistry& MetricRegistry::getInstance() {
    static MetricRegistry instance;
    return instance;
}

std::string MetricRegistry::seriesKey(std::string_view name, const MetricLabels& labels) {
    std::string key(name);
    if (labels.empty()) {
        return key;
    }
    key.push_back('{');
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) key.push_back(',');
        key += labels[i].first;
        key += "=\"";
        key += labels[i].second;
        key.push_back('"');
    }
    key.push_back('}');
    return key;
}

std::atomic<uint64_t>& MetricRegistry::counter(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    // try_emplace constructs the atomic in place (atomics are not copyable)
    auto [it, inserted] = counters_.try_emplace(key, 0);
    return it->second;
}

std::atomic<int64_t>& MetricRegistry::gauge(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto [it, inserted] = gauges_.try_emplace(key, 0);
    return it->second;
}

DurationHistogram& MetricRegistry::histogram(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& slot = histograms_[key];
    if (!slot) {
        slot = std::make_unique<DurationHistogram>();
    }
    return *slot;
}

uint64_t MetricRegistry::counterValue(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second.load(std::memory_order_relaxed);
}

int64_t MetricRegistry::gaugeValue(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = gauges_.find(key);
    return it == gauges_.end() ? 0 : it->second.load(std::memory_order_relaxed);
}

namespace {

MetricSnapshot histogramSnapshot(const DurationHistogram& h) {
    MetricSnapshot snap;
    snap.kind = MetricKind::HISTOGRAM;
    snap.count = h.count();
    snap.value = static_cast<double>(snap.count);
    snap.sum_seconds = h.sumSeconds();
    snap.p50_seconds = h.percentileSeconds(50);
    snap.p99_seconds = h.percentileSeconds(99);
    return snap;
}

} // namespace

std::optional<MetricSnapshot> MetricRegistry::getSnapshot(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (auto it = counters_.find(key); it != counters_.end()) {
        MetricSnapshot snap;
        snap.kind = MetricKind::COUNTER;
        snap.value = static_cast<double>(it->second.load(std::memory_order_relaxed));
        return snap;
    }
    if (auto it = gauges_.find(key); it != gauges_.end()) {
        MetricSnapshot snap;
        snap.kind = MetricKind::GAUGE;
        snap.value = static_cast<double>(it->second.load(std::memory_order_relaxed));
        return snap;
    }
    if (auto it = histograms_.find(key); it != histograms_.end()) {
        return histogramSnapshot(*it->second);
    }
    return std::nullopt;
}

std::map<std::string, MetricSnapshot> MetricRegistry::getSnapshots() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::map<std::string, MetricSnapshot> snaps;
    for (const auto& [key, value] : counters_) {
        MetricSnapshot snap;
        snap.kind = MetricKind::COUNTER;
        snap.value = static_cast<double>(value.load(std::memory_order_relaxed));
        snaps[key] = snap;
    }
    for (const auto& [key, value] : gauges_) {
        MetricSnapshot snap;
        snap.kind = MetricKind::GAUGE;
        snap.value = static_cast<double>(value.load(std::memory_order_relaxed));
        snaps[key] = snap;
    }
    for (const auto& [key, hist] : histograms_) {
        snaps[key] = histogramSnapshot(*hist);
    }
    return snaps;
}

void MetricRegistry::reset() {
    std::lock_guard<std::mutex> lock(mtx_);
    counters_.clear();
    gauges_.clear();
    histograms_.clear();
}

} // namespace LedgerStream
