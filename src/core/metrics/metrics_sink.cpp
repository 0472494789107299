#include <ledgerstream/core/metrics/metrics_sink.hpp>
#include <spdlog/spdlog.h>

namespace LedgerStream {

MetricsSinkPtr makeMetricsSink(bool enabled, MetricRegistry& registry) {
    if (enabled) {
        spdlog::info("[Metrics] In-process metric registry enabled");
        return std::make_shared<RegistryMetricsSink>(registry);
    }
    spdlog::info("[Metrics] Metrics disabled, using no-op sink");
    return std::make_shared<NoopMetricsSink>();
}

} // namespace LedgerStream
