#include <spdlog/spdlog.h>
#include <ledgerstream/core/adapters/jsonl_adapter.hpp>
#include <ledgerstream/core/adapters/registry.hpp>
#include <ledgerstream/core/config/loader.hpp>
#include <ledgerstream/core/ledger/ledger_store.hpp>
#include <ledgerstream/core/metrics/metrics_sink.hpp>
#include <ledgerstream/core/orchestrator/streaming_orchestrator.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace LedgerStream;

// Global flag for graceful shutdown
static std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [config.yaml] [status|stuck|snapshot|ingest <file.jsonl> [--resume]]\n";
}

DurableLedgerStore::Options ledgerOptions(const AppConfig::LedgerConfig& config, MetricsSinkPtr metrics) {
    DurableLedgerStore::Options options;
    options.auto_snapshot_interval = std::chrono::seconds(config.auto_snapshot_interval_seconds);
    options.snapshot_dir = config.snapshot_dir;
    options.snapshot_retention = static_cast<size_t>(config.snapshot_retention);
    options.fsync = config.fsync;
    options.metrics = std::move(metrics);
    return options;
}

int printStatus(const DurableLedgerStore& ledger) {
    spdlog::info("Ledger {}: {} documents", ledger.path().string(), ledger.size());
    for (const auto& [state, count] : ledger.stateCounts()) {
        if (count > 0) {
            std::cout << toString(state) << "\t" << count << "\n";
        }
    }
    return EXIT_SUCCESS;
}

int printStuck(const DurableLedgerStore& ledger, std::chrono::seconds threshold) {
    auto stuck = ledger.getStuckDocuments(threshold);
    for (const auto& entry : stuck) {
        std::cout << entry.doc_id << "\t" << toString(entry.state) << "\t"
                  << static_cast<int64_t>(ledger.getStateDuration(entry.doc_id)) << "s\n";
    }
    spdlog::info("{} stuck documents (threshold {}s)", stuck.size(), threshold.count());
    return EXIT_SUCCESS;
}

int runIngest(DurableLedgerStore& ledger, const AppConfig::OrchestratorConfig& config,
              MetricsSinkPtr metrics, const std::string& path, bool resume) {
    AdapterRegistry registry;
    JsonlFileAdapter::registerWith(registry);

    StreamingOrchestrator::Options options;
    options.buffer_size = static_cast<size_t>(config.buffer_size);
    options.progress_interval = static_cast<size_t>(config.progress_interval);
    options.checkpoint_interval = static_cast<size_t>(config.checkpoint_interval);
    options.record_failures = config.record_failures;
    options.metrics = std::move(metrics);
    StreamingOrchestrator orchestrator(ledger, registry, options);

    StreamOptions stream_options;
    stream_options.params.push_back({{"path", path}});
    stream_options.resume = resume;

    EventStream stream = orchestrator.streamEvents(JsonlFileAdapter::SOURCE, std::move(stream_options));
    bool failed = false;
    while (auto event = stream.next()) {
        if (auto progress = event->as<BatchProgress>()) {
            spdlog::info("{} completed={} failed={} queue={} backpressure={:.3f}s",
                         progress->is_checkpoint ? "Checkpoint" : "Progress",
                         progress->completed_count, progress->failed_count, progress->queue_depth,
                         progress->backpressure_wait_seconds);
        } else if (auto failure = event->as<DocumentFailed>()) {
            failed = true;
            spdlog::error("Document {} failed: {} ({})", failure->doc_id.value_or("<unknown>"),
                          failure->error, failure->error_type);
        } else if (auto completed = event->as<DocumentCompleted>()) {
            spdlog::debug("Completed {} in {:.3f}s", completed->document.doc_id, completed->duration);
        }
        if (!g_running.load(std::memory_order_acquire)) {
            spdlog::warn("Interrupted, cancelling run {}", stream.pipelineId());
            stream.close();
            break;
        }
    }
    if (auto checkpoint = stream.finalCheckpoint()) {
        if (auto progress = checkpoint->as<BatchProgress>()) {
            spdlog::info("Run {} done: {} completed, {} failed", stream.pipelineId(),
                         progress->completed_count, progress->failed_count);
        }
    }
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

void logMetrics() {
    for (const auto& [key, snapshot] : MetricRegistry::getInstance().getSnapshots()) {
        if (snapshot.kind == MetricKind::HISTOGRAM) {
            spdlog::debug("{} count={} sum={:.6f}s p50={:.6f}s p99={:.6f}s",
                          key, snapshot.count, snapshot.sum_seconds, snapshot.p50_seconds, snapshot.p99_seconds);
        } else {
            spdlog::debug("{} {}", key, snapshot.value);
        }
    }
}

} // namespace

int main( int argc, char* argv[] ) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    int arg = 1;
    std::string config_path = "config/config.yaml";
    if (arg < argc && std::strstr(argv[arg], ".yaml") != nullptr) {
        config_path = argv[arg++];
    }
    std::string command = arg < argc ? argv[arg++] : "status";

    AppConfig::AppConfiguration config;
    try {
        config = ConfigLoader::loadConfig(config_path);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::info("{} version {} starting ({})", config.app_name, config.version, command);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    MetricsSinkPtr metrics = makeMetricsSink(config.metrics.enabled);
    int rc = EXIT_SUCCESS;
    try {
        DurableLedgerStore ledger(config.ledger.path, ledgerOptions(config.ledger, metrics));

        if (command == "status") {
            rc = printStatus(ledger);
        } else if (command == "stuck") {
            rc = printStuck(ledger, std::chrono::seconds(config.ledger.stuck_threshold_seconds));
        } else if (command == "snapshot") {
            auto path = ledger.createSnapshot();
            std::cout << path.string() << "\n";
        } else if (command == "ingest") {
            if (arg >= argc) {
                printUsage(argv[0]);
                return EXIT_FAILURE;
            }
            std::string input = argv[arg++];
            bool resume = arg < argc && std::strcmp(argv[arg], "--resume") == 0;
            rc = runIngest(ledger, config.orchestrator, metrics, input, resume);
        } else {
            printUsage(argv[0]);
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return EXIT_FAILURE;
    }

    logMetrics();
    spdlog::info("Shutdown complete.");
    return rc;
}
