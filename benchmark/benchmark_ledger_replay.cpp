// ============================================================================
// LEDGERSTREAM - LEDGER WRITE / REPLAY BENCHMARK
// ============================================================================
// Measures the cost of durable transitions and of rebuilding the state map
// at startup, with and without a snapshot.
//
// Scenarios:
//   - Append: N documents walked through the full happy path
//   - Full replay: reopen the store from the raw log
//   - Snapshot reload: compact, then reopen from snapshot + empty tail
//
// Usage: benchmark_ledger_replay [documents] [--fsync]
// ============================================================================

#include <ledgerstream/core/ledger/ledger_store.hpp>
#include <ledgerstream/core/utils/clock.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace LedgerStream;
namespace fs = std::filesystem;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct PhaseResult {
    std::string name;
    size_t operations = 0;
    double seconds = 0.0;

    double throughput() const { return seconds > 0.0 ? operations / seconds : 0.0; }
};

static void printResult(const PhaseResult& r) {
    std::cout << std::left << std::setw(20) << r.name
              << std::right << std::setw(12) << r.operations << " ops"
              << std::setw(12) << std::fixed << std::setprecision(3) << r.seconds * 1000.0 << " ms"
              << std::setw(14) << std::setprecision(0) << r.throughput() << " ops/s"
              << std::endl;
}

static DurableLedgerStore::Options benchOptions(bool fsync) {
    DurableLedgerStore::Options options;
    options.auto_snapshot_interval = std::chrono::seconds(0);
    options.fsync = fsync;
    return options;
}

// ============================================================================
// SCENARIOS
// ============================================================================

static PhaseResult runAppend(const fs::path& log, size_t documents, bool fsync) {
    static const std::vector<LedgerState> path = {
        LedgerState::FETCHING, LedgerState::FETCHED, LedgerState::PARSING,
        LedgerState::PARSED, LedgerState::VALIDATING, LedgerState::VALIDATED,
        LedgerState::IR_BUILDING, LedgerState::IR_READY, LedgerState::COMPLETED,
    };

    DurableLedgerStore store(log, benchOptions(fsync));
    TransitionContext context;
    context.adapter = "benchmark";

    uint64_t start = Clock::now_ns();
    for (size_t i = 0; i < documents; ++i) {
        const std::string doc_id = "bench:doc-" + std::to_string(i);
        for (LedgerState state : path) {
            store.updateState(doc_id, state, context);
        }
    }
    return {"append", documents * path.size(), Clock::elapsed_seconds(start)};
}

static PhaseResult runReopen(const std::string& name, const fs::path& log, size_t documents) {
    uint64_t start = Clock::now_ns();
    DurableLedgerStore store(log, benchOptions(false));
    double seconds = Clock::elapsed_seconds(start);
    if (store.size() != documents) {
        spdlog::error("[Benchmark] {} rebuilt {} documents, expected {}", name, store.size(), documents);
    }
    return {name, documents, seconds};
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    size_t documents = 10000;
    bool fsync = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--fsync") == 0) {
            fsync = true;
        } else {
            documents = static_cast<size_t>(std::strtoull(argv[i], nullptr, 10));
        }
    }

    spdlog::set_level(spdlog::level::warn);

    fs::path dir = fs::temp_directory_path() / "ledgerstream_benchmark";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    fs::path log = dir / "ledger.jsonl";

    std::cout << "=== LedgerStream ledger benchmark: " << documents << " documents, fsync "
              << (fsync ? "on" : "off") << " ===" << std::endl;

    try {
        printResult(runAppend(log, documents, fsync));
        std::cout << "log size: " << fs::file_size(log) / 1024 << " KiB" << std::endl;

        printResult(runReopen("full replay", log, documents));

        fs::path snapshot;
        {
            DurableLedgerStore store(log, benchOptions(false));
            uint64_t start = Clock::now_ns();
            snapshot = store.createSnapshot();
            printResult({"snapshot write", store.size(), Clock::elapsed_seconds(start)});
        }
        std::cout << "snapshot size: " << fs::file_size(snapshot) / 1024 << " KiB" << std::endl;

        printResult(runReopen("snapshot reload", log, documents));
    } catch (const std::exception& e) {
        spdlog::error("[Benchmark] failed: {}", e.what());
        fs::remove_all(dir, ec);
        return EXIT_FAILURE;
    }

    fs::remove_all(dir, ec);
    return EXIT_SUCCESS;
}
