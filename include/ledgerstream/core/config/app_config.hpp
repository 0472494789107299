#pragma once
#include <cstdint>
#include <string>

namespace AppConfig {

struct LedgerConfig {
    std::string path;                           // required
    std::string snapshot_dir;                   // empty = <path>.snapshots
    int64_t auto_snapshot_interval_seconds = 86400;  // 0 disables
    int snapshot_retention = 7;
    bool fsync = true;
    int64_t stuck_threshold_seconds = 3600;
};

struct OrchestratorConfig {
    int buffer_size = 100;
    int progress_interval = 100;
    int checkpoint_interval = 1000;
    bool record_failures = true;
};

struct MetricsConfig {
    bool enabled = true;
};

struct LoggingConfig {
    std::string level = "info";                 // trace|debug|info|warn|error|critical|off
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LedgerConfig ledger;
    OrchestratorConfig orchestrator;
    MetricsConfig metrics;
    LoggingConfig logging;
};

} // namespace AppConfig
