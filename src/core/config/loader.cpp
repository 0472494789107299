#include <ledgerstream/core/config/loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <array>
#include <stdexcept>

namespace {

std::string fieldName(const std::string& section, const char* key) {
    return section.empty() ? std::string(key) : section + "." + key;
}

YAML::Node section(const YAML::Node& root, const char* name, bool required) {
    YAML::Node node = root[name];
    if (!node) {
        if (required) {
            throw std::runtime_error(std::string("Missing required config section: ") + name);
        }
        return YAML::Node(YAML::NodeType::Map);
    }
    if (!node.IsMap()) {
        throw std::runtime_error(std::string("Config section '") + name + "' must be a mapping");
    }
    return node;
}

template <typename T>
T convert(const YAML::Node& node, const std::string& field) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw std::runtime_error("Invalid type for config field '" + field + "': " + e.what());
    }
}

template <typename T>
T requireField(const YAML::Node& parent, const std::string& sectionName, const char* key) {
    const std::string field = fieldName(sectionName, key);
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw std::runtime_error("Missing required config field: " + field);
    }
    return convert<T>(node, field);
}

template <typename T>
T optionalField(const YAML::Node& parent, const std::string& sectionName, const char* key, T fallback) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    return convert<T>(node, fieldName(sectionName, key));
}

void requirePositive(int64_t value, const char* field) {
    if (value <= 0) {
        throw std::runtime_error(std::string("Config field '") + field + "' must be positive, got " +
                                 std::to_string(value));
    }
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found or unreadable: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Config file " + filepath + " is not valid YAML: " + e.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + filepath + " must contain a mapping");
    }

    AppConfig::AppConfiguration config;
    config.app_name = requireField<std::string>(root, "", "app_name");
    config.version = requireField<std::string>(root, "", "version");

    // ledger
    YAML::Node ledger = section(root, "ledger", true);
    auto& lc = config.ledger;
    lc.path = requireField<std::string>(ledger, "ledger", "path");
    lc.snapshot_dir = optionalField<std::string>(ledger, "ledger", "snapshot_dir", lc.snapshot_dir);
    lc.auto_snapshot_interval_seconds = optionalField<int64_t>(
        ledger, "ledger", "auto_snapshot_interval_seconds", lc.auto_snapshot_interval_seconds);
    lc.snapshot_retention = optionalField<int>(ledger, "ledger", "snapshot_retention", lc.snapshot_retention);
    lc.fsync = optionalField<bool>(ledger, "ledger", "fsync", lc.fsync);
    lc.stuck_threshold_seconds = optionalField<int64_t>(
        ledger, "ledger", "stuck_threshold_seconds", lc.stuck_threshold_seconds);

    if (lc.path.empty()) {
        throw std::runtime_error("Config field 'ledger.path' must not be empty");
    }
    if (lc.auto_snapshot_interval_seconds < 0) {
        throw std::runtime_error("Config field 'ledger.auto_snapshot_interval_seconds' must be >= 0");
    }
    requirePositive(lc.snapshot_retention, "ledger.snapshot_retention");
    requirePositive(lc.stuck_threshold_seconds, "ledger.stuck_threshold_seconds");

    // orchestrator
    YAML::Node orchestrator = section(root, "orchestrator", false);
    auto& oc = config.orchestrator;
    oc.buffer_size = optionalField<int>(orchestrator, "orchestrator", "buffer_size", oc.buffer_size);
    oc.progress_interval = optionalField<int>(orchestrator, "orchestrator", "progress_interval", oc.progress_interval);
    oc.checkpoint_interval = optionalField<int>(orchestrator, "orchestrator", "checkpoint_interval",
                                                oc.checkpoint_interval);
    oc.record_failures = optionalField<bool>(orchestrator, "orchestrator", "record_failures", oc.record_failures);
    requirePositive(oc.buffer_size, "orchestrator.buffer_size");
    requirePositive(oc.progress_interval, "orchestrator.progress_interval");
    requirePositive(oc.checkpoint_interval, "orchestrator.checkpoint_interval");

    // metrics / logging
    YAML::Node metrics = section(root, "metrics", false);
    config.metrics.enabled = optionalField<bool>(metrics, "metrics", "enabled", config.metrics.enabled);

    YAML::Node logging = section(root, "logging", false);
    config.logging.level = optionalField<std::string>(logging, "logging", "level", config.logging.level);
    static const std::array<const char*, 7> levels = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    bool known_level = false;
    for (const char* level : levels) {
        known_level = known_level || config.logging.level == level;
    }
    if (!known_level) {
        throw std::runtime_error("Config field 'logging.level' has unknown level: " + config.logging.level);
    }

    spdlog::debug("Loaded configuration {} v{} from {}", config.app_name, config.version, filepath);
    return config;
}
