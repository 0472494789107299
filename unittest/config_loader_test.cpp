// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <ledgerstream/core/config/loader.hpp>
#include <ledgerstream/core/config/app_config.hpp>

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    // Verify basic app info
    EXPECT_EQ(config.app_name, "LedgerStream");
    EXPECT_EQ(config.version, "1.0.0");

    // Verify ledger config
    EXPECT_EQ(config.ledger.path, "data/ledger.jsonl");
    EXPECT_EQ(config.ledger.auto_snapshot_interval_seconds, 86400);
    EXPECT_EQ(config.ledger.snapshot_retention, 7);
    EXPECT_TRUE(config.ledger.fsync);

    // Verify orchestrator config
    EXPECT_EQ(config.orchestrator.buffer_size, 100);
    EXPECT_EQ(config.orchestrator.checkpoint_interval, 1000);
    EXPECT_TRUE(config.orchestrator.record_failures);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigLoader, OptionalSectionsUseDefaults) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("unittest/config/minimal.yaml");

    EXPECT_EQ(config.version, "2.0.0");
    EXPECT_EQ(config.ledger.path, "/tmp/ledgerstream/ledger.jsonl");
    EXPECT_TRUE(config.ledger.snapshot_dir.empty());
    EXPECT_EQ(config.ledger.stuck_threshold_seconds, 3600);
    EXPECT_EQ(config.orchestrator.progress_interval, 100);
    EXPECT_TRUE(config.metrics.enabled);
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/config/missing_field.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/config/invalid_type.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/config/invalid_value.yaml"),
        std::runtime_error
    );
}
