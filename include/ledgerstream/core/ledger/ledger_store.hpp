#pragma once
#include <ledgerstream/core/ledger/audit_record.hpp>
#include <ledgerstream/core/ledger/document_entry.hpp>
#include <ledgerstream/core/ledger/errors.hpp>
#include <ledgerstream/core/ledger/ledger_state.hpp>
#include <ledgerstream/core/ledger/snapshot.hpp>
#include <ledgerstream/core/metrics/metrics_sink.hpp>
#include <ledgerstream/core/utils/append_file.hpp>
#include <array>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace LedgerStream {

/**
 * Optional context attached to a transition. Everything here ends up in the
 * audit record; metadata/parameters must be JSON objects (null = none).
 */
struct TransitionContext {
    std::optional<std::string> adapter;
    nlohmann::json metadata = nullptr;
    nlohmann::json parameters = nullptr;
    std::optional<int64_t> retry_count;
    std::optional<double> duration_seconds;
    std::optional<std::string> error_type;
    std::optional<std::string> error_message;
};

/**
 * Result of folding a log over an optional snapshot baseline.
 */
struct ReplayResult {
    LedgerMap states;
    uint64_t last_sequence = 0;
    double last_timestamp = 0.0;
    size_t applied = 0;
    size_t skipped = 0;           // records already covered by the snapshot
    uint64_t valid_bytes = 0;     // log prefix made of complete records
    bool torn_tail = false;       // unterminated, unparseable final line was dropped
    bool unterminated_tail = false;  // final record parsed but has no trailing newline
};

/**
 * @class DurableLedgerStore
 * @brief Single authority for "what state is document X in".
 *
 * Append-only JSONL log plus optional snapshots. Every mutation is validated
 * against the state graph, appended and fsynced before the in-memory map is
 * touched, so a crash between the two is repaired by replay on the next load.
 *
 * Thread safety: one std::shared_mutex. updateState/createSnapshot take it
 * exclusively; readers take it shared and receive copies.
 */
class DurableLedgerStore {
public:
    struct Options {
        std::chrono::seconds auto_snapshot_interval{std::chrono::hours(24)};  // 0 = never
        std::filesystem::path snapshot_dir;                                  // empty = <log>.snapshots
        size_t snapshot_retention = 7;
        bool fsync = true;
        MetricsSinkPtr metrics;                                              // null = no-op
        std::function<double()> clock;                                       // unix seconds; null = system clock
    };

    explicit DurableLedgerStore(std::filesystem::path log_path);
    DurableLedgerStore(std::filesystem::path log_path, Options options);
    ~DurableLedgerStore();

    DurableLedgerStore(const DurableLedgerStore&) = delete;
    DurableLedgerStore& operator=(const DurableLedgerStore&) = delete;

    /**
     * @brief Move @p doc_id to @p new_state and persist the audit record.
     *
     * Unseen documents start from an implicit PENDING.
     * @throws LedgerTypeError if new_state is not a declared enumerator
     * @throws InvalidStateTransition if the edge is not in the state graph
     * @throws LedgerIoError if the append or fsync fails (map left unchanged)
     */
    LedgerAuditRecord updateState(const std::string& doc_id, LedgerState new_state,
                                  const TransitionContext& context = {});

    /**
     * @brief Deprecated string-state entry point kept for historical callers.
     *
     * Logs a deprecation warning, resolves @p state through the alias table and
     * delegates to updateState(). Unknown names throw LedgerTypeError.
     */
    LedgerAuditRecord record(const std::string& doc_id, const std::string& state,
                             const TransitionContext& context = {});

    std::optional<DocumentLedgerEntry> get(const std::string& doc_id) const;
    std::optional<LedgerState> getState(const std::string& doc_id) const;

    /// All entries, or only those in @p state_filter, ordered by doc_id
    std::vector<DocumentLedgerEntry> entries(std::optional<LedgerState> state_filter = std::nullopt) const;
    std::vector<DocumentLedgerEntry> getDocumentsByState(LedgerState state) const;

    /// Most recent audit records for @p doc_id, oldest first (bounded)
    std::vector<LedgerAuditRecord> getStateHistory(const std::string& doc_id) const;

    /// Seconds in the current state, 0 for unknown documents
    double getStateDuration(const std::string& doc_id) const;

    /**
     * @brief Non-terminal documents untouched for at least @p threshold.
     * Refreshes the stuck-documents gauge per state.
     */
    std::vector<DocumentLedgerEntry> getStuckDocuments(std::chrono::seconds threshold) const;

    std::map<LedgerState, size_t> stateCounts() const;
    size_t size() const;

    /**
     * @brief Write a snapshot of the full map, then truncate the log (compaction).
     * @return Path of the new snapshot file
     */
    std::filesystem::path createSnapshot();

    /**
     * @brief Rebuild a state map from @p snapshot_path plus @p delta_path.
     * Same algorithm as startup, with no effect on any store.
     */
    static LedgerMap loadWithCompaction(const std::filesystem::path& snapshot_path,
                                        const std::filesystem::path& delta_path);

    /**
     * @brief Fold the records of @p log_path onto @p baseline.
     * With @p cut_sequence set, records at or below it (and unsequenced legacy
     * records) are skipped as already contained in the snapshot.
     * @throws LedgerCorruption on unparseable lines or invalid transitions
     */
    static ReplayResult replayLog(const std::filesystem::path& log_path, LedgerMap baseline,
                                  std::optional<uint64_t> cut_sequence);

    const std::filesystem::path& path() const { return path_; }
    const SnapshotManager& snapshots() const { return snapshots_; }

private:
    void load();
    double now() const;
    std::filesystem::path createSnapshotLocked(double now);
    void maybeSnapshotLocked(double now);
    void refreshStateGaugesLocked();
    void countError(const char* type) const;

    std::filesystem::path path_;
    Options options_;
    MetricsSinkPtr metrics_;
    SnapshotManager snapshots_;

    mutable std::shared_mutex mtx_;
    LedgerMap documents_;
    std::array<size_t, LEDGER_STATE_COUNT> state_counts_{};
    std::unique_ptr<AppendFile> log_;
    uint64_t next_sequence_ = 1;
    double last_record_timestamp_ = 0.0;
    double last_snapshot_at_ = 0.0;
};

} // namespace LedgerStream
