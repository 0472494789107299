#pragma once
#include <ledgerstream/core/ledger/audit_record.hpp>
#include <nlohmann/json.hpp>
#include <deque>
#include <optional>
#include <string>

namespace LedgerStream {

/**
 * @struct DocumentLedgerEntry
 * @brief Latest known state of one document, folded from its audit records.
 *
 * Never stored on its own: it is rebuilt from the log (and snapshot) on load.
 * history keeps only the most recent MAX_HISTORY records (ring buffer), older
 * transitions remain in earlier snapshots and logs.
 */
struct DocumentLedgerEntry {
    static constexpr size_t MAX_HISTORY = 32;

    std::string doc_id;
    LedgerState state = LedgerState::PENDING;
    double updated_at = 0.0;                 // unix seconds, UTC
    std::optional<std::string> adapter;
    nlohmann::json metadata = nlohmann::json::object();
    int64_t retry_count = 0;
    std::deque<LedgerAuditRecord> history;

    /**
     * @brief Fold one record into this entry.
     * Metadata is replaced only by non-empty metadata; adapter and retry_count
     * only when the record carries them.
     */
    void apply(const LedgerAuditRecord& record);

    /// Seconds spent in the current state as of @p now (unix seconds)
    double durationSeconds(double now) const;

    /// Snapshot encoding (includes bounded history)
    nlohmann::json toJson() const;
    static DocumentLedgerEntry fromJson(const std::string& doc_id, const nlohmann::json& payload,
                                        double default_updated_at);

    /// Compares current state only (history excluded)
    bool sameState(const DocumentLedgerEntry& other) const;
};

} // namespace LedgerStream
