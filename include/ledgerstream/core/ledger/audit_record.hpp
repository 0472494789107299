#pragma once
#include <ledgerstream/core/ledger/ledger_state.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace LedgerStream {

/**
 * @brief One persisted fact: doc_id moved old_state -> new_state at timestamp.
 *
 * Serialized as a single JSON line in the ledger log. States are written by
 * canonical enum name; decoding goes through parseLedgerState() so legacy
 * aliases resolve to the same values as their modern spelling.
 *
 * sequence is assigned by the store (1, 2, ...) and is what snapshots use as
 * their cut line. Records from older formats carry no sequence (0).
 */
struct LedgerAuditRecord {
    std::string doc_id;
    LedgerState old_state = LedgerState::PENDING;
    LedgerState new_state = LedgerState::PENDING;
    double timestamp = 0.0;                       // unix seconds, UTC
    std::optional<std::string> adapter;
    nlohmann::json metadata = nlohmann::json::object();
    nlohmann::json parameters = nlohmann::json::object();
    std::optional<int64_t> retry_count;
    std::optional<double> duration_seconds;
    std::optional<std::string> error_type;
    std::optional<std::string> error_message;
    uint64_t sequence = 0;

    nlohmann::json toJson() const;

    /// Throws LedgerCorruption on missing fields or unknown states
    static LedgerAuditRecord fromJson(const nlohmann::json& payload);

    /// Compact single-line encoding, no trailing newline
    std::string toLine() const;
    static LedgerAuditRecord fromLine(std::string_view line);

    bool operator==(const LedgerAuditRecord& other) const;
    bool operator!=(const LedgerAuditRecord& other) const { return !(*this == other); }
};

} // namespace LedgerStream
