#pragma once
#include <ledgerstream/core/ledger/document_entry.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace LedgerStream {

using LedgerMap = std::unordered_map<std::string, DocumentLedgerEntry>;

struct SnapshotData {
    std::filesystem::path path;
    double created_at = 0.0;
    uint64_t cut_sequence = 0;    // last record sequence folded into this snapshot
    double cut_timestamp = 0.0;   // timestamp of that record
    LedgerMap states;
};

/**
 * @class SnapshotManager
 * @brief Writes, discovers, loads and prunes ledger snapshots.
 *
 * Layout for a log at <log>:
 *   <snapshot_dir>/snapshot-<cut_sequence:020>-<yyyymmddTHHMMSSZ>.json
 *   <log>.snapshot   pointer {"version","snapshot","cut_sequence"}
 *
 * The pointer stores the snapshot file name only; it is resolved against
 * snapshot_dir when read.
 *
 * The pointer is replaced atomically only after the snapshot file is durable,
 * so it always names a complete snapshot. Without a pointer the newest file in
 * snapshot_dir (by name) is used.
 */
class SnapshotManager {
public:
    static constexpr const char* VERSION = "1.0";

    SnapshotManager(std::filesystem::path log_path,
                    std::filesystem::path snapshot_dir,
                    size_t retention);

    static std::filesystem::path defaultSnapshotDir(const std::filesystem::path& log_path);
    static std::filesystem::path pointerPath(const std::filesystem::path& log_path);

    /**
     * @brief Durably write @p states and repoint the log at the new file.
     * @return Path of the snapshot written
     */
    std::filesystem::path write(const LedgerMap& states, uint64_t cut_sequence,
                                double cut_timestamp, double created_at);

    /// Latest snapshot per the pointer (or directory fallback), if any
    std::optional<std::filesystem::path> latest() const;

    /// Remove snapshots beyond retention, never the one the pointer names
    void prune();

    /// Parse a snapshot file; throws LedgerCorruption on bad content
    static SnapshotData load(const std::filesystem::path& snapshot_path);

    std::vector<std::filesystem::path> list() const;

private:
    std::filesystem::path log_path_;
    std::filesystem::path snapshot_dir_;
    size_t retention_;
};

} // namespace LedgerStream
