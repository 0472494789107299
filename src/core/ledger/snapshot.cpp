#include <ledgerstream/core/ledger/snapshot.hpp>
#include <ledgerstream/core/ledger/errors.hpp>
#include <ledgerstream/core/utils/file_sync.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace LedgerStream {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* SNAPSHOT_PREFIX = "snapshot-";
constexpr const char* SNAPSHOT_SUFFIX = ".json";

std::string utcStamp(double unix_seconds) {
    std::time_t t = static_cast<std::time_t>(std::floor(unix_seconds));
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

std::string snapshotFileName(uint64_t cut_sequence, double created_at) {
    std::ostringstream name;
    name << SNAPSHOT_PREFIX << std::setw(20) << std::setfill('0') << cut_sequence
         << '-' << utcStamp(created_at) << SNAPSHOT_SUFFIX;
    return name.str();
}

bool isSnapshotFile(const fs::path& p) {
    const std::string name = p.filename().string();
    return name.rfind(SNAPSHOT_PREFIX, 0) == 0 &&
           name.size() > std::string(SNAPSHOT_SUFFIX).size() &&
           name.compare(name.size() - 5, 5, SNAPSHOT_SUFFIX) == 0;
}

json readJsonFile(const fs::path& path, const char* what) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw LedgerCorruption(std::string("Cannot open ") + what + " " + path.string());
    }
    try {
        json payload;
        in >> payload;
        return payload;
    } catch (const json::exception& e) {
        throw LedgerCorruption(std::string(what) + " " + path.string() + " is malformed: " + e.what());
    }
}

} // namespace

SnapshotManager::SnapshotManager(fs::path log_path, fs::path snapshot_dir, size_t retention)
    : log_path_(std::move(log_path)),
      snapshot_dir_(snapshot_dir.empty() ? defaultSnapshotDir(log_path_) : std::move(snapshot_dir)),
      retention_(std::max<size_t>(retention, 1)) {}

fs::path SnapshotManager::defaultSnapshotDir(const fs::path& log_path) {
    fs::path dir = log_path;
    dir += ".snapshots";
    return dir;
}

fs::path SnapshotManager::pointerPath(const fs::path& log_path) {
    fs::path pointer = log_path;
    pointer += ".snapshot";
    return pointer;
}

fs::path SnapshotManager::write(const LedgerMap& states, uint64_t cut_sequence,
                                double cut_timestamp, double created_at) {
    std::error_code ec;
    fs::create_directories(snapshot_dir_, ec);
    if (ec) {
        throw LedgerIoError("Cannot create snapshot directory " + snapshot_dir_.string() + ": " + ec.message());
    }

    json encoded = json::object();
    for (const auto& [doc_id, entry] : states) {
        encoded[doc_id] = entry.toJson();
    }
    json payload = {
        {"version", VERSION},
        {"created_at", created_at},
        {"document_count", states.size()},
        {"cut_sequence", cut_sequence},
        {"cut_timestamp", cut_timestamp},
        {"states", std::move(encoded)},
    };

    fs::path snapshot_path = snapshot_dir_ / snapshotFileName(cut_sequence, created_at);
    FileSync::atomicWrite(snapshot_path, payload.dump());

    json pointer = {
        {"version", VERSION},
        {"snapshot", snapshot_path.filename().string()},
        {"cut_sequence", cut_sequence},
    };
    FileSync::atomicWrite(pointerPath(log_path_), pointer.dump());

    spdlog::info("[SnapshotManager] Wrote snapshot {} ({} documents, cut_sequence={})",
                 snapshot_path.string(), states.size(), cut_sequence);
    return snapshot_path;
}

std::vector<fs::path> SnapshotManager::list() const {
    std::vector<fs::path> snapshots;
    std::error_code ec;
    if (!fs::is_directory(snapshot_dir_, ec)) {
        return snapshots;
    }
    for (const auto& item : fs::directory_iterator(snapshot_dir_, ec)) {
        if (item.is_regular_file() && isSnapshotFile(item.path())) {
            snapshots.push_back(item.path());
        }
    }
    std::sort(snapshots.begin(), snapshots.end());
    return snapshots;
}

std::optional<fs::path> SnapshotManager::latest() const {
    const fs::path pointer = pointerPath(log_path_);
    std::error_code ec;
    if (fs::exists(pointer, ec)) {
        json payload = readJsonFile(pointer, "snapshot pointer");
        auto target = payload.find("snapshot");
        if (!payload.is_object() || target == payload.end() || !target->is_string()) {
            throw LedgerCorruption("Snapshot pointer " + pointer.string() + " does not name a snapshot");
        }
        // Resolved against snapshot_dir so a relocated ledger directory still opens
        fs::path snapshot_path = snapshot_dir_ / fs::path(target->get<std::string>()).filename();
        if (!fs::exists(snapshot_path, ec)) {
            throw LedgerCorruption("Snapshot pointer names missing file " + snapshot_path.string());
        }
        return snapshot_path;
    }

    auto snapshots = list();
    if (snapshots.empty()) {
        return std::nullopt;
    }
    spdlog::warn("[SnapshotManager] No pointer file, falling back to newest snapshot {}",
                 snapshots.back().string());
    return snapshots.back();
}

void SnapshotManager::prune() {
    auto snapshots = list();
    if (snapshots.size() <= retention_) {
        return;
    }

    std::optional<fs::path> current;
    try {
        current = latest();
    } catch (const LedgerCorruption& e) {
        spdlog::warn("[SnapshotManager] Skipping prune, pointer unreadable: {}", e.what());
        return;
    }

    size_t excess = snapshots.size() - retention_;
    for (size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        if (current && fs::equivalent(snapshots[i], *current, ec)) {
            continue;
        }
        fs::remove(snapshots[i], ec);
        if (ec) {
            spdlog::warn("[SnapshotManager] Failed to remove old snapshot {}: {}",
                         snapshots[i].string(), ec.message());
        } else {
            spdlog::debug("[SnapshotManager] Pruned snapshot {}", snapshots[i].string());
        }
    }
}

SnapshotData SnapshotManager::load(const fs::path& snapshot_path) {
    json payload = readJsonFile(snapshot_path, "snapshot");
    if (!payload.is_object()) {
        throw LedgerCorruption("Snapshot must be a JSON object: " + snapshot_path.string());
    }
    auto version = payload.find("version");
    if (version == payload.end() || !version->is_string() || version->get<std::string>() != VERSION) {
        throw LedgerCorruption("Unsupported snapshot version in " + snapshot_path.string());
    }

    SnapshotData data;
    data.path = snapshot_path;
    try {
        data.created_at = payload.value("created_at", 0.0);
        data.cut_sequence = payload.value("cut_sequence", static_cast<uint64_t>(0));
        data.cut_timestamp = payload.value("cut_timestamp", 0.0);
    } catch (const json::type_error& e) {
        throw LedgerCorruption("Snapshot header in " + snapshot_path.string() + " is malformed: " + e.what());
    }

    auto states = payload.find("states");
    if (states == payload.end() || !states->is_object()) {
        throw LedgerCorruption("Snapshot states must be a mapping: " + snapshot_path.string());
    }
    data.states.reserve(states->size());
    for (auto it = states->begin(); it != states->end(); ++it) {
        data.states.emplace(it.key(), DocumentLedgerEntry::fromJson(it.key(), it.value(), data.created_at));
    }
    return data;
}

} // namespace LedgerStream
