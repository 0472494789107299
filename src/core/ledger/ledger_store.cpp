#include <ledgerstream/core/ledger/ledger_store.hpp>
#include <ledgerstream/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace LedgerStream {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

json objectOrEmpty(const json& value, const char* field) {
    if (value.is_null()) {
        return json::object();
    }
    if (!value.is_object()) {
        throw LedgerTypeError(std::string(field) + " must be a JSON object");
    }
    return value;
}

std::vector<DocumentLedgerEntry> sortedById(std::vector<DocumentLedgerEntry> docs) {
    std::sort(docs.begin(), docs.end(),
              [](const DocumentLedgerEntry& a, const DocumentLedgerEntry& b) { return a.doc_id < b.doc_id; });
    return docs;
}

} // namespace

DurableLedgerStore::DurableLedgerStore(fs::path log_path)
    : DurableLedgerStore(std::move(log_path), Options{}) {}

DurableLedgerStore::DurableLedgerStore(fs::path log_path, Options options)
    : path_(std::move(log_path)),
      options_(std::move(options)),
      metrics_(options_.metrics ? options_.metrics : std::make_shared<NoopMetricsSink>()),
      snapshots_(path_, options_.snapshot_dir, options_.snapshot_retention) {
    load();
}

DurableLedgerStore::~DurableLedgerStore() = default;

// ============================================================================
// LOAD / REPLAY
// ============================================================================

ReplayResult DurableLedgerStore::replayLog(const fs::path& log_path, LedgerMap baseline,
                                           std::optional<uint64_t> cut_sequence) {
    ReplayResult result;
    result.states = std::move(baseline);
    if (cut_sequence) {
        result.last_sequence = *cut_sequence;
    }

    std::error_code ec;
    if (!fs::exists(log_path, ec)) {
        return result;
    }
    std::ifstream in(log_path, std::ios::binary);
    if (!in.is_open()) {
        throw LedgerIoError("Cannot open ledger log " + log_path.string());
    }

    std::string line;
    uint64_t offset = 0;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const bool terminated = !in.eof();
        const uint64_t next_offset = offset + line.size() + (terminated ? 1 : 0);

        if (isBlank(line)) {
            offset = next_offset;
            if (terminated) {
                result.valid_bytes = offset;
            }
            continue;
        }

        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            if (!terminated) {
                // Crash during an append that was never acknowledged
                spdlog::warn("[DurableLedgerStore] Ignoring torn final record at {}:{} ({} bytes)",
                             log_path.string(), line_no, line.size());
                result.torn_tail = true;
                break;
            }
            throw LedgerCorruption("Ledger " + log_path.string() + " line " +
                                   std::to_string(line_no) + " is malformed: " + e.what());
        }

        // A complete JSON value is never a torn write, even on the final line
        LedgerAuditRecord record;
        try {
            record = LedgerAuditRecord::fromJson(payload);
        } catch (const LedgerCorruption& e) {
            throw LedgerCorruption("Ledger " + log_path.string() + " line " +
                                   std::to_string(line_no) + " is malformed: " + e.what());
        }

        offset = next_offset;
        result.valid_bytes = offset;
        result.unterminated_tail = !terminated;

        if (cut_sequence && (record.sequence == 0 || record.sequence <= *cut_sequence)) {
            ++result.skipped;
            continue;
        }

        auto it = result.states.find(record.doc_id);
        const bool bootstrap = it == result.states.end() && record.old_state == record.new_state;
        if (!bootstrap) {
            try {
                validateTransition(record.old_state, record.new_state);
            } catch (const InvalidStateTransition& e) {
                throw LedgerCorruption("Ledger " + log_path.string() + " line " +
                                       std::to_string(line_no) + " has an invalid transition for " +
                                       record.doc_id + ": " + e.what());
            }
        }

        if (it == result.states.end()) {
            DocumentLedgerEntry entry;
            entry.doc_id = record.doc_id;
            entry.state = record.old_state;
            it = result.states.emplace(record.doc_id, std::move(entry)).first;
        }
        it->second.apply(record);

        result.last_sequence = std::max(result.last_sequence, record.sequence);
        result.last_timestamp = record.timestamp;
        ++result.applied;
    }
    return result;
}

LedgerMap DurableLedgerStore::loadWithCompaction(const fs::path& snapshot_path,
                                                 const fs::path& delta_path) {
    SnapshotData snapshot = SnapshotManager::load(snapshot_path);
    return replayLog(delta_path, std::move(snapshot.states), snapshot.cut_sequence).states;
}

void DurableLedgerStore::load() {
    const uint64_t start_ns = Clock::now_ns();
    const char* method = "full";

    LedgerMap baseline;
    std::optional<uint64_t> cut;
    double cut_timestamp = 0.0;
    if (auto latest = snapshots_.latest()) {
        SnapshotData snapshot = SnapshotManager::load(*latest);
        baseline = std::move(snapshot.states);
        cut = snapshot.cut_sequence;
        cut_timestamp = snapshot.cut_timestamp;
        last_snapshot_at_ = snapshot.created_at;
        method = "snapshot";
        spdlog::info("[DurableLedgerStore] Loaded snapshot {} ({} documents, cut_sequence={})",
                     latest->string(), baseline.size(), snapshot.cut_sequence);
    }

    ReplayResult result = replayLog(path_, std::move(baseline), cut);

    log_ = std::make_unique<AppendFile>(path_);
    if (result.torn_tail) {
        log_->truncate(result.valid_bytes);
        countError("torn_tail");
    } else if (result.unterminated_tail) {
        // Complete final record without its newline; terminate it before appending
        log_->append("\n");
        log_->sync();
    }

    documents_ = std::move(result.states);
    next_sequence_ = result.last_sequence + 1;
    last_record_timestamp_ = result.applied > 0 ? result.last_timestamp : cut_timestamp;

    state_counts_.fill(0);
    for (const auto& [doc_id, entry] : documents_) {
        ++state_counts_[static_cast<size_t>(entry.state)];
    }
    refreshStateGaugesLocked();

    const double elapsed = Clock::elapsed_seconds(start_ns);
    metrics_->incrementCounter(MetricNames::LEDGER_INIT, {{"method", method}});
    metrics_->observeSeconds(MetricNames::LEDGER_INIT_SECONDS, {}, elapsed);

    spdlog::info("[DurableLedgerStore] Opened {} via {} load: {} documents, {} records replayed, "
                 "{} skipped, {:.3f}s",
                 path_.string(), method, documents_.size(), result.applied, result.skipped, elapsed);
}

// ============================================================================
// MUTATIONS
// ============================================================================

LedgerAuditRecord DurableLedgerStore::updateState(const std::string& doc_id, LedgerState new_state,
                                                  const TransitionContext& context) {
    if (!isDeclaredState(new_state)) {
        countError("type_error");
        throw LedgerTypeError("new_state must be a LedgerState, got value " +
                              std::to_string(static_cast<int>(new_state)));
    }

    std::unique_lock<std::shared_mutex> lock(mtx_);

    auto it = documents_.find(doc_id);
    const bool known = it != documents_.end();
    const LedgerState old_state = known ? it->second.state : LedgerState::PENDING;

    try {
        validateTransition(old_state, new_state);
    } catch (const InvalidStateTransition& e) {
        countError("invalid_transition");
        spdlog::error("[DurableLedgerStore] Rejected transition for {}: {}", doc_id, e.what());
        throw;
    }

    const double now = this->now();

    LedgerAuditRecord record;
    record.doc_id = doc_id;
    record.old_state = old_state;
    record.new_state = new_state;
    record.timestamp = now;
    record.adapter = context.adapter;
    record.metadata = objectOrEmpty(context.metadata, "metadata");
    record.parameters = objectOrEmpty(context.parameters, "parameters");
    record.retry_count = context.retry_count;
    record.duration_seconds = context.duration_seconds;
    if (!record.duration_seconds && known) {
        record.duration_seconds = it->second.durationSeconds(now);
    }
    record.error_type = context.error_type;
    record.error_message = context.error_message;
    record.sequence = next_sequence_;

    const uint64_t size_before = log_->size();
    try {
        log_->append(record.toLine() + "\n");
        if (options_.fsync) {
            log_->sync();
        }
    } catch (const LedgerIoError& e) {
        countError("io");
        spdlog::error("[DurableLedgerStore] Failed to persist {} {} -> {}: {}",
                      doc_id, toString(old_state), toString(new_state), e.what());
        try {
            log_->truncate(size_before);
        } catch (const LedgerIoError& rollback) {
            spdlog::error("[DurableLedgerStore] Could not roll back partial append: {}", rollback.what());
        }
        throw;
    }

    ++next_sequence_;
    last_record_timestamp_ = now;

    if (!known) {
        DocumentLedgerEntry entry;
        entry.doc_id = doc_id;
        it = documents_.emplace(doc_id, std::move(entry)).first;
    } else {
        --state_counts_[static_cast<size_t>(old_state)];
    }
    it->second.apply(record);
    ++state_counts_[static_cast<size_t>(new_state)];

    metrics_->incrementCounter(MetricNames::LEDGER_TRANSITIONS,
                               {{"from", toString(old_state)}, {"to", toString(new_state)}});
    if (record.duration_seconds) {
        metrics_->observeSeconds(MetricNames::LEDGER_STATE_SECONDS,
                                 {{"state", toString(old_state)}}, *record.duration_seconds);
    }
    metrics_->setGauge(MetricNames::LEDGER_DOCUMENTS_BY_STATE, {{"state", toString(old_state)}},
                       static_cast<int64_t>(state_counts_[static_cast<size_t>(old_state)]));
    metrics_->setGauge(MetricNames::LEDGER_DOCUMENTS_BY_STATE, {{"state", toString(new_state)}},
                       static_cast<int64_t>(state_counts_[static_cast<size_t>(new_state)]));

    spdlog::debug("[DurableLedgerStore] {} {} -> {} (seq={})",
                  doc_id, toString(old_state), toString(new_state), record.sequence);

    maybeSnapshotLocked(now);
    return record;
}

LedgerAuditRecord DurableLedgerStore::record(const std::string& doc_id, const std::string& state,
                                             const TransitionContext& context) {
    spdlog::warn("[DurableLedgerStore] record() with a state name is deprecated, use updateState() "
                 "(doc_id={}, state='{}')", doc_id, state);
    LedgerState resolved;
    try {
        resolved = parseLedgerState(state, "state argument");
    } catch (const LedgerCorruption& e) {
        countError("type_error");
        throw LedgerTypeError(e.what());
    }
    return updateState(doc_id, resolved, context);
}

fs::path DurableLedgerStore::createSnapshot() {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    return createSnapshotLocked(now());
}

fs::path DurableLedgerStore::createSnapshotLocked(double now) {
    const uint64_t cut_sequence = next_sequence_ - 1;
    fs::path snapshot_path = snapshots_.write(documents_, cut_sequence, last_record_timestamp_, now);
    snapshots_.prune();
    log_->truncate(0);
    last_snapshot_at_ = now;
    metrics_->incrementCounter(MetricNames::LEDGER_SNAPSHOTS);
    spdlog::info("[DurableLedgerStore] Compacted {} into {} ({} documents)",
                 path_.string(), snapshot_path.string(), documents_.size());
    return snapshot_path;
}

void DurableLedgerStore::maybeSnapshotLocked(double now) {
    if (options_.auto_snapshot_interval.count() <= 0) {
        return;
    }
    if (last_snapshot_at_ <= 0.0) {
        last_snapshot_at_ = now;
        return;
    }
    if (now - last_snapshot_at_ < static_cast<double>(options_.auto_snapshot_interval.count())) {
        return;
    }
    // The transition is already durable; a failed housekeeping snapshot must not fail it
    try {
        createSnapshotLocked(now);
    } catch (const LedgerError& e) {
        countError("snapshot");
        spdlog::error("[DurableLedgerStore] Automatic snapshot failed: {}", e.what());
    }
}

// ============================================================================
// READS
// ============================================================================

std::optional<DocumentLedgerEntry> DurableLedgerStore::get(const std::string& doc_id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = documents_.find(doc_id);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<LedgerState> DurableLedgerStore::getState(const std::string& doc_id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = documents_.find(doc_id);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::vector<DocumentLedgerEntry> DurableLedgerStore::entries(std::optional<LedgerState> state_filter) const {
    std::vector<DocumentLedgerEntry> result;
    {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        result.reserve(state_filter ? state_counts_[static_cast<size_t>(*state_filter)] : documents_.size());
        for (const auto& [doc_id, entry] : documents_) {
            if (!state_filter || entry.state == *state_filter) {
                result.push_back(entry);
            }
        }
    }
    return sortedById(std::move(result));
}

std::vector<DocumentLedgerEntry> DurableLedgerStore::getDocumentsByState(LedgerState state) const {
    return entries(state);
}

std::vector<LedgerAuditRecord> DurableLedgerStore::getStateHistory(const std::string& doc_id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = documents_.find(doc_id);
    if (it == documents_.end()) {
        return {};
    }
    return {it->second.history.begin(), it->second.history.end()};
}

double DurableLedgerStore::getStateDuration(const std::string& doc_id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = documents_.find(doc_id);
    if (it == documents_.end()) {
        return 0.0;
    }
    return it->second.durationSeconds(now());
}

std::vector<DocumentLedgerEntry> DurableLedgerStore::getStuckDocuments(std::chrono::seconds threshold) const {
    std::vector<DocumentLedgerEntry> stuck;
    std::array<int64_t, LEDGER_STATE_COUNT> per_state{};
    {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        const double now = this->now();
        const double limit = static_cast<double>(threshold.count());
        for (const auto& [doc_id, entry] : documents_) {
            if (isTerminalState(entry.state)) {
                continue;
            }
            if (entry.durationSeconds(now) >= limit) {
                stuck.push_back(entry);
                ++per_state[static_cast<size_t>(entry.state)];
            }
        }
    }

    for (LedgerState state : allLedgerStates()) {
        metrics_->setGauge(MetricNames::LEDGER_STUCK, {{"state", toString(state)}},
                           per_state[static_cast<size_t>(state)]);
    }
    if (!stuck.empty()) {
        spdlog::warn("[DurableLedgerStore] {} stuck documents (threshold {}s)",
                     stuck.size(), threshold.count());
    }
    return sortedById(std::move(stuck));
}

std::map<LedgerState, size_t> DurableLedgerStore::stateCounts() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    std::map<LedgerState, size_t> counts;
    for (LedgerState state : allLedgerStates()) {
        counts[state] = state_counts_[static_cast<size_t>(state)];
    }
    return counts;
}

size_t DurableLedgerStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return documents_.size();
}

// ============================================================================
// HELPERS
// ============================================================================

double DurableLedgerStore::now() const {
    return options_.clock ? options_.clock() : Clock::unix_seconds();
}

void DurableLedgerStore::refreshStateGaugesLocked() {
    for (LedgerState state : allLedgerStates()) {
        metrics_->setGauge(MetricNames::LEDGER_DOCUMENTS_BY_STATE, {{"state", toString(state)}},
                           static_cast<int64_t>(state_counts_[static_cast<size_t>(state)]));
    }
}

void DurableLedgerStore::countError(const char* type) const {
    metrics_->incrementCounter(MetricNames::LEDGER_ERRORS, {{"type", type}});
}

} // namespace LedgerStream
