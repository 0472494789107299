#include <ledgerstream/core/ledger/audit_record.hpp>
#include <ledgerstream/core/ledger/errors.hpp>

namespace LedgerStream {

using json = nlohmann::json;

namespace {

std::optional<std::string> optionalString(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    return it->dump();
}

std::optional<double> optionalDouble(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) return std::nullopt;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<int64_t> optionalInt(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) return std::nullopt;
    if (it->is_boolean()) return it->get<bool>() ? 1 : 0;
    if (it->is_number_integer()) return it->get<int64_t>();
    if (it->is_number()) return static_cast<int64_t>(it->get<double>());
    if (it->is_string()) {
        try {
            return std::stoll(it->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// Non-object values are dropped rather than failing the whole record
json objectOrEmpty(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_object()) return json::object();
    return *it;
}

std::string requireStateToken(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        throw LedgerCorruption(std::string("Ledger audit record has invalid ") + key);
    }
    return it->get<std::string>();
}

} // namespace

json LedgerAuditRecord::toJson() const {
    json payload = {
        {"doc_id", doc_id},
        {"old_state", toString(old_state)},
        {"new_state", toString(new_state)},
        {"timestamp", timestamp},
        {"adapter", adapter ? json(*adapter) : json(nullptr)},
        {"metadata", metadata},
        {"parameters", parameters},
    };
    if (retry_count) payload["retry_count"] = *retry_count;
    if (duration_seconds) payload["duration_seconds"] = *duration_seconds;
    if (error_type) payload["error_type"] = *error_type;
    if (error_message) payload["error_message"] = *error_message;
    if (sequence > 0) payload["sequence"] = sequence;
    return payload;
}

LedgerAuditRecord LedgerAuditRecord::fromJson(const json& payload) {
    if (!payload.is_object()) {
        throw LedgerCorruption("Ledger audit record must be a JSON object");
    }
    auto doc = payload.find("doc_id");
    if (doc == payload.end() || doc->is_null()) {
        throw LedgerCorruption("Ledger audit record is missing doc_id");
    }

    LedgerAuditRecord record;
    record.doc_id = doc->is_string() ? doc->get<std::string>() : doc->dump();
    if (record.doc_id.empty()) {
        throw LedgerCorruption("Ledger audit record has empty doc_id");
    }

    record.new_state = parseLedgerState(requireStateToken(payload, "new_state"), "audit new_state");
    record.old_state = parseLedgerState(requireStateToken(payload, "old_state"), "audit old_state",
                                        record.new_state);

    record.timestamp = optionalDouble(payload, "timestamp").value_or(0.0);
    record.adapter = optionalString(payload, "adapter");
    record.metadata = objectOrEmpty(payload, "metadata");
    record.parameters = objectOrEmpty(payload, "parameters");
    record.retry_count = optionalInt(payload, "retry_count");
    record.duration_seconds = optionalDouble(payload, "duration_seconds");
    record.error_type = optionalString(payload, "error_type");
    record.error_message = optionalString(payload, "error_message");

    auto seq = optionalInt(payload, "sequence");
    record.sequence = (seq && *seq > 0) ? static_cast<uint64_t>(*seq) : 0;
    return record;
}

std::string LedgerAuditRecord::toLine() const {
    return toJson().dump();
}

LedgerAuditRecord LedgerAuditRecord::fromLine(std::string_view line) {
    json payload;
    try {
        payload = json::parse(line.begin(), line.end());
    } catch (const json::parse_error& e) {
        throw LedgerCorruption(std::string("Ledger JSONL line is malformed: ") + e.what());
    }
    return fromJson(payload);
}

bool LedgerAuditRecord::operator==(const LedgerAuditRecord& other) const {
    return doc_id == other.doc_id &&
           old_state == other.old_state &&
           new_state == other.new_state &&
           timestamp == other.timestamp &&
           adapter == other.adapter &&
           metadata == other.metadata &&
           parameters == other.parameters &&
           retry_count == other.retry_count &&
           duration_seconds == other.duration_seconds &&
           error_type == other.error_type &&
           error_message == other.error_message &&
           sequence == other.sequence;
}

} // namespace LedgerStream
