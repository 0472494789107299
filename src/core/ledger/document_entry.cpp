#include <ledgerstream/core/ledger/document_entry.hpp>
#include <ledgerstream/core/ledger/errors.hpp>
#include <algorithm>

namespace LedgerStream {

using json = nlohmann::json;

void DocumentLedgerEntry::apply(const LedgerAuditRecord& record) {
    state = record.new_state;
    updated_at = record.timestamp;
    if (record.adapter) {
        adapter = record.adapter;
    }
    if (record.metadata.is_object() && !record.metadata.empty()) {
        metadata = record.metadata;
    }
    if (record.retry_count) {
        retry_count = *record.retry_count;
    }

    if (history.size() >= MAX_HISTORY) {
        history.pop_front();
    }
    history.push_back(record);
}

double DocumentLedgerEntry::durationSeconds(double now) const {
    return std::max(0.0, now - updated_at);
}

json DocumentLedgerEntry::toJson() const {
    json records = json::array();
    for (const auto& record : history) {
        records.push_back(record.toJson());
    }
    return {
        {"state", toString(state)},
        {"updated_at", updated_at},
        {"adapter", adapter ? json(*adapter) : json(nullptr)},
        {"metadata", metadata},
        {"retry_count", retry_count},
        {"history", std::move(records)},
    };
}

DocumentLedgerEntry DocumentLedgerEntry::fromJson(const std::string& doc_id, const json& payload,
                                                  double default_updated_at) {
    if (!payload.is_object()) {
        throw LedgerCorruption("Snapshot entry for " + doc_id + " must be a JSON object");
    }

    DocumentLedgerEntry entry;
    entry.doc_id = doc_id;

    auto history = payload.find("history");
    if (history != payload.end() && history->is_array()) {
        for (const auto& item : *history) {
            if (entry.history.size() >= MAX_HISTORY) {
                entry.history.pop_front();
            }
            entry.history.push_back(LedgerAuditRecord::fromJson(item));
        }
    }

    std::optional<LedgerState> fallback;
    if (!entry.history.empty()) {
        fallback = entry.history.back().new_state;
    }
    auto state = payload.find("state");
    if (state != payload.end() && state->is_string()) {
        entry.state = parseLedgerState(state->get<std::string>(), "snapshot state for " + doc_id, fallback);
    } else if (fallback) {
        entry.state = *fallback;
    } else {
        throw LedgerCorruption("Snapshot entry for " + doc_id + " has no state");
    }

    auto updated = payload.find("updated_at");
    entry.updated_at = (updated != payload.end() && updated->is_number())
        ? updated->get<double>()
        : default_updated_at;

    auto adapter = payload.find("adapter");
    if (adapter != payload.end() && adapter->is_string()) {
        entry.adapter = adapter->get<std::string>();
    }
    auto metadata = payload.find("metadata");
    if (metadata != payload.end() && metadata->is_object()) {
        entry.metadata = *metadata;
    }
    auto retries = payload.find("retry_count");
    if (retries != payload.end() && retries->is_number_integer()) {
        entry.retry_count = retries->get<int64_t>();
    }
    return entry;
}

bool DocumentLedgerEntry::sameState(const DocumentLedgerEntry& other) const {
    return doc_id == other.doc_id &&
           state == other.state &&
           updated_at == other.updated_at &&
           adapter == other.adapter &&
           metadata == other.metadata &&
           retry_count == other.retry_count;
}

} // namespace LedgerStream
