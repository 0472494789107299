#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace LedgerStream {

/**
 * Canonical ingestion document produced by an adapter's parse step.
 * raw keeps the upstream payload for downstream stages (null when dropped).
 */
struct Document {
    std::string doc_id;
    std::string source;
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();
    nlohmann::json raw = nullptr;

    nlohmann::json toJson() const {
        return {
            {"doc_id", doc_id},
            {"source", source},
            {"content", content},
            {"metadata", metadata},
            {"raw", raw},
        };
    }
};

} // namespace LedgerStream
