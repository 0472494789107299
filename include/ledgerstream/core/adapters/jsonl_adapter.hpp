#pragma once
#include <ledgerstream/core/adapters/base_adapter.hpp>
#include <ledgerstream/core/adapters/registry.hpp>

namespace LedgerStream {

/**
 * @class JsonlFileAdapter
 * @brief Ingests records from a local JSON Lines export.
 *
 * Invocation params: {"path": "<file>"}. Each line is an object with
 * "id" and "content" (strings), optional "version" (default "v1"),
 * "title" and "metadata".
 */
class JsonlFileAdapter : public BaseAdapter {
public:
    static constexpr const char* SOURCE = "jsonl";

    explicit JsonlFileAdapter(const AdapterContext& context, std::string source = SOURCE);

    /// Register under SOURCE in @p registry
    static void registerWith(AdapterRegistry& registry);

protected:
    RawRecordStreamPtr fetch(const nlohmann::json& params) override;
    Document parse(const nlohmann::json& raw) override;
    void validate(const Document& document) override;
    nlohmann::json write(const Document& document) override;
};

} // namespace LedgerStream
