#include <ledgerstream/core/adapters/jsonl_adapter.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace LedgerStream {

using json = nlohmann::json;

namespace {

class JsonlRecordStream : public RawRecordStream {
public:
    explicit JsonlRecordStream(const std::string& path) : path_(path), in_(path) {
        if (!in_.is_open()) {
            throw AdapterError("Cannot open " + path, std::nullopt, 0, false, "FetchError");
        }
    }

    std::optional<json> next() override {
        std::string line;
        while (std::getline(in_, line)) {
            ++line_no_;
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            try {
                return json::parse(line);
            } catch (const json::parse_error& e) {
                throw AdapterError(path_ + ":" + std::to_string(line_no_) + " is not valid JSON: " + e.what(),
                                   std::nullopt, 0, false, "ParseError");
            }
        }
        return std::nullopt;
    }

private:
    std::string path_;
    std::ifstream in_;
    size_t line_no_ = 0;
};

std::string requireString(const json& raw, const char* field) {
    auto it = raw.find(field);
    if (it == raw.end() || !it->is_string()) {
        throw AdapterError(std::string("record is missing string field '") + field + "'",
                           std::nullopt, 0, false, "ParseError");
    }
    return it->get<std::string>();
}

} // namespace

JsonlFileAdapter::JsonlFileAdapter(const AdapterContext& context, std::string source)
    : BaseAdapter(std::move(source), context) {}

void JsonlFileAdapter::registerWith(AdapterRegistry& registry) {
    registry.registerFactory(SOURCE, [](const AdapterContext& context, HttpClient&) -> AdapterPtr {
        return std::make_unique<JsonlFileAdapter>(context);
    });
}

RawRecordStreamPtr JsonlFileAdapter::fetch(const json& params) {
    auto path = params.find("path");
    if (path == params.end() || !path->is_string()) {
        throw AdapterError("jsonl adapter requires a string 'path' parameter", std::nullopt, 0, false,
                           "ConfigurationError");
    }
    spdlog::info("[{}] Reading {}", source(), path->get<std::string>());
    return std::make_unique<JsonlRecordStream>(path->get<std::string>());
}

Document JsonlFileAdapter::parse(const json& raw) {
    if (!raw.is_object()) {
        throw AdapterError("record must be a JSON object", std::nullopt, 0, false, "ParseError");
    }
    Document document;
    const std::string identifier = requireString(raw, "id");
    document.content = requireString(raw, "content");
    const std::string version = raw.value("version", std::string("v1"));
    document.doc_id = buildDocId(identifier, version, document.content);
    document.source = source();
    auto metadata = raw.find("metadata");
    if (metadata != raw.end() && metadata->is_object()) {
        document.metadata = *metadata;
    }
    document.metadata["identifier"] = identifier;
    document.metadata["version"] = version;
    if (raw.contains("title") && raw["title"].is_string()) {
        document.metadata["title"] = raw["title"];
    }
    document.raw = raw;
    return document;
}

void JsonlFileAdapter::validate(const Document& document) {
    if (document.content.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw AdapterError("document has empty content", document.doc_id, 0, false, "ValidationError");
    }
}

json JsonlFileAdapter::write(const Document& document) {
    return {{"content_length", document.content.size()}};
}

} // namespace LedgerStream
