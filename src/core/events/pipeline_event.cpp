#include <ledgerstream/core/events/pipeline_event.hpp>
#include <iomanip>
#include <random>
#include <sstream>

namespace LedgerStream {

using json = nlohmann::json;

namespace {

template <typename T>
json optionalJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

const char* eventTypeName(const PipelineEvent& event) {
    return std::visit(overloaded{
        [](const DocumentStarted&) { return "DocumentStarted"; },
        [](const DocumentCompleted&) { return "DocumentCompleted"; },
        [](const DocumentFailed&) { return "DocumentFailed"; },
        [](const AdapterStateChange&) { return "AdapterStateChange"; },
        [](const BatchProgress&) { return "BatchProgress"; },
        [](const AdapterRetry&) { return "AdapterRetry"; },
    }, event.payload);
}

json eventToJson(const PipelineEvent& event) {
    json payload = std::visit(overloaded{
        [](const DocumentStarted& e) -> json {
            return {{"doc_id", e.doc_id}, {"adapter", e.adapter}, {"parameters", e.parameters}};
        },
        [](const DocumentCompleted& e) -> json {
            return {{"document", e.document.toJson()},
                    {"duration", e.duration},
                    {"adapter_metadata", e.adapter_metadata}};
        },
        [](const DocumentFailed& e) -> json {
            return {{"doc_id", optionalJson(e.doc_id)},
                    {"error", e.error},
                    {"retry_count", e.retry_count},
                    {"is_retryable", e.is_retryable},
                    {"error_type", e.error_type}};
        },
        [](const AdapterStateChange& e) -> json {
            return {{"adapter", e.adapter},
                    {"old_state", e.old_state},
                    {"new_state", e.new_state},
                    {"reason", optionalJson(e.reason)}};
        },
        [](const BatchProgress& e) -> json {
            return {{"completed_count", e.completed_count},
                    {"failed_count", e.failed_count},
                    {"in_flight_count", e.in_flight_count},
                    {"queue_depth", e.queue_depth},
                    {"buffer_size", e.buffer_size},
                    {"remaining", optionalJson(e.remaining)},
                    {"eta_seconds", optionalJson(e.eta_seconds)},
                    {"backpressure_wait_seconds", e.backpressure_wait_seconds},
                    {"backpressure_wait_count", e.backpressure_wait_count},
                    {"checkpoint_doc_ids", e.checkpoint_doc_ids},
                    {"is_checkpoint", e.is_checkpoint}};
        },
        [](const AdapterRetry& e) -> json {
            return {{"adapter", e.adapter},
                    {"attempt", e.attempt},
                    {"error", e.error},
                    {"status_code", optionalJson(e.status_code)}};
        },
    }, event.payload);

    payload["type"] = eventTypeName(event);
    payload["timestamp"] = event.timestamp;
    payload["pipeline_id"] = event.pipeline_id;
    return payload;
}

bool errorsOnly(const PipelineEvent& event) {
    return event.is<DocumentFailed>();
}

bool progressOnly(const PipelineEvent& event) {
    return event.is<BatchProgress>();
}

std::string buildPipelineId(const std::string& source) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream id;
    id << source << ':' << std::hex << std::setfill('0')
       << std::setw(16) << rng() << std::setw(16) << rng();
    return id.str();
}

} // namespace LedgerStream
