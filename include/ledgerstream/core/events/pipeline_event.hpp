#pragma once
#include <ledgerstream/core/events/document.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace LedgerStream {

// ============================================================================
// EVENT PAYLOADS
// ============================================================================

struct DocumentStarted {
    std::string doc_id;
    std::string adapter;
    nlohmann::json parameters = nlohmann::json::object();
};

struct DocumentCompleted {
    Document document;
    double duration = 0.0;                                    // wall seconds for this document
    nlohmann::json adapter_metadata = nlohmann::json::object();
};

struct DocumentFailed {
    std::optional<std::string> doc_id;                        // unknown when parsing failed
    std::string error;
    int64_t retry_count = 0;
    bool is_retryable = false;
    std::string error_type;
};

/// Adapter lifecycle, not LedgerState: initialising, ready, invocation_started, ...
struct AdapterStateChange {
    std::string adapter;
    std::string old_state;
    std::string new_state;
    std::optional<std::string> reason;
};

struct BatchProgress {
    int64_t completed_count = 0;
    int64_t failed_count = 0;
    int64_t in_flight_count = 0;
    int64_t queue_depth = 0;
    int64_t buffer_size = 0;
    std::optional<int64_t> remaining;                         // only with total_estimated
    std::optional<double> eta_seconds;
    double backpressure_wait_seconds = 0.0;
    int64_t backpressure_wait_count = 0;
    std::vector<std::string> checkpoint_doc_ids;
    bool is_checkpoint = false;
};

/// Adapter-emitted: an upstream request is being retried
struct AdapterRetry {
    std::string adapter;
    int attempt = 0;
    std::string error;
    std::optional<int> status_code;
};

using EventPayload = std::variant<DocumentStarted, DocumentCompleted, DocumentFailed,
                                  AdapterStateChange, BatchProgress, AdapterRetry>;

/**
 * @struct PipelineEvent
 * @brief One immutable entry of the orchestrator's event stream.
 *
 * timestamp is unix seconds; pipeline_id identifies one streamEvents() call
 * ("<source>:<32 hex>").
 */
struct PipelineEvent {
    double timestamp = 0.0;
    std::string pipeline_id;
    EventPayload payload;

    template <typename T>
    bool is() const { return std::holds_alternative<T>(payload); }

    template <typename T>
    const T* as() const { return std::get_if<T>(&payload); }

    template <typename T>
    T* as() { return std::get_if<T>(&payload); }
};

/// Return false to drop the event before it is queued
using EventFilter = std::function<bool(const PipelineEvent&)>;

/// Return std::nullopt to drop the event, otherwise the (possibly rewritten) event
using EventTransformer = std::function<std::optional<PipelineEvent>(PipelineEvent)>;

/// Callback adapters use to push their own events into the stream
using EventEmitter = std::function<void(PipelineEvent)>;

/// "DocumentStarted", "BatchProgress", ... (also the metrics label)
const char* eventTypeName(const PipelineEvent& event);

/// JSON encoding with a "type" discriminator; DocumentCompleted embeds the document record
nlohmann::json eventToJson(const PipelineEvent& event);

bool errorsOnly(const PipelineEvent& event);
bool progressOnly(const PipelineEvent& event);

/// "<source>:<random 128-bit hex>"
std::string buildPipelineId(const std::string& source);

} // namespace LedgerStream
