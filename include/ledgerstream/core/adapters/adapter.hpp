#pragma once
#include <ledgerstream/core/events/document.hpp>
#include <ledgerstream/core/events/pipeline_event.hpp>
#include <ledgerstream/core/ledger/ledger_state.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace LedgerStream {

class DurableLedgerStore;

/// What every adapter is bound to: the shared ledger
struct AdapterContext {
    DurableLedgerStore& ledger;
};

struct IngestionResult {
    Document document;
    LedgerState state = LedgerState::COMPLETED;
    double timestamp = 0.0;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @class AdapterError
 * @brief Failure raised from a result stream, carrying retry context.
 *
 * doc_id is empty when the failure happened before a document id was known.
 */
class AdapterError : public std::runtime_error {
public:
    AdapterError(const std::string& what,
                 std::optional<std::string> doc_id = std::nullopt,
                 int64_t retry_count = 0,
                 bool is_retryable = false,
                 std::string error_type = "AdapterError")
        : std::runtime_error(what),
          doc_id_(std::move(doc_id)),
          retry_count_(retry_count),
          is_retryable_(is_retryable),
          error_type_(std::move(error_type)) {}

    const std::optional<std::string>& docId() const { return doc_id_; }
    int64_t retryCount() const { return retry_count_; }
    bool isRetryable() const { return is_retryable_; }
    const std::string& errorType() const { return error_type_; }

private:
    std::optional<std::string> doc_id_;
    int64_t retry_count_;
    bool is_retryable_;
    std::string error_type_;
};

/**
 * Pull-based sequence of results for one invocation.
 * next() returns std::nullopt at the end and throws (AdapterError or any
 * std::exception) on failure; a stream that has thrown is not resumed.
 */
class ResultStream {
public:
    virtual ~ResultStream() = default;
    virtual std::optional<IngestionResult> next() = 0;
};

using ResultStreamPtr = std::unique_ptr<ResultStream>;

/**
 * @class Adapter
 * @brief One upstream source. Created per run by the AdapterRegistry.
 */
class Adapter {
public:
    virtual ~Adapter() = default;

    virtual const std::string& source() const = 0;

    /// Start one invocation with @p params; @p resume skips COMPLETED documents
    virtual ResultStreamPtr iterResults(const nlohmann::json& params, bool resume) = 0;

    /// Register the callback used to forward adapter-specific events (null unbinds)
    void bindEventEmitter(EventEmitter emitter) { emitter_ = std::move(emitter); }

protected:
    /// No-op while no emitter is bound
    void emitEvent(EventPayload payload) {
        if (!emitter_) {
            return;
        }
        PipelineEvent event;
        event.payload = std::move(payload);
        emitter_(std::move(event));
    }

private:
    EventEmitter emitter_;
};

using AdapterPtr = std::unique_ptr<Adapter>;

/// Short type label for DocumentFailed.error_type ("AdapterError", "LedgerIoError", ...)
std::string errorTypeName(const std::exception& error);

} // namespace LedgerStream
