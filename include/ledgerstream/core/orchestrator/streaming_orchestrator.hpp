#pragma once
#include <ledgerstream/core/adapters/http_client.hpp>
#include <ledgerstream/core/adapters/registry.hpp>
#include <ledgerstream/core/events/pipeline_event.hpp>
#include <ledgerstream/core/ledger/ledger_store.hpp>
#include <ledgerstream/core/metrics/metrics_sink.hpp>
#include <ledgerstream/core/queues/bounded_channel.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace LedgerStream {

/**
 * Per-call options for streamEvents(). Unset sizes fall back to the
 * orchestrator's configured defaults.
 */
struct StreamOptions {
    std::vector<nlohmann::json> params;                 // empty = one invocation with {}
    bool resume = false;
    std::optional<size_t> buffer_size;
    std::optional<size_t> progress_interval;
    std::optional<size_t> checkpoint_interval;
    EventFilter event_filter;
    EventTransformer event_transformer;
    std::unordered_set<std::string> completed_ids;      // skipped without events
    std::optional<int64_t> total_estimated;             // enables remaining/eta
};

/// Shared between an EventStream and its producer thread
struct StreamState {
    StreamState(std::string id, size_t capacity) : pipeline_id(std::move(id)), channel(capacity) {}

    std::string pipeline_id;
    BoundedChannel<PipelineEvent> channel;
    std::atomic<bool> cancelled{false};
    mutable std::mutex final_mtx;
    std::optional<PipelineEvent> final_checkpoint;
    std::thread producer;
};

/**
 * @class EventStream
 * @brief Consumer handle for one streamEvents() call.
 *
 * Owns the producer thread. next() blocks until the next event and returns
 * std::nullopt once the run has finished and the channel is drained.
 * close() (or destruction) cancels the producer, unblocks it and joins it.
 * Events already queued are discarded, and the final checkpoint then lists
 * only documents whose DocumentCompleted reached the consumer.
 */
class EventStream {
public:
    EventStream(EventStream&&) noexcept = default;
    EventStream& operator=(EventStream&& other) noexcept;
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    std::optional<PipelineEvent> next();

    /// Cancel and join the producer. Idempotent.
    void close();

    /// Final checkpoint of the run, available once the producer has finished
    std::optional<PipelineEvent> finalCheckpoint() const;

    const std::string& pipelineId() const;

private:
    friend class StreamingOrchestrator;

    explicit EventStream(std::unique_ptr<StreamState> state) : state_(std::move(state)) {}

    std::unique_ptr<StreamState> state_;
};

/// Documents-only view over an EventStream
class DocumentStream {
public:
    explicit DocumentStream(EventStream events) : events_(std::move(events)) {}

    std::optional<Document> next();
    void close() { events_.close(); }

private:
    EventStream events_;
};

/**
 * @class StreamingOrchestrator
 * @brief Drives an adapter and turns its results into a bounded event stream.
 *
 * One producer thread per streamEvents() call runs the invocations strictly
 * in sequence. A full channel blocks the producer; the time spent blocked is
 * reported in BatchProgress and as a metric.
 *
 * Fail-fast: the first error from a result stream ends the run with exactly
 * one DocumentFailed and one AdapterStateChange to "failed", then the final
 * checkpoint.
 *
 * The ledger and registry must outlive every stream created here.
 */
class StreamingOrchestrator {
public:
    struct Options {
        size_t buffer_size = 100;
        size_t progress_interval = 100;
        size_t checkpoint_interval = 1000;
        bool record_failures = true;
        MetricsSinkPtr metrics;                 // null = no-op
        HttpClientFactory client_factory;       // null = OfflineHttpClient
    };

    StreamingOrchestrator(DurableLedgerStore& ledger, const AdapterRegistry& registry);
    StreamingOrchestrator(DurableLedgerStore& ledger, const AdapterRegistry& registry, Options options);

    EventStream streamEvents(const std::string& source, StreamOptions options = {});

    /// Drain a whole run into memory
    std::vector<PipelineEvent> run(const std::string& source, StreamOptions options = {});

    /// Completed documents only, in order
    DocumentStream iterResults(const std::string& source, StreamOptions options = {});

    /// Ledger entries grouped by state name: [{"doc_id", "metadata"}]
    std::map<std::string, std::vector<nlohmann::json>> status() const;

    const Options& options() const { return options_; }

private:
    class Run;

    DurableLedgerStore& ledger_;
    const AdapterRegistry& registry_;
    Options options_;
    MetricsSinkPtr metrics_;
};

} // namespace LedgerStream
