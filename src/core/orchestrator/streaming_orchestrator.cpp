#include <ledgerstream/core/orchestrator/streaming_orchestrator.hpp>
#include <ledgerstream/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace LedgerStream {

using json = nlohmann::json;

namespace {

// Drop what is still queued after a close. Completions the consumer never
// received come out of the final checkpoint; ids from a dropped intermediate
// checkpoint whose completions were received move into it.
void reconcileFinalCheckpoint(StreamState& state) {
    std::vector<std::string> carried;
    std::unordered_set<std::string> undelivered;
    while (auto event = state.channel.pop()) {
        if (auto completed = event->as<DocumentCompleted>()) {
            undelivered.insert(completed->document.doc_id);
        } else if (auto progress = event->as<BatchProgress>()) {
            if (progress->is_checkpoint) {
                carried.insert(carried.end(), progress->checkpoint_doc_ids.begin(),
                               progress->checkpoint_doc_ids.end());
            }
        }
    }
    if (undelivered.empty() && carried.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(state.final_mtx);
    BatchProgress* final_progress = state.final_checkpoint ? state.final_checkpoint->as<BatchProgress>() : nullptr;
    if (!final_progress) {
        return;
    }
    carried.insert(carried.end(), final_progress->checkpoint_doc_ids.begin(),
                   final_progress->checkpoint_doc_ids.end());
    std::vector<std::string> ids;
    std::unordered_set<std::string> kept;
    for (auto& id : carried) {
        if (undelivered.count(id) == 0 && kept.insert(id).second) {
            ids.push_back(std::move(id));
        }
    }
    final_progress->checkpoint_doc_ids = std::move(ids);
    final_progress->completed_count =
        std::max<int64_t>(0, final_progress->completed_count - static_cast<int64_t>(undelivered.size()));
    spdlog::info("[StreamingOrchestrator] Run {} closed with {} undelivered completions",
                 state.pipeline_id, undelivered.size());
}

} // namespace

// ============================================================================
// EVENT STREAM HANDLE
// ============================================================================

EventStream& EventStream::operator=(EventStream&& other) noexcept {
    if (this != &other) {
        close();
        state_ = std::move(other.state_);
    }
    return *this;
}

EventStream::~EventStream() {
    close();
}

std::optional<PipelineEvent> EventStream::next() {
    if (!state_ || state_->cancelled.load(std::memory_order_acquire)) {
        return std::nullopt;
    }
    auto event = state_->channel.pop();
    if (!event && state_->producer.joinable()) {
        // Channel closed and drained: the producer has finished or been cancelled
        state_->producer.join();
    }
    return event;
}

void EventStream::close() {
    if (!state_) {
        return;
    }
    state_->cancelled.store(true, std::memory_order_release);
    state_->channel.close();
    if (state_->producer.joinable()) {
        state_->producer.join();
    }
    reconcileFinalCheckpoint(*state_);
}

std::optional<PipelineEvent> EventStream::finalCheckpoint() const {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->final_mtx);
    return state_->final_checkpoint;
}

const std::string& EventStream::pipelineId() const {
    static const std::string empty;
    return state_ ? state_->pipeline_id : empty;
}

std::optional<Document> DocumentStream::next() {
    while (auto event = events_.next()) {
        if (auto completed = event->as<DocumentCompleted>()) {
            return std::move(completed->document);
        }
    }
    return std::nullopt;
}

// ============================================================================
// PRODUCER
// ============================================================================

class StreamingOrchestrator::Run {
public:
    Run(StreamingOrchestrator& owner, std::string source, StreamOptions options,
        StreamState& state, size_t progress_interval, size_t checkpoint_interval)
        : owner_(owner),
          source_(std::move(source)),
          options_(std::move(options)),
          state_(state),
          progress_interval_(progress_interval),
          checkpoint_interval_(checkpoint_interval),
          seen_(options_.completed_ids.begin(), options_.completed_ids.end()) {}

    void execute() {
        start_ns_ = Clock::now_ns();
        last_checkpoint_ns_ = start_ns_;
        spdlog::info("[StreamingOrchestrator] Run {} started: source={} invocations={} buffer={}",
                     state_.pipeline_id, source_, std::max<size_t>(options_.params.size(), 1),
                     state_.channel.capacity());
        try {
            body();
        } catch (const std::exception& e) {
            spdlog::error("[StreamingOrchestrator] Run {} aborted: {}", state_.pipeline_id, e.what());
            if (!failed_) {
                try {
                    handleFailure(e);
                } catch (const std::exception& nested) {
                    spdlog::error("[StreamingOrchestrator] Could not report failure of run {}: {}",
                                  state_.pipeline_id, nested.what());
                }
            }
        }
        finish();
    }

private:
    bool cancelled() const {
        return state_.cancelled.load(std::memory_order_acquire);
    }

    void body() {
        HttpClientPtr client = owner_.options_.client_factory
            ? owner_.options_.client_factory()
            : std::make_unique<OfflineHttpClient>();
        if (!client) {
            throw std::runtime_error("HTTP client factory returned null");
        }
        HttpClientGuard guard(*client);

        if (!changeState("initialising", std::nullopt)) return;

        AdapterPtr adapter;
        try {
            adapter = owner_.registry_.getAdapter(source_, AdapterContext{owner_.ledger_}, *client);
        } catch (const std::exception& e) {
            handleFailure(e);
            return;
        }
        adapter->bindEventEmitter([this](PipelineEvent event) {
            if (event.pipeline_id.empty()) {
                event.pipeline_id = state_.pipeline_id;
            }
            if (event.timestamp <= 0.0) {
                event.timestamp = Clock::unix_seconds();
            }
            emitEvent(std::move(event));
        });

        if (!changeState("ready", std::nullopt)) return;

        std::vector<json> invocations = options_.params;
        if (invocations.empty()) {
            invocations.push_back(json::object());
        }
        for (size_t i = 0; i < invocations.size(); ++i) {
            std::string label = "invocation " + std::to_string(i + 1) + "/" + std::to_string(invocations.size());
            if (!changeState("invocation_started", label)) return;
            if (!invoke(*adapter, invocations[i])) return;
            if (!changeState("invocation_completed", label)) return;
        }
        changeState("completed", std::nullopt);
    }

    /// false when the run must stop (failure or cancellation)
    bool invoke(Adapter& adapter, const json& params) {
        ResultStreamPtr stream;
        try {
            stream = adapter.iterResults(params, options_.resume);
        } catch (const std::exception& e) {
            handleFailure(e);
            return false;
        }

        while (!cancelled()) {
            const uint64_t doc_start_ns = Clock::now_ns();
            std::optional<IngestionResult> result;
            try {
                result = stream->next();
            } catch (const std::exception& e) {
                handleFailure(e);
                return false;
            }
            if (!result) {
                return true;
            }

            const std::string doc_id = result->document.doc_id;
            if (!seen_.insert(doc_id).second) {
                spdlog::debug("[StreamingOrchestrator] Skipping already completed {}", doc_id);
                continue;
            }

            ++in_flight_;
            if (!emit(DocumentStarted{doc_id, adapter.source(), params})) return false;
            const double duration = Clock::elapsed_seconds(doc_start_ns);
            --in_flight_;
            if (!emit(DocumentCompleted{std::move(result->document), duration, std::move(result->metadata)})) {
                return false;
            }
            ++completed_;
            since_checkpoint_.push_back(doc_id);

            if (static_cast<size_t>(completed_) % checkpoint_interval_ == 0) {
                if (!emit(progress(true))) return false;
            } else if (static_cast<size_t>(completed_) % progress_interval_ == 0) {
                if (!emit(progress(false))) return false;
            }
        }
        return false;
    }

    void handleFailure(const std::exception& error) {
        failed_ = true;
        ++failed_count_;

        std::optional<std::string> doc_id;
        int64_t retry_count = 0;
        bool is_retryable = false;
        if (auto adapter_error = dynamic_cast<const AdapterError*>(&error)) {
            doc_id = adapter_error->docId();
            retry_count = adapter_error->retryCount();
            is_retryable = adapter_error->isRetryable();
        }
        const std::string error_type = errorTypeName(error);
        spdlog::error("[StreamingOrchestrator] {} failed{}: {} ({})", source_,
                      doc_id ? " on " + *doc_id : std::string(), error.what(), error_type);

        if (owner_.options_.record_failures && doc_id) {
            recordFailure(*doc_id, error, error_type, retry_count);
        }
        if (!emit(DocumentFailed{doc_id, error.what(), retry_count, is_retryable, error_type})) return;
        changeState("failed", std::string(error.what()));
    }

    void recordFailure(const std::string& doc_id, const std::exception& error,
                       const std::string& error_type, int64_t retry_count) {
        auto current = owner_.ledger_.getState(doc_id);
        if (!current || *current == LedgerState::FAILED ||
            getValidNextStates(*current).count(LedgerState::FAILED) == 0) {
            return;
        }
        TransitionContext context;
        context.adapter = source_;
        context.retry_count = retry_count;
        context.error_type = error_type;
        context.error_message = error.what();
        try {
            owner_.ledger_.updateState(doc_id, LedgerState::FAILED, context);
        } catch (const LedgerError& e) {
            spdlog::error("[StreamingOrchestrator] Could not record failure of {}: {}", doc_id, e.what());
        }
    }

    void finish() {
        PipelineEvent checkpoint{Clock::unix_seconds(), state_.pipeline_id, progress(true)};
        {
            std::lock_guard<std::mutex> lock(state_.final_mtx);
            state_.final_checkpoint = checkpoint;
        }
        try {
            emitEvent(std::move(checkpoint));
        } catch (const std::exception& e) {
            spdlog::error("[StreamingOrchestrator] Could not emit final checkpoint of {}: {}",
                          state_.pipeline_id, e.what());
        }

        const double elapsed = Clock::elapsed_seconds(start_ns_);
        owner_.metrics_->observeSeconds(MetricNames::PIPELINE_RUN_SECONDS, {{"source", source_}}, elapsed);
        state_.channel.close();

        spdlog::info("[StreamingOrchestrator] Run {} finished in {:.3f}s: completed={} failed={} "
                     "backpressure_waits={} ({:.3f}s){}",
                     state_.pipeline_id, elapsed, completed_, failed_count_,
                     backpressure_count_.load(), backpressure_ns_.load() / 1e9,
                     cancelled() ? " [cancelled by consumer]" : "");
    }

    BatchProgress progress(bool checkpoint) {
        BatchProgress p;
        p.completed_count = completed_;
        p.failed_count = failed_count_;
        p.in_flight_count = in_flight_;
        p.queue_depth = static_cast<int64_t>(state_.channel.size());
        p.buffer_size = static_cast<int64_t>(state_.channel.capacity());
        if (options_.total_estimated) {
            const int64_t remaining = std::max<int64_t>(0, *options_.total_estimated - completed_ - failed_count_);
            p.remaining = remaining;
            const double elapsed = Clock::elapsed_seconds(start_ns_);
            if (remaining == 0) {
                p.eta_seconds = 0.0;
            } else if (completed_ > 0 && elapsed > 0.0) {
                p.eta_seconds = remaining * (elapsed / static_cast<double>(completed_));
            }
        }
        p.backpressure_wait_seconds = backpressure_ns_.load(std::memory_order_relaxed) / 1e9;
        p.backpressure_wait_count = static_cast<int64_t>(backpressure_count_.load(std::memory_order_relaxed));
        if (checkpoint) {
            p.is_checkpoint = true;
            p.checkpoint_doc_ids = std::move(since_checkpoint_);
            since_checkpoint_.clear();
            const uint64_t now_ns = Clock::now_ns();
            owner_.metrics_->observeSeconds(MetricNames::PIPELINE_CHECKPOINT_SECONDS, {{"source", source_}},
                                            static_cast<double>(now_ns - last_checkpoint_ns_) / 1e9);
            last_checkpoint_ns_ = now_ns;
        }
        return p;
    }

    bool changeState(const std::string& next, std::optional<std::string> reason) {
        AdapterStateChange change{source_, adapter_state_, next, std::move(reason)};
        adapter_state_ = next;
        return emit(std::move(change));
    }

    bool emit(EventPayload payload) {
        return emitEvent(PipelineEvent{Clock::unix_seconds(), state_.pipeline_id, std::move(payload)});
    }

    /// Filter, transform and queue one event; false once the consumer has gone
    bool emitEvent(PipelineEvent event) {
        if (cancelled()) {
            return false;
        }
        if (options_.event_filter && !options_.event_filter(event)) {
            return true;
        }
        if (options_.event_transformer) {
            auto transformed = options_.event_transformer(std::move(event));
            if (!transformed) {
                return true;
            }
            event = std::move(*transformed);
        }

        const std::string type = eventTypeName(event);
        uint64_t waited_ns = 0;
        if (!state_.channel.push(std::move(event), &waited_ns)) {
            state_.cancelled.store(true, std::memory_order_release);
            return false;
        }
        if (waited_ns > 0) {
            backpressure_ns_.fetch_add(waited_ns, std::memory_order_relaxed);
            backpressure_count_.fetch_add(1, std::memory_order_relaxed);
            owner_.metrics_->observeSeconds(MetricNames::PIPELINE_BACKPRESSURE_SECONDS, {{"source", source_}},
                                            static_cast<double>(waited_ns) / 1e9);
        }
        owner_.metrics_->incrementCounter(MetricNames::PIPELINE_EVENTS, {{"type", type}});
        owner_.metrics_->setGauge(MetricNames::PIPELINE_QUEUE_DEPTH, {{"source", source_}},
                                  static_cast<int64_t>(state_.channel.size()));
        return true;
    }

    StreamingOrchestrator& owner_;
    const std::string source_;
    StreamOptions options_;
    StreamState& state_;
    const size_t progress_interval_;
    const size_t checkpoint_interval_;

    std::unordered_set<std::string> seen_;
    std::vector<std::string> since_checkpoint_;
    std::string adapter_state_ = "idle";
    int64_t completed_ = 0;
    int64_t failed_count_ = 0;
    int64_t in_flight_ = 0;
    bool failed_ = false;
    uint64_t start_ns_ = 0;
    uint64_t last_checkpoint_ns_ = 0;
    std::atomic<uint64_t> backpressure_ns_{0};
    std::atomic<uint64_t> backpressure_count_{0};
};

// ============================================================================
// ORCHESTRATOR
// ============================================================================

StreamingOrchestrator::StreamingOrchestrator(DurableLedgerStore& ledger, const AdapterRegistry& registry)
    : StreamingOrchestrator(ledger, registry, Options{}) {}

StreamingOrchestrator::StreamingOrchestrator(DurableLedgerStore& ledger, const AdapterRegistry& registry,
                                             Options options)
    : ledger_(ledger),
      registry_(registry),
      options_(std::move(options)),
      metrics_(options_.metrics ? options_.metrics : std::make_shared<NoopMetricsSink>()) {}

EventStream StreamingOrchestrator::streamEvents(const std::string& source, StreamOptions options) {
    const size_t buffer_size = options.buffer_size.value_or(options_.buffer_size);
    const size_t progress_interval = options.progress_interval.value_or(options_.progress_interval);
    const size_t checkpoint_interval = options.checkpoint_interval.value_or(options_.checkpoint_interval);
    if (buffer_size == 0 || progress_interval == 0 || checkpoint_interval == 0) {
        throw std::invalid_argument("buffer_size, progress_interval and checkpoint_interval must be positive");
    }

    auto state = std::make_unique<StreamState>(buildPipelineId(source), buffer_size);
    auto run = std::make_unique<Run>(*this, source, std::move(options), *state,
                                     progress_interval, checkpoint_interval);
    state->producer = std::thread([run = std::move(run)]() { run->execute(); });
    return EventStream(std::move(state));
}

std::vector<PipelineEvent> StreamingOrchestrator::run(const std::string& source, StreamOptions options) {
    std::vector<PipelineEvent> events;
    EventStream stream = streamEvents(source, std::move(options));
    while (auto event = stream.next()) {
        events.push_back(std::move(*event));
    }
    return events;
}

DocumentStream StreamingOrchestrator::iterResults(const std::string& source, StreamOptions options) {
    return DocumentStream(streamEvents(source, std::move(options)));
}

std::map<std::string, std::vector<json>> StreamingOrchestrator::status() const {
    std::map<std::string, std::vector<json>> summary;
    for (const auto& entry : ledger_.entries()) {
        summary[toString(entry.state)].push_back({{"doc_id", entry.doc_id}, {"metadata", entry.metadata}});
    }
    return summary;
}

} // namespace LedgerStream
