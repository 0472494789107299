#include <ledgerstream/core/adapters/base_adapter.hpp>
#include <spdlog/spdlog.h>
#include <iomanip>
#include <sstream>

namespace LedgerStream {

using json = nlohmann::json;

namespace {

// FNV-1a 64; only needs to be stable across runs and platforms
uint64_t contentDigest(const std::string& content) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : content) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

bool retryable(const std::exception& error) {
    if (auto adapter_error = dynamic_cast<const AdapterError*>(&error)) {
        return adapter_error->isRetryable();
    }
    return dynamic_cast<const LedgerIoError*>(&error) != nullptr;
}

} // namespace

class BaseAdapter::Stream : public ResultStream {
public:
    Stream(BaseAdapter& owner, RawRecordStreamPtr raw, bool resume)
        : owner_(owner), raw_(std::move(raw)), resume_(resume) {}

    std::optional<IngestionResult> next() override {
        while (!done_) {
            std::optional<json> record;
            try {
                record = raw_->next();
            } catch (const AdapterError&) {
                done_ = true;
                throw;
            } catch (const std::exception& e) {
                done_ = true;
                throw AdapterError(std::string("fetch failed: ") + e.what(), std::nullopt, 0, true, "FetchError");
            }
            if (!record) {
                done_ = true;
                break;
            }
            try {
                if (auto result = owner_.process(*record, resume_)) {
                    return result;
                }
            } catch (...) {
                done_ = true;
                throw;
            }
        }
        return std::nullopt;
    }

private:
    BaseAdapter& owner_;
    RawRecordStreamPtr raw_;
    bool resume_;
    bool done_ = false;
};

BaseAdapter::BaseAdapter(std::string source, const AdapterContext& context)
    : source_(std::move(source)), ledger_(context.ledger) {}

ResultStreamPtr BaseAdapter::iterResults(const json& params, bool resume) {
    RawRecordStreamPtr raw = fetch(params);
    if (!raw) {
        throw AdapterError("fetch() returned no record stream for " + source_);
    }
    return std::make_unique<Stream>(*this, std::move(raw), resume);
}

std::vector<IngestionResult> BaseAdapter::run(const json& params, bool resume) {
    std::vector<IngestionResult> results;
    ResultStreamPtr stream = iterResults(params, resume);
    while (auto result = stream->next()) {
        results.push_back(std::move(*result));
    }
    return results;
}

void BaseAdapter::validate(const Document&) {}

json BaseAdapter::write(const Document&) {
    return json::object();
}

std::string BaseAdapter::buildDocId(const std::string& identifier, const std::string& version,
                                    const std::string& content) const {
    std::ostringstream digest;
    digest << std::hex << std::setw(16) << std::setfill('0') << contentDigest(content);
    return source_ + ":" + identifier + "#" + version + ":" + digest.str().substr(0, 12);
}

void BaseAdapter::emitRetry(int attempt, const std::string& error, std::optional<int> status_code) {
    spdlog::warn("[{}] Retrying upstream request (attempt {}): {}", source_, attempt, error);
    emitEvent(AdapterRetry{source_, attempt, error, status_code});
}

std::optional<IngestionResult> BaseAdapter::process(const json& raw, bool resume) {
    Document document;
    try {
        document = parse(raw);
    } catch (const AdapterError&) {
        throw;
    } catch (const std::exception& e) {
        throw AdapterError(std::string("parse failed: ") + e.what(), std::nullopt, 0, false, "ParseError");
    }
    const std::string doc_id = document.doc_id;
    if (doc_id.empty()) {
        throw AdapterError("parse() produced a document without doc_id", std::nullopt, 0, false, "ParseError");
    }

    if (auto existing = ledger_.get(doc_id); existing && isTerminalState(existing->state)) {
        if (resume) {
            spdlog::debug("[{}] Resume: skipping completed document {}", source_, doc_id);
            return std::nullopt;
        }
        return IngestionResult{document, existing->state, existing->updated_at,
                               json{{"already_completed", true}}};
    }

    int64_t retry_count = 0;
    try {
        retry_count = enterFetching(doc_id, document);
        advance(doc_id, LedgerState::FETCHED, retry_count);
        advance(doc_id, LedgerState::PARSING, retry_count);
        advance(doc_id, LedgerState::PARSED, retry_count);
        advance(doc_id, LedgerState::VALIDATING, retry_count);
        validate(document);
        advance(doc_id, LedgerState::VALIDATED, retry_count);
        advance(doc_id, LedgerState::IR_BUILDING, retry_count);
        json metadata = write(document);
        advance(doc_id, LedgerState::IR_READY, retry_count);
        LedgerAuditRecord done = advance(doc_id, LedgerState::COMPLETED, retry_count);
        return IngestionResult{std::move(document), done.new_state, done.timestamp,
                               metadata.is_object() ? std::move(metadata) : json::object()};
    } catch (const std::exception& e) {
        recordFailure(doc_id, e, retry_count);
        if (auto adapter_error = dynamic_cast<const AdapterError*>(&e)) {
            throw AdapterError(adapter_error->what(), doc_id, retry_count,
                               adapter_error->isRetryable(), adapter_error->errorType());
        }
        throw AdapterError(e.what(), doc_id, retry_count, retryable(e), errorTypeName(e));
    }
}

int64_t BaseAdapter::enterFetching(const std::string& doc_id, const Document& document) {
    TransitionContext context;
    context.adapter = source_;
    context.metadata = json{{"source", document.source}};

    auto existing = ledger_.get(doc_id);
    if (!existing || existing->state == LedgerState::PENDING) {
        ledger_.updateState(doc_id, LedgerState::FETCHING, context);
        return 0;
    }
    if (existing->state == LedgerState::FETCHING) {
        return existing->retry_count;
    }

    const int64_t retry_count = existing->retry_count + 1;
    context.retry_count = retry_count;
    if (existing->state != LedgerState::FAILED && existing->state != LedgerState::RETRYING) {
        TransitionContext interrupted = context;
        interrupted.retry_count = existing->retry_count;
        interrupted.error_type = "Interrupted";
        interrupted.error_message = std::string("restarted from ") + toString(existing->state);
        ledger_.updateState(doc_id, LedgerState::FAILED, interrupted);
    }
    if (existing->state != LedgerState::RETRYING) {
        ledger_.updateState(doc_id, LedgerState::RETRYING, context);
    }
    spdlog::info("[{}] Retrying {} (attempt {}, was {})", source_, doc_id, retry_count,
                 toString(existing->state));
    ledger_.updateState(doc_id, LedgerState::FETCHING, context);
    return retry_count;
}

LedgerAuditRecord BaseAdapter::advance(const std::string& doc_id, LedgerState state, int64_t retry_count) {
    TransitionContext context;
    context.adapter = source_;
    if (retry_count > 0) {
        context.retry_count = retry_count;
    }
    return ledger_.updateState(doc_id, state, context);
}

void BaseAdapter::recordFailure(const std::string& doc_id, const std::exception& error, int64_t retry_count) {
    auto current = ledger_.getState(doc_id);
    if (!current || *current == LedgerState::FAILED || getValidNextStates(*current).count(LedgerState::FAILED) == 0) {
        return;
    }
    TransitionContext context;
    context.adapter = source_;
    context.retry_count = retry_count;
    context.error_type = errorTypeName(error);
    context.error_message = error.what();
    try {
        ledger_.updateState(doc_id, LedgerState::FAILED, context);
    } catch (const LedgerError& e) {
        spdlog::error("[{}] Could not record failure of {} in ledger: {}", source_, doc_id, e.what());
    }
}

} // namespace LedgerStream
