#pragma once
#include <ledgerstream/core/adapters/adapter.hpp>
#include <ledgerstream/core/ledger/ledger_store.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace LedgerStream {

/// Raw upstream records for one invocation, one JSON payload at a time
class RawRecordStream {
public:
    virtual ~RawRecordStream() = default;
    virtual std::optional<nlohmann::json> next() = 0;
};

using RawRecordStreamPtr = std::unique_ptr<RawRecordStream>;

/// In-memory records, for fixtures and paged responses already fetched
class VectorRecordStream : public RawRecordStream {
public:
    explicit VectorRecordStream(std::vector<nlohmann::json> records) : records_(std::move(records)) {}

    std::optional<nlohmann::json> next() override {
        if (pos_ >= records_.size()) {
            return std::nullopt;
        }
        return std::move(records_[pos_++]);
    }

private:
    std::vector<nlohmann::json> records_;
    size_t pos_ = 0;
};

/**
 * @class BaseAdapter
 * @brief fetch -> parse -> validate -> write template over the ledger state graph.
 *
 * For every raw record the document is walked through
 *   FETCHING, FETCHED, PARSING, PARSED, VALIDATING, VALIDATED,
 *   IR_BUILDING, IR_READY, COMPLETED
 * with each step persisted before the next hook runs. A document left in an
 * in-progress or FAILED state by an earlier run re-enters through
 * FAILED -> RETRYING -> FETCHING with its retry_count incremented.
 *
 * COMPLETED documents are skipped when resuming; otherwise they are yielded
 * again untouched (COMPLETED has no outgoing edge).
 *
 * Any failure after the document id is known is recorded as FAILED and
 * rethrown as AdapterError.
 */
class BaseAdapter : public Adapter {
public:
    BaseAdapter(std::string source, const AdapterContext& context);

    const std::string& source() const override { return source_; }

    ResultStreamPtr iterResults(const nlohmann::json& params, bool resume) override;

    /// Drain one invocation eagerly
    std::vector<IngestionResult> run(const nlohmann::json& params, bool resume = false);

protected:
    virtual RawRecordStreamPtr fetch(const nlohmann::json& params) = 0;
    virtual Document parse(const nlohmann::json& raw) = 0;

    /// Throw to reject the document (default accepts everything)
    virtual void validate(const Document& document);

    /// Build downstream artefacts; the returned object becomes the result metadata
    virtual nlohmann::json write(const Document& document);

    /// "<source>:<identifier>#<version>:<12 hex content digest>"
    std::string buildDocId(const std::string& identifier, const std::string& version,
                           const std::string& content) const;

    /// Forward an upstream retry as an AdapterRetry event
    void emitRetry(int attempt, const std::string& error, std::optional<int> status_code = std::nullopt);

    DurableLedgerStore& ledger() const { return ledger_; }

private:
    class Stream;

    /// std::nullopt when the record was skipped by resume
    std::optional<IngestionResult> process(const nlohmann::json& raw, bool resume);

    /// Returns the retry_count the document carries into this attempt
    int64_t enterFetching(const std::string& doc_id, const Document& document);
    LedgerAuditRecord advance(const std::string& doc_id, LedgerState state, int64_t retry_count);
    void recordFailure(const std::string& doc_id, const std::exception& error, int64_t retry_count);

    std::string source_;
    DurableLedgerStore& ledger_;
};

} // namespace LedgerStream
