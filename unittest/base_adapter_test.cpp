// ============================================================================
// BASE ADAPTER UNIT TESTS
// ============================================================================
// Tests for the fetch/parse/validate/write template, resume and retry paths,
// and the local JSONL adapter built on it
// ============================================================================

#include <gtest/gtest.h>
#include <ledgerstream/core/adapters/base_adapter.hpp>
#include <ledgerstream/core/adapters/jsonl_adapter.hpp>
#include <ledgerstream/core/ledger/ledger_store.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <unistd.h>

using namespace LedgerStream;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

class FixtureAdapter : public BaseAdapter {
public:
    FixtureAdapter(const AdapterContext& context, std::vector<json> records)
        : BaseAdapter("fixture", context), records_(std::move(records)) {}

    using BaseAdapter::buildDocId;
    using BaseAdapter::emitRetry;

    std::set<std::string> reject;
    int writes = 0;

protected:
    RawRecordStreamPtr fetch(const json&) override {
        return std::make_unique<VectorRecordStream>(records_);
    }

    Document parse(const json& raw) override {
        Document document;
        document.content = raw.at("content").get<std::string>();
        document.doc_id = buildDocId(raw.at("id").get<std::string>(), "v1", document.content);
        document.source = source();
        document.metadata = {{"id", raw.at("id")}};
        document.raw = raw;
        return document;
    }

    void validate(const Document& document) override {
        if (reject.count(document.metadata.at("id").get<std::string>()) > 0) {
            throw AdapterError("rejected by fixture", std::nullopt, 0, false, "ValidationError");
        }
    }

    json write(const Document&) override {
        ++writes;
        return {{"written", true}};
    }

private:
    std::vector<json> records_;
};

std::vector<json> records(std::initializer_list<const char*> ids) {
    std::vector<json> out;
    for (const char* id : ids) {
        out.push_back({{"id", id}, {"content", std::string("body of ") + id}});
    }
    return out;
}

std::vector<LedgerState> statesOf(const std::vector<LedgerAuditRecord>& history) {
    std::vector<LedgerState> states;
    for (const auto& record : history) {
        states.push_back(record.new_state);
    }
    return states;
}

} // namespace

class BaseAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("ledgerstream_adapter_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        ledger_ = std::make_unique<DurableLedgerStore>(dir_ / "ledger.jsonl");
    }

    void TearDown() override {
        ledger_.reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    AdapterContext context() { return AdapterContext{*ledger_}; }

    fs::path dir_;
    std::unique_ptr<DurableLedgerStore> ledger_;
};

// ============================================================================
// TEMPLATE TESTS
// ============================================================================

TEST_F(BaseAdapterTest, WalksEveryDocumentToCompleted) {
    FixtureAdapter adapter(context(), records({"a", "b"}));
    auto results = adapter.run({});

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].state, LedgerState::COMPLETED);
    EXPECT_EQ(results[0].metadata["written"], true);
    EXPECT_EQ(adapter.writes, 2);

    const std::vector<LedgerState> expected = {
        LedgerState::FETCHING, LedgerState::FETCHED, LedgerState::PARSING,
        LedgerState::PARSED, LedgerState::VALIDATING, LedgerState::VALIDATED,
        LedgerState::IR_BUILDING, LedgerState::IR_READY, LedgerState::COMPLETED,
    };
    EXPECT_EQ(statesOf(ledger_->getStateHistory(results[1].document.doc_id)), expected);
    EXPECT_EQ(ledger_->get(results[1].document.doc_id)->adapter, "fixture");
}

TEST_F(BaseAdapterTest, DocIdCarriesSourceVersionAndDigest) {
    FixtureAdapter adapter(context(), {});
    const std::string id = adapter.buildDocId("PMC123", "v2", "hello");
    EXPECT_TRUE(std::regex_match(id, std::regex("fixture:PMC123#v2:[0-9a-f]{12}"))) << id;
    EXPECT_EQ(id, adapter.buildDocId("PMC123", "v2", "hello"));
    EXPECT_NE(id, adapter.buildDocId("PMC123", "v2", "hello!"));
}

TEST_F(BaseAdapterTest, ValidationFailureIsRecordedAndRethrown) {
    FixtureAdapter adapter(context(), records({"a", "b", "c"}));
    adapter.reject.insert("b");

    auto stream = adapter.iterResults({}, false);
    ASSERT_TRUE(stream->next().has_value());
    try {
        stream->next();
        FAIL() << "expected AdapterError";
    } catch (const AdapterError& e) {
        ASSERT_TRUE(e.docId().has_value());
        EXPECT_EQ(e.errorType(), "ValidationError");
        EXPECT_FALSE(e.isRetryable());
        auto entry = ledger_->get(*e.docId());
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->state, LedgerState::FAILED);
        EXPECT_EQ(entry->history.back().error_type, "ValidationError");
    }
    EXPECT_EQ(ledger_->size(), 2u);
}

TEST_F(BaseAdapterTest, ParseFailureHasNoDocId) {
    FixtureAdapter adapter(context(), {json{{"id", "a"}}});
    try {
        adapter.run({});
        FAIL() << "expected AdapterError";
    } catch (const AdapterError& e) {
        EXPECT_FALSE(e.docId().has_value());
        EXPECT_EQ(e.errorType(), "ParseError");
    }
    EXPECT_EQ(ledger_->size(), 0u);
}

// ============================================================================
// RESUME / RETRY TESTS
// ============================================================================

TEST_F(BaseAdapterTest, ResumeSkipsCompletedDocuments) {
    FixtureAdapter adapter(context(), records({"a", "b"}));
    adapter.run({});
    EXPECT_TRUE(adapter.run({}, true).empty());
    EXPECT_EQ(adapter.writes, 2);
}

TEST_F(BaseAdapterTest, CompletedDocumentsAreYieldedAgainWithoutResume) {
    FixtureAdapter adapter(context(), records({"a"}));
    auto first = adapter.run({});
    const size_t history = ledger_->getStateHistory(first[0].document.doc_id).size();

    auto second = adapter.run({});
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].metadata["already_completed"], true);
    EXPECT_EQ(ledger_->getStateHistory(first[0].document.doc_id).size(), history);
    EXPECT_EQ(adapter.writes, 1);
}

TEST_F(BaseAdapterTest, FailedDocumentReentersThroughRetrying) {
    FixtureAdapter adapter(context(), records({"a"}));
    adapter.reject.insert("a");
    EXPECT_THROW(adapter.run({}), AdapterError);

    adapter.reject.clear();
    auto results = adapter.run({}, true);
    ASSERT_EQ(results.size(), 1u);
    auto entry = ledger_->get(results[0].document.doc_id);
    EXPECT_EQ(entry->state, LedgerState::COMPLETED);
    EXPECT_EQ(entry->retry_count, 1);

    auto states = statesOf(ledger_->getStateHistory(results[0].document.doc_id));
    auto failed = std::find(states.begin(), states.end(), LedgerState::FAILED);
    ASSERT_NE(failed, states.end());
    EXPECT_EQ(*(failed + 1), LedgerState::RETRYING);
    EXPECT_EQ(*(failed + 2), LedgerState::FETCHING);
}

TEST_F(BaseAdapterTest, InterruptedDocumentIsRestarted) {
    FixtureAdapter adapter(context(), records({"a"}));
    const std::string doc_id = adapter.buildDocId("a", "v1", "body of a");
    for (LedgerState state : {LedgerState::FETCHING, LedgerState::FETCHED, LedgerState::PARSING}) {
        ledger_->updateState(doc_id, state);
    }

    adapter.run({});
    auto history = ledger_->getStateHistory(doc_id);
    EXPECT_EQ(ledger_->getState(doc_id), LedgerState::COMPLETED);
    EXPECT_EQ(history[3].new_state, LedgerState::FAILED);
    EXPECT_EQ(history[3].error_type, "Interrupted");
    EXPECT_EQ(history[4].new_state, LedgerState::RETRYING);
    EXPECT_EQ(history[5].new_state, LedgerState::FETCHING);
    EXPECT_EQ(ledger_->get(doc_id)->retry_count, 1);
}

TEST_F(BaseAdapterTest, DocumentLeftInFetchingContinues) {
    FixtureAdapter adapter(context(), records({"a"}));
    const std::string doc_id = adapter.buildDocId("a", "v1", "body of a");
    ledger_->updateState(doc_id, LedgerState::FETCHING);

    adapter.run({});
    auto history = ledger_->getStateHistory(doc_id);
    ASSERT_EQ(history.size(), 9u);
    EXPECT_EQ(history[1].new_state, LedgerState::FETCHED);
    EXPECT_EQ(ledger_->get(doc_id)->retry_count, 0);
}

// ============================================================================
// EVENT EMITTER TESTS
// ============================================================================

TEST_F(BaseAdapterTest, RetriesAreForwardedToBoundEmitter) {
    FixtureAdapter adapter(context(), {});
    adapter.emitRetry(1, "unbound");

    std::vector<PipelineEvent> seen;
    adapter.bindEventEmitter([&seen](PipelineEvent event) { seen.push_back(std::move(event)); });
    adapter.emitRetry(2, "HTTP 503", 503);

    ASSERT_EQ(seen.size(), 1u);
    auto retry = seen[0].as<AdapterRetry>();
    ASSERT_NE(retry, nullptr);
    EXPECT_EQ(retry->adapter, "fixture");
    EXPECT_EQ(retry->attempt, 2);
    EXPECT_EQ(retry->status_code, 503);
}

// ============================================================================
// JSONL ADAPTER TESTS
// ============================================================================

TEST_F(BaseAdapterTest, JsonlAdapterIngestsFile) {
    const fs::path input = dir_ / "input.jsonl";
    {
        std::ofstream out(input);
        out << R"({"id":"NCT001","content":"trial text","title":"A trial"})" << "\n\n"
            << R"({"id":"NCT002","content":"more text","version":"v3","metadata":{"phase":2}})" << "\n";
    }
    JsonlFileAdapter adapter(context());
    auto results = adapter.run({{"path", input.string()}});

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].document.metadata["title"], "A trial");
    EXPECT_EQ(results[0].metadata["content_length"], 10);
    EXPECT_EQ(results[1].document.doc_id.rfind("jsonl:NCT002#v3:", 0), 0u);
    EXPECT_EQ(results[1].document.metadata["phase"], 2);
}

TEST_F(BaseAdapterTest, JsonlAdapterReportsErrorTypes) {
    JsonlFileAdapter adapter(context());
    try {
        adapter.run({});
        FAIL() << "expected AdapterError";
    } catch (const AdapterError& e) {
        EXPECT_EQ(e.errorType(), "ConfigurationError");
    }
    try {
        adapter.run({{"path", (dir_ / "missing.jsonl").string()}});
        FAIL() << "expected AdapterError";
    } catch (const AdapterError& e) {
        EXPECT_EQ(e.errorType(), "FetchError");
    }

    const fs::path broken = dir_ / "broken.jsonl";
    {
        std::ofstream out(broken);
        out << "{\"id\": \n";
    }
    try {
        adapter.run({{"path", broken.string()}});
        FAIL() << "expected AdapterError";
    } catch (const AdapterError& e) {
        EXPECT_EQ(e.errorType(), "ParseError");
    }
}

TEST_F(BaseAdapterTest, JsonlAdapterRejectsEmptyContent) {
    const fs::path input = dir_ / "empty.jsonl";
    {
        std::ofstream out(input);
        out << R"({"id":"blank","content":"   "})" << "\n";
    }
    JsonlFileAdapter adapter(context());
    try {
        adapter.run({{"path", input.string()}});
        FAIL() << "expected AdapterError";
    } catch (const AdapterError& e) {
        EXPECT_EQ(e.errorType(), "ValidationError");
        ASSERT_TRUE(e.docId().has_value());
        EXPECT_EQ(ledger_->getState(*e.docId()), LedgerState::FAILED);
    }
}
