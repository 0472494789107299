// ============================================================================
// AUDIT RECORD UNIT TESTS
// ============================================================================
// Tests for the JSONL encoding of ledger audit records and document entries
// ============================================================================

#include <gtest/gtest.h>
#include <ledgerstream/core/ledger/audit_record.hpp>
#include <ledgerstream/core/ledger/document_entry.hpp>
#include <ledgerstream/core/ledger/errors.hpp>

using namespace LedgerStream;
using json = nlohmann::json;

namespace {

LedgerAuditRecord sampleRecord() {
    LedgerAuditRecord record;
    record.doc_id = "arxiv:2401.00001#v2:0123456789ab";
    record.old_state = LedgerState::PARSED;
    record.new_state = LedgerState::VALIDATING;
    record.timestamp = 1700000000.25;
    record.adapter = "arxiv";
    record.metadata = {{"title", "Attention"}};
    record.retry_count = 1;
    record.duration_seconds = 0.5;
    record.sequence = 17;
    return record;
}

} // namespace

// ============================================================================
// ENCODING TESTS
// ============================================================================

TEST(LedgerAuditRecord, LineIsSingleLineWithCanonicalStates) {
    std::string line = sampleRecord().toLine();
    EXPECT_EQ(line.find('\n'), std::string::npos);

    json payload = json::parse(line);
    EXPECT_EQ(payload["old_state"], "PARSED");
    EXPECT_EQ(payload["new_state"], "VALIDATING");
    EXPECT_EQ(payload["sequence"], 17);
    EXPECT_FALSE(payload.contains("error_type"));
}

TEST(LedgerAuditRecord, DecodesWhatItEncodes) {
    LedgerAuditRecord record = sampleRecord();
    record.error_type = "ParseError";
    record.error_message = "bad";
    EXPECT_EQ(LedgerAuditRecord::fromLine(record.toLine()), record);
}

TEST(LedgerAuditRecord, EmptyStringsSurviveEncoding) {
    LedgerAuditRecord record = sampleRecord();
    record.adapter = "";
    record.error_type = "";
    record.error_message = "";

    LedgerAuditRecord back = LedgerAuditRecord::fromLine(record.toLine());
    ASSERT_TRUE(back.adapter.has_value());
    EXPECT_EQ(*back.adapter, "");
    ASSERT_TRUE(back.error_message.has_value());
    EXPECT_EQ(back, record);
}

TEST(LedgerAuditRecord, VariedRecordsDecodeToThemselves) {
    std::vector<LedgerAuditRecord> records;

    LedgerAuditRecord bare;
    bare.doc_id = "d";
    bare.new_state = LedgerState::FETCHING;
    records.push_back(bare);

    LedgerAuditRecord failed = sampleRecord();
    failed.old_state = LedgerState::IR_BUILDING;
    failed.new_state = LedgerState::FAILED;
    failed.adapter = std::nullopt;
    failed.retry_count = 0;
    failed.error_type = "FetchError";
    failed.error_message = "line one\nline \"two\"";
    records.push_back(failed);

    LedgerAuditRecord nested = sampleRecord();
    nested.doc_id = "pubmed:PMC1#v1:\u00e9t\u00e9";
    nested.metadata = {{"authors", {"a", "b"}}, {"score", 0.25}, {"flags", {{"ok", true}}}};
    nested.parameters = {{"query", "cancer"}, {"page", 3}};
    nested.duration_seconds = std::nullopt;
    nested.sequence = 0;
    records.push_back(nested);

    LedgerAuditRecord self_loop;
    self_loop.doc_id = "loop";
    self_loop.old_state = LedgerState::FAILED;
    self_loop.new_state = LedgerState::FAILED;
    self_loop.timestamp = 1.5;
    self_loop.adapter = "";
    self_loop.sequence = 9007199254740993ULL;
    records.push_back(self_loop);

    for (const auto& record : records) {
        SCOPED_TRACE(record.toLine());
        EXPECT_EQ(LedgerAuditRecord::fromLine(record.toLine()), record);
    }
}

// ============================================================================
// LEGACY FORMAT TESTS
// ============================================================================

TEST(LedgerAuditRecord, DecodesLegacyAliasesAndMissingSequence) {
    auto record = LedgerAuditRecord::fromLine(
        R"({"doc_id":"d1","old_state":"pdf_downloaded","new_state":"auto_done","timestamp":"12.5"})");
    EXPECT_EQ(record.old_state, LedgerState::FETCHED);
    EXPECT_EQ(record.new_state, LedgerState::COMPLETED);
    EXPECT_DOUBLE_EQ(record.timestamp, 12.5);
    EXPECT_EQ(record.sequence, 0u);
    EXPECT_FALSE(record.adapter.has_value());
}

TEST(LedgerAuditRecord, LegacyOldStateFallsBackToNewState) {
    auto record = LedgerAuditRecord::fromLine(
        R"({"doc_id":"d1","old_state":"legacy","new_state":"IR_READY","timestamp":1})");
    EXPECT_EQ(record.old_state, LedgerState::IR_READY);
}

TEST(LedgerAuditRecord, NonObjectMetadataIsDropped) {
    auto record = LedgerAuditRecord::fromLine(
        R"({"doc_id":"d1","old_state":"PENDING","new_state":"FETCHING","metadata":[1,2]})");
    EXPECT_TRUE(record.metadata.is_object());
    EXPECT_TRUE(record.metadata.empty());
}

TEST(LedgerAuditRecord, RejectsMalformedRecords) {
    EXPECT_THROW(LedgerAuditRecord::fromLine("{not json"), LedgerCorruption);
    EXPECT_THROW(LedgerAuditRecord::fromLine("[]"), LedgerCorruption);
    EXPECT_THROW(LedgerAuditRecord::fromLine(R"({"old_state":"PENDING","new_state":"FETCHING"})"),
                 LedgerCorruption);
    EXPECT_THROW(LedgerAuditRecord::fromLine(R"({"doc_id":"d1","old_state":"PENDING","new_state":"BOGUS"})"),
                 LedgerCorruption);
}

// ============================================================================
// DOCUMENT ENTRY TESTS
// ============================================================================

TEST(DocumentLedgerEntry, ApplyKeepsMetadataUnlessReplaced) {
    DocumentLedgerEntry entry;
    entry.doc_id = "d1";

    LedgerAuditRecord first = sampleRecord();
    first.doc_id = "d1";
    entry.apply(first);
    EXPECT_EQ(entry.state, LedgerState::VALIDATING);
    EXPECT_EQ(entry.metadata["title"], "Attention");
    EXPECT_EQ(entry.retry_count, 1);

    LedgerAuditRecord second;
    second.doc_id = "d1";
    second.old_state = LedgerState::VALIDATING;
    second.new_state = LedgerState::VALIDATED;
    second.timestamp = 1700000001.0;
    entry.apply(second);
    EXPECT_EQ(entry.metadata["title"], "Attention");
    EXPECT_EQ(entry.retry_count, 1);
    EXPECT_EQ(entry.adapter, "arxiv");
    EXPECT_EQ(entry.history.size(), 2u);
}

TEST(DocumentLedgerEntry, HistoryIsBounded) {
    DocumentLedgerEntry entry;
    for (size_t i = 0; i < DocumentLedgerEntry::MAX_HISTORY + 10; ++i) {
        LedgerAuditRecord record;
        record.doc_id = "d1";
        record.old_state = LedgerState::FAILED;
        record.new_state = LedgerState::FAILED;
        record.sequence = i + 1;
        entry.apply(record);
    }
    EXPECT_EQ(entry.history.size(), DocumentLedgerEntry::MAX_HISTORY);
    EXPECT_EQ(entry.history.back().sequence, DocumentLedgerEntry::MAX_HISTORY + 10);
}

TEST(DocumentLedgerEntry, SnapshotEncodingPreservesState) {
    DocumentLedgerEntry entry;
    entry.doc_id = "d1";
    entry.apply(sampleRecord());

    DocumentLedgerEntry decoded = DocumentLedgerEntry::fromJson("d1", entry.toJson(), 0.0);
    EXPECT_TRUE(decoded.sameState(entry));
    EXPECT_EQ(decoded.history.size(), 1u);
}

TEST(DocumentLedgerEntry, DurationIsNeverNegative) {
    DocumentLedgerEntry entry;
    entry.updated_at = 100.0;
    EXPECT_DOUBLE_EQ(entry.durationSeconds(160.0), 60.0);
    EXPECT_DOUBLE_EQ(entry.durationSeconds(50.0), 0.0);
}
