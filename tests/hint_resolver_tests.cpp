#include <gtest/gtest.h>
#include "ledger/errors.h"
#include "mocks/fake_ledger.h"
#include "search/HintResolver.h"
#include <algorithm>

using namespace ledgerproof;

namespace {

std::vector<std::string> failingFields(const VerificationHint &hint) {
    try {
        HintResolver::resolve(hint);
    } catch (const InvalidHint &e) {
        auto names = e.fieldNames();
        std::sort(names.begin(), names.end());
        return names;
    }
    return {};
}

} // namespace

TEST(HintResolver, BatchIdFormat) {
    EXPECT_TRUE(HintResolver::isValidBatchId("BATCH-2025-06-14-a1b2_c3"));
    EXPECT_TRUE(HintResolver::isValidBatchId("BATCH-2024-02-29-x"));
    EXPECT_FALSE(HintResolver::isValidBatchId("BATCH-2023-02-29-x"));
    EXPECT_FALSE(HintResolver::isValidBatchId("BATCH-2025-13-01-x"));
    EXPECT_FALSE(HintResolver::isValidBatchId("BATCH-2025-06-14-"));
    EXPECT_FALSE(HintResolver::isValidBatchId("batch-2025-06-14-x"));
    EXPECT_FALSE(HintResolver::isValidBatchId("BATCH-2025-06-14-x-y"));
    EXPECT_FALSE(HintResolver::isValidBatchId(""));
}

TEST(HintResolver, EmptyHintIsUnconstrained) {
    auto c = HintResolver::resolve(VerificationHint{});
    EXPECT_TRUE(c.unconstrained());
    EXPECT_FALSE(c.fastPath());
}

TEST(HintResolver, ResolvesEveryField) {
    VerificationHint hint;
    hint.batchId = "BATCH-2025-06-14-abc";
    hint.timeStart = "2025-06-14T00:00:00Z";
    hint.timeEnd = "2025-06-15T00:00:00+00:00";
    hint.databaseName = "shop";
    hint.tableName = "orders";
    hint.expectedOperation = "delete";
    auto c = HintResolver::resolve(hint);
    EXPECT_TRUE(c.fastPath());
    ASSERT_TRUE(c.timeRange.has_value());
    EXPECT_TRUE(c.timeRange->contains(fixtures::at("2025-06-14T12:00:00Z")));
    EXPECT_FALSE(c.timeRange->contains(fixtures::at("2025-06-15T00:00:00Z")));
    EXPECT_EQ(c.databaseName, "shop");
    EXPECT_EQ(c.tableName, "orders");
    EXPECT_EQ(c.operation, OperationKind::DELETE);
}

/**
 * @brief All bad fields are reported together, not just the first.
 */
TEST(HintResolver, CollectsEveryError) {
    VerificationHint hint;
    hint.batchId = "not-a-batch";
    hint.timeStart = "2025-06-14T00:00:00";
    hint.timeEnd = "garbage";
    hint.databaseName = "  ";
    hint.expectedOperation = "UPSERT";
    EXPECT_EQ(failingFields(hint),
              (std::vector<std::string>{"batch_id", "database_name", "expected_operation",
                                        "time_end", "time_start"}));
}

TEST(HintResolver, TimeRangeMustBeComplete) {
    VerificationHint onlyStart;
    onlyStart.timeStart = "2025-06-14T00:00:00Z";
    EXPECT_EQ(failingFields(onlyStart), std::vector<std::string>{"time_end"});

    VerificationHint onlyEnd;
    onlyEnd.timeEnd = "2025-06-14T00:00:00Z";
    EXPECT_EQ(failingFields(onlyEnd), std::vector<std::string>{"time_start"});
}

TEST(HintResolver, TimeRangeMustBeOrdered) {
    VerificationHint hint;
    hint.timeStart = "2025-06-14T00:00:00Z";
    hint.timeEnd = "2025-06-14T00:00:00Z";
    EXPECT_EQ(failingFields(hint), std::vector<std::string>{"time_end"});
}

TEST(HintResolver, NaiveTimestampMessage) {
    VerificationHint hint;
    hint.timeStart = "2025-06-14T00:00:00";
    hint.timeEnd = "2025-06-15T00:00:00Z";
    try {
        HintResolver::resolve(hint);
        FAIL() << "naive timestamp accepted";
    } catch (const InvalidHint &e) {
        ASSERT_EQ(e.fields().size(), 1u);
        EXPECT_NE(e.fields()[0].problem.find("UTC"), std::string::npos);
    }
}

TEST(HintResolver, MergeFillsFromRecord) {
    auto c = HintResolver::merge(ResolvedConstraint{},
                                 fixtures::makeRecord(1, OperationKind::UPDATE));
    EXPECT_EQ(c.databaseName, "shop");
    EXPECT_EQ(c.tableName, "orders");
    EXPECT_EQ(c.operation, OperationKind::UPDATE);
}

TEST(HintResolver, MergeKeepsMatchingHints) {
    ResolvedConstraint c;
    c.databaseName = "shop";
    c.operation = OperationKind::INSERT;
    auto merged = HintResolver::merge(c, fixtures::makeRecord(1));
    EXPECT_EQ(merged.databaseName, "shop");
    EXPECT_EQ(merged.tableName, "orders");
}

TEST(HintResolver, MergeRejectsContradictions) {
    ResolvedConstraint c;
    c.databaseName = "billing";
    c.tableName = "invoices";
    c.operation = OperationKind::DELETE;
    try {
        HintResolver::merge(c, fixtures::makeRecord(1, OperationKind::INSERT));
        FAIL() << "contradiction accepted";
    } catch (const InvalidHint &e) {
        EXPECT_EQ(e.fields().size(), 3u);
    }
}

TEST(HintResolver, MergeWithAnonymousRecord) {
    TransactionRecord bare("", "", std::nullopt, {{"id", int64_t{1}}});
    ResolvedConstraint c;
    c.tableName = "orders";
    auto merged = HintResolver::merge(c, bare);
    EXPECT_FALSE(merged.databaseName.has_value());
    EXPECT_EQ(merged.tableName, "orders");
    EXPECT_FALSE(merged.operation.has_value());
}
