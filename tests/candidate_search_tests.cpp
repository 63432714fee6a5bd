#include <gtest/gtest.h>
#include "cache/BatchMetadataCache.h"
#include "hashing/canonical_hasher.h"
#include "ledger/errors.h"
#include "mocks/fake_ledger.h"
#include "search/CandidateSearch.h"
#include <algorithm>

using namespace ledgerproof;
using fixtures::at;
using fixtures::makeRecord;

class CandidateSearchTest : public ::testing::Test {
protected:
    CandidateSearchTest()
        : cache_(BatchMetadataCache::ledgerLoader(ledger_, retry_), BatchMetadataCache::Options{}) {}

    void SetUp() override {
        ledger_.addBatch("BATCH-2025-06-01-a", "shop", {"orders"},
                         {makeRecord(1), makeRecord(2)}, at("2025-06-01T10:00:00Z"));
        ledger_.addBatch("BATCH-2025-06-02-b", "shop", {"orders", "items"},
                         {makeRecord(3), makeRecord(4, OperationKind::DELETE)},
                         at("2025-06-02T10:00:00Z"));
        ledger_.addBatch("BATCH-2025-06-03-c", "billing", {"invoices"},
                         {makeRecord(5, OperationKind::INSERT, "billing", "invoices")},
                         at("2025-06-03T10:00:00Z"));
        ledger_.addBatch("BATCH-2025-06-04-d", "shop", {"customers"},
                         {makeRecord(6, OperationKind::UPDATE, "shop", "customers")},
                         at("2025-06-04T10:00:00Z"));
    }

    CandidateSearch search(std::size_t cap = 50) {
        CandidateSearch::Options opts;
        opts.maxCandidates = cap;
        return CandidateSearch(ledger_, cache_, retry_, opts);
    }

    fixtures::FakeLedger ledger_;
    RetryPolicy retry_;
    BatchMetadataCache cache_;
};

TEST_F(CandidateSearchTest, BatchIdFastPathSkipsIndex) {
    ResolvedConstraint c;
    c.batchId = "BATCH-2025-06-02-b";
    c.databaseName = "billing"; // ignored on the fast path
    auto result = search().search(c, {});
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].descriptor.batchId, "BATCH-2025-06-02-b");
    EXPECT_DOUBLE_EQ(result.candidates[0].score, CandidateSearch::FAST_PATH_SCORE);
    EXPECT_EQ(ledger_.calls("query_batch_index"), 0);
}

TEST_F(CandidateSearchTest, UnknownBatchIdYieldsNothing) {
    ResolvedConstraint c;
    c.batchId = "BATCH-2025-06-09-zzz";
    EXPECT_TRUE(search().search(c, {}).candidates.empty());
}

TEST_F(CandidateSearchTest, FiltersAndScores) {
    ResolvedConstraint c;
    c.databaseName = "shop";
    c.tableName = "orders";
    auto result = search().search(c, {});
    EXPECT_EQ(result.ids(), (std::vector<std::string>{"BATCH-2025-06-02-b", "BATCH-2025-06-01-a"}));
    EXPECT_DOUBLE_EQ(result.candidates[0].score, 8.0);
    EXPECT_EQ(result.candidates[0].matchReason, "database, table");
    EXPECT_FALSE(result.possiblyIncomplete);
}

TEST_F(CandidateSearchTest, TimeRangeAndOperationScoring) {
    ResolvedConstraint c;
    c.timeRange = TimeRange{at("2025-06-02T00:00:00Z"), at("2025-06-03T00:00:00Z")};
    c.operation = OperationKind::DELETE;
    auto result = search().search(c, {});
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].descriptor.batchId, "BATCH-2025-06-02-b");
    EXPECT_DOUBLE_EQ(result.candidates[0].score, 3.0);
}

TEST_F(CandidateSearchTest, ScoreComponents) {
    BatchDescriptor b;
    b.databaseName = "shop";
    b.tableNames = {"orders"};
    b.createdAt = at("2025-06-02T10:00:00Z");
    b.transactionCount = 2;
    b.operationCounts[OperationKind::INSERT] = 2;

    ResolvedConstraint c;
    c.databaseName = "shop";
    c.tableName = "orders";
    c.timeRange = TimeRange{at("2025-06-02T00:00:00Z"), at("2025-06-03T00:00:00Z")};
    std::string reason;
    EXPECT_DOUBLE_EQ(CandidateSearch::score(b, c, &reason), 11.0);
    EXPECT_EQ(reason, "database, table, time range, operation");

    c.operation = OperationKind::DELETE;
    EXPECT_DOUBLE_EQ(CandidateSearch::score(b, c), 10.0);
}

/**
 * @brief Adding a consistent hint never grows the candidate list and never
 * loses the batch that holds the record.
 */
TEST_F(CandidateSearchTest, NarrowerHintsAreMonotonic) {
    ResolvedConstraint full;
    full.databaseName = "shop";
    full.tableName = "items";
    full.timeRange = TimeRange{at("2025-06-01T00:00:00Z"), at("2025-06-05T00:00:00Z")};
    full.operation = OperationKind::DELETE;
    const std::string holder = "BATCH-2025-06-02-b";

    auto constraintFor = [&](int mask) {
        ResolvedConstraint c;
        if (mask & 1) c.databaseName = full.databaseName;
        if (mask & 2) c.tableName = full.tableName;
        if (mask & 4) c.timeRange = full.timeRange;
        if (mask & 8) c.operation = full.operation;
        return c;
    };
    auto contains = [](const std::vector<std::string> &ids, const std::string &id) {
        return std::find(ids.begin(), ids.end(), id) != ids.end();
    };

    for (std::size_t cap : {std::size_t{1}, std::size_t{2}, std::size_t{50}}) {
        for (int mask = 0; mask < 16; ++mask) {
            auto wide = search(cap).search(constraintFor(mask), {}).ids();
            if (cap == 50)
                EXPECT_TRUE(contains(wide, holder)) << "mask " << mask;
            for (int bit = 1; bit < 16; bit <<= 1) {
                if (mask & bit)
                    continue;
                auto narrow = search(cap).search(constraintFor(mask | bit), {}).ids();
                EXPECT_LE(narrow.size(), wide.size())
                    << "cap " << cap << " mask " << mask << " + bit " << bit;
                if (contains(wide, holder))
                    EXPECT_TRUE(contains(narrow, holder))
                        << "cap " << cap << " mask " << mask << " + bit " << bit;
            }
        }
    }
}

TEST_F(CandidateSearchTest, UnconstrainedSearchIsCapped) {
    auto result = search(2).search(ResolvedConstraint{}, {});
    EXPECT_EQ(result.candidates.size(), 2u);
    EXPECT_TRUE(result.possiblyIncomplete);
    // Newest first when nothing scores.
    EXPECT_EQ(result.ids(), (std::vector<std::string>{"BATCH-2025-06-04-d", "BATCH-2025-06-03-c"}));

    auto all = search(10).search(ResolvedConstraint{}, {});
    EXPECT_EQ(all.candidates.size(), 4u);
    EXPECT_FALSE(all.possiblyIncomplete);
}

TEST_F(CandidateSearchTest, ConstrainedSearchIsCappedToo) {
    ledger_.addBatch("BATCH-2025-06-05-e", "shop", {"orders"}, {makeRecord(7)},
                     at("2025-06-05T10:00:00Z"));
    ledger_.addBatch("BATCH-2025-06-06-f", "shop", {"orders"}, {makeRecord(8)},
                     at("2025-06-06T10:00:00Z"));

    auto empty = search(2).search(ResolvedConstraint{}, {});
    ResolvedConstraint c;
    c.databaseName = "shop";
    auto byDatabase = search(2).search(c, {});
    EXPECT_EQ(empty.candidates.size(), 2u);
    EXPECT_EQ(byDatabase.candidates.size(), 2u);
    EXPECT_TRUE(byDatabase.possiblyIncomplete);
    EXPECT_EQ(byDatabase.ids(),
              (std::vector<std::string>{"BATCH-2025-06-06-f", "BATCH-2025-06-05-e"}));

    auto roomy = search(10).search(c, {});
    EXPECT_EQ(roomy.candidates.size(), 5u);
    EXPECT_FALSE(roomy.possiblyIncomplete);
}

TEST_F(CandidateSearchTest, TransientIndexFailureIsRetried) {
    ledger_.failNext("query_batch_index", 1);
    RetryPolicy::Options ro;
    ro.baseDelay = std::chrono::milliseconds(1);
    ro.jitter = 0.0;
    RetryPolicy quick(ro, 1);
    CandidateSearch s(ledger_, cache_, quick, CandidateSearch::Options{});
    ResolvedConstraint c;
    c.databaseName = "billing";
    EXPECT_EQ(s.search(c, {}).candidates.size(), 1u);
    EXPECT_EQ(ledger_.calls("query_batch_index"), 2);
}

TEST_F(CandidateSearchTest, ListBatchesPagesAndOrders) {
    auto page = search().listBatches(BatchFilter{}, 2, 1, BatchOrder::TimestampAsc, {});
    EXPECT_EQ(page.totalCount, 4u);
    ASSERT_EQ(page.batches.size(), 2u);
    EXPECT_EQ(page.batches[0].batchId, "BATCH-2025-06-02-b");
    EXPECT_EQ(page.batches[1].batchId, "BATCH-2025-06-03-c");
    EXPECT_TRUE(page.hasMore);

    auto last = search().listBatches(BatchFilter{}, 2, 2, BatchOrder::TimestampAsc, {});
    EXPECT_FALSE(last.hasMore);

    auto beyond = search().listBatches(BatchFilter{}, 10, 10, BatchOrder::TimestampDesc, {});
    EXPECT_TRUE(beyond.batches.empty());
    EXPECT_FALSE(beyond.hasMore);
}

TEST_F(CandidateSearchTest, ListBatchesClampsLimitAndFilters) {
    BatchFilter f;
    f.databaseName = "shop";
    f.minCount = 2;
    auto page = search().listBatches(f, 0, 0, BatchOrder::CountDesc, {});
    EXPECT_EQ(page.limit, 1u);
    EXPECT_EQ(page.totalCount, 2u);
    EXPECT_TRUE(page.hasMore);

    auto big = search().listBatches(BatchFilter{}, 5000, 0, BatchOrder::TimestampDesc, {});
    EXPECT_EQ(big.limit, CandidateSearch::MAX_LIST_LIMIT);
}

TEST_F(CandidateSearchTest, SearchBatchesByRootAndPattern) {
    auto target = ledger_.getBatch("BATCH-2025-06-03-c", {});
    ASSERT_TRUE(target.has_value());
    SearchCriteria byRoot;
    byRoot.merkleRoot = target->merkleRoot;
    auto result = search().searchBatches(byRoot, 50, {});
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].descriptor.batchId, "BATCH-2025-06-03-c");
    EXPECT_DOUBLE_EQ(result.candidates[0].score, 8.0);
    EXPECT_EQ(result.candidates[0].matchReason, "merkle root");

    SearchCriteria byPattern;
    byPattern.batchIdPattern = "2025-06-0";
    byPattern.databaseName = "shop";
    auto matches = search().searchBatches(byPattern, 2, {});
    EXPECT_EQ(matches.candidates.size(), 2u);
    EXPECT_TRUE(matches.possiblyIncomplete);
    EXPECT_DOUBLE_EQ(matches.candidates[0].score, 5.0);
}

TEST_F(CandidateSearchTest, SearchBatchesByTransactionHash) {
    SearchCriteria byHash;
    byHash.transactionHash = CanonicalHasher::digest(makeRecord(4, OperationKind::DELETE));
    EXPECT_THROW(search().searchBatches(byHash, 50, {}), InvalidRequest);

    CandidateSearch withStorage(ledger_, cache_, retry_, CandidateSearch::Options{}, &ledger_);
    auto result = withStorage.searchBatches(byHash, 50, {});
    ASSERT_EQ(result.candidates.size(), 1u);
    EXPECT_EQ(result.candidates[0].descriptor.batchId, "BATCH-2025-06-02-b");
    EXPECT_DOUBLE_EQ(result.candidates[0].score, 10.0);
    EXPECT_EQ(result.candidates[0].matchReason, "transaction hash");

    // Storage is only read for batches passing the cheaper criteria.
    const int fetchesBefore = ledger_.calls("fetch_batch_contents");
    byHash.databaseName = "billing";
    EXPECT_TRUE(withStorage.searchBatches(byHash, 50, {}).candidates.empty());
    EXPECT_EQ(ledger_.calls("fetch_batch_contents") - fetchesBefore, 1);
}

TEST(BatchOrderNames, Parse) {
    EXPECT_EQ(parseBatchOrder("timestamp_desc"), BatchOrder::TimestampDesc);
    EXPECT_EQ(parseBatchOrder("count_asc"), BatchOrder::CountAsc);
    EXPECT_FALSE(parseBatchOrder("random").has_value());
}
