#pragma once

#include "hashing/canonical_hasher.h"
#include "ledger/LedgerClient.h"
#include "ledger/StorageClient.h"
#include "ledger/errors.h"
#include "merkle/merkle_proof.h"
#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledgerproof {
namespace fixtures {

inline Timestamp at(const std::string &iso) { return *parseIsoUtc(iso).value; }

/// Record in orders/<db> with an integer id and a couple of columns.
inline TransactionRecord makeRecord(int64_t id,
                                    std::optional<OperationKind> op =
                                        OperationKind::INSERT,
                                    const std::string &db = "shop",
                                    const std::string &table = "orders") {
    TransactionRecord::Columns cols;
    cols["id"] = id;
    cols["customer"] = std::string("cust-") + std::to_string(id % 7);
    cols["amount"] = static_cast<double>(id) * 10.5;
    return TransactionRecord(db, table, op, std::move(cols));
}

/**
 * In-memory ledger and object store.
 *
 * Latency and failures can be injected per call name ("query_batch_index",
 * "get_batch", "get_batch_root", "fetch_batch_contents").
 */
class FakeLedger : public LedgerClient, public StorageClient {
public:
    using LatencyFn = std::function<std::chrono::milliseconds(const std::string &)>;

    BatchDescriptor addBatch(const std::string &id, const std::string &db,
                             std::vector<std::string> tables,
                             const std::vector<TransactionRecord> &records,
                             Timestamp createdAt, bool storeProofs = false) {
        BatchDescriptor d;
        d.batchId = id;
        d.databaseName = db;
        d.tableNames = std::move(tables);
        d.createdAt = createdAt;
        d.storageRef = "batches/" + id + ".json";
        BatchContents contents;
        std::vector<Digest> digests;
        for (const auto &r : records) {
            Digest digest = CanonicalHasher::digest(r);
            digests.push_back(digest);
            contents.leaves.push_back({digest, r.operation()});
            if (r.operation())
                ++d.operationCounts[*r.operation()];
        }
        d.transactionCount = records.size();
        if (!digests.empty())
            d.merkleRoot = MerkleTree::computeRoot(digests);
        if (storeProofs) {
            for (std::size_t i = 0; i < digests.size(); ++i)
                contents.proofs[i] = MerkleTree::buildProof(digests, i);
        }
        put(d, contents);
        return d;
    }

    void put(const BatchDescriptor &d, const BatchContents &contents) {
        std::lock_guard<std::mutex> lg(mtx_);
        batches_[d.batchId] = d;
        roots_[d.batchId] = d.merkleRoot;
        objects_[d.storageRef] = contents;
    }

    /// Replace a stored leaf without touching the anchored root.
    void tamperLeaf(const std::string &id, std::size_t index, const Digest &digest) {
        std::lock_guard<std::mutex> lg(mtx_);
        objects_[batches_.at(id).storageRef].leaves.at(index).digest = digest;
    }

    /// Make getBatchRoot() disagree with the descriptor copy.
    void setAnchoredRoot(const std::string &id, std::optional<Digest> root) {
        std::lock_guard<std::mutex> lg(mtx_);
        if (root)
            roots_[id] = *root;
        else
            roots_.erase(id);
    }

    void setLatency(LatencyFn fn) {
        std::lock_guard<std::mutex> lg(mtx_);
        latency_ = std::move(fn);
    }

    /// The next @p count calls named @p call throw.
    void failNext(const std::string &call, int count, bool transient = true) {
        std::lock_guard<std::mutex> lg(mtx_);
        failures_[call] = {count, transient};
    }

    int calls(const std::string &call) const {
        std::lock_guard<std::mutex> lg(mtx_);
        auto it = calls_.find(call);
        return it == calls_.end() ? 0 : it->second;
    }

    BatchIndexPage queryBatchIndex(const BatchQuery &query,
                                   const CancellationToken &token) override {
        enter("query_batch_index", token);
        std::vector<BatchDescriptor> matched;
        {
            std::lock_guard<std::mutex> lg(mtx_);
            for (const auto &[id, b] : batches_) {
                if (matchesQuery(b, query))
                    matched.push_back(b);
            }
        }
        sortNewestFirst(matched);
        BatchIndexPage page;
        page.total = matched.size();
        std::size_t first = std::min(query.offset, matched.size());
        std::size_t last = query.limit == 0 ? matched.size()
                                            : std::min(matched.size(), first + query.limit);
        page.batches.assign(matched.begin() + first, matched.begin() + last);
        return page;
    }

    std::optional<BatchDescriptor> getBatch(const std::string &batchId,
                                            const CancellationToken &token) override {
        enter("get_batch", token);
        std::lock_guard<std::mutex> lg(mtx_);
        auto it = batches_.find(batchId);
        if (it == batches_.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<Digest> getBatchRoot(const std::string &batchId,
                                       const CancellationToken &token) override {
        enter("get_batch_root", token);
        std::lock_guard<std::mutex> lg(mtx_);
        auto it = roots_.find(batchId);
        if (it == roots_.end())
            return std::nullopt;
        return it->second;
    }

    ContractStats contractStats(const CancellationToken &token) override {
        enter("contract_stats", token);
        std::lock_guard<std::mutex> lg(mtx_);
        ContractStats stats;
        for (const auto &[id, b] : batches_) {
            ++stats.totalBatches;
            stats.totalTransactions += b.transactionCount;
            if (!stats.earliest || b.createdAt < *stats.earliest)
                stats.earliest = b.createdAt;
            if (!stats.latest || b.createdAt > *stats.latest)
                stats.latest = b.createdAt;
            if (std::find(stats.databases.begin(), stats.databases.end(),
                          b.databaseName) == stats.databases.end())
                stats.databases.push_back(b.databaseName);
        }
        return stats;
    }

    BatchContents fetchBatchContents(const std::string &storageRef,
                                     const CancellationToken &token) override {
        enter("fetch_batch_contents", token);
        std::lock_guard<std::mutex> lg(mtx_);
        auto it = objects_.find(storageRef);
        if (it == objects_.end())
            throw PermanentCollaboratorError("fetch_batch_contents", "no object " + storageRef);
        return it->second;
    }

private:
    struct Failure {
        int remaining = 0;
        bool transient = true;
    };

    void enter(const std::string &call, const CancellationToken &token) {
        std::chrono::milliseconds delay{0};
        bool fail = false;
        bool transient = true;
        {
            std::lock_guard<std::mutex> lg(mtx_);
            ++calls_[call];
            if (latency_)
                delay = latency_(call);
            auto it = failures_.find(call);
            if (it != failures_.end() && it->second.remaining > 0) {
                --it->second.remaining;
                fail = true;
                transient = it->second.transient;
            }
        }
        if (delay.count() > 0 && !token.waitFor(delay))
            throw Cancelled(call);
        token.throwIfCancelled(call);
        if (fail) {
            if (transient)
                throw TransientCollaboratorError(call, "injected failure");
            throw PermanentCollaboratorError(call, "injected failure");
        }
    }

    mutable std::mutex mtx_;
    std::map<std::string, BatchDescriptor> batches_;
    std::map<std::string, Digest> roots_;
    std::map<std::string, BatchContents> objects_;
    std::map<std::string, int> calls_;
    std::map<std::string, Failure> failures_;
    LatencyFn latency_;
};

} // namespace fixtures
} // namespace ledgerproof
