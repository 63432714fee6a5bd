#pragma once
#include "utilities/digest.hpp"
#include "utilities/time_utils.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file types.h
 * @brief Value types shared by every layer of the verification engine.
 */

namespace ledgerproof {

enum class OperationKind { INSERT, UPDATE, DELETE };

std::string toString(OperationKind op);
/// Case-insensitive parse; std::nullopt for anything but INSERT/UPDATE/DELETE.
std::optional<OperationKind> parseOperation(const std::string &text);

struct NullValue {
  bool operator==(const NullValue &) const { return true; }
};

using ColumnValue =
    std::variant<NullValue, bool, int64_t, double, std::string, Timestamp>;

/**
 * @brief One database row change as presented for verification.
 *
 * Immutable once built. Columns are kept ordered by name.
 */
class TransactionRecord {
public:
  using Columns = std::map<std::string, ColumnValue>;

  TransactionRecord() = default;
  TransactionRecord(std::string database, std::string table,
                    std::optional<OperationKind> operation, Columns values,
                    std::optional<Timestamp> localTime = std::nullopt)
      : database_(std::move(database)), table_(std::move(table)),
        operation_(operation), values_(std::move(values)),
        localTime_(localTime) {}

  /// Build from an ordered column list; duplicate names raise EncodingError.
  static TransactionRecord
  fromColumns(std::string database, std::string table,
              std::optional<OperationKind> operation,
              std::vector<std::pair<std::string, ColumnValue>> columns,
              std::optional<Timestamp> localTime = std::nullopt);

  const std::string &database() const { return database_; }
  const std::string &table() const { return table_; }
  const std::optional<OperationKind> &operation() const { return operation_; }
  const Columns &values() const { return values_; }
  const std::optional<Timestamp> &localTime() const { return localTime_; }

private:
  std::string database_;
  std::string table_;
  std::optional<OperationKind> operation_;
  Columns values_;
  std::optional<Timestamp> localTime_;
};

/// Caller-supplied search hints, unvalidated.
struct VerificationHint {
  std::optional<std::string> batchId;
  std::optional<std::string> timeStart;
  std::optional<std::string> timeEnd;
  std::optional<std::string> databaseName;
  std::optional<std::string> tableName;
  std::optional<std::string> expectedOperation;

  bool empty() const {
    return !batchId && !timeStart && !timeEnd && !databaseName && !tableName &&
           !expectedOperation;
  }
};

/// Half-open interval [start, end).
struct TimeRange {
  Timestamp start;
  Timestamp end;

  bool contains(Timestamp t) const { return t >= start && t < end; }
};

/// Hints after validation.
struct ResolvedConstraint {
  std::optional<std::string> batchId;
  std::optional<TimeRange> timeRange;
  std::optional<std::string> databaseName;
  std::optional<std::string> tableName;
  std::optional<OperationKind> operation;

  /// True when the batch id alone decides the candidate.
  bool fastPath() const { return batchId.has_value(); }

  /// True when nothing narrows the batch index query.
  bool unconstrained() const {
    return !batchId && !timeRange && !databaseName && !tableName;
  }
};

/**
 * @brief Ledger-side metadata for one anchored batch.
 *
 * merkleRoot is the root recorded on the ledger and is authoritative.
 */
struct BatchDescriptor {
  std::string batchId;
  Digest merkleRoot{};
  Timestamp createdAt{};
  std::string databaseName;
  std::vector<std::string> tableNames;
  uint64_t transactionCount = 0;
  std::map<OperationKind, uint64_t> operationCounts;
  std::string storageRef;
  std::optional<uint64_t> sizeBytes;

  bool hasTable(const std::string &table) const;
};

enum class ProofSide { Left, Right };

struct ProofStep {
  std::vector<uint8_t> sibling;
  ProofSide side = ProofSide::Right;
};

/// Path from a leaf to the root. Steps are ordered leaf first.
struct MerkleProof {
  uint64_t leafIndex = 0;
  std::vector<ProofStep> steps;
};

struct BatchLeaf {
  Digest digest{};
  std::optional<OperationKind> operation;
};

/// Stored content of one batch as returned by object storage.
struct BatchContents {
  std::vector<BatchLeaf> leaves;
  std::map<uint64_t, MerkleProof> proofs;
};

enum class VerdictKind { Verified, Tampered, NotFound, Ambiguous, Error };

std::string toString(VerdictKind kind);

struct VerificationVerdict {
  VerdictKind kind = VerdictKind::Error;
  std::optional<std::string> batchId;
  std::optional<Digest> leafDigest;
  std::optional<Digest> expectedRoot;
  std::optional<MerkleProof> proof;
  std::vector<std::string> candidates;
  std::string reason;
  bool retryable = false;
  bool cancelled = false;
  bool searchIncomplete = false;
  std::optional<OperationKind> operation;
  std::optional<uint64_t> position;
  std::optional<Timestamp> blockchainTimestamp;
  std::chrono::milliseconds elapsed{0};

  bool verified() const { return kind == VerdictKind::Verified; }
};

} // namespace ledgerproof
