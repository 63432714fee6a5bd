#include "ledger/json_codec.h"
#include "ledger/errors.h"
#include "utilities/time_utils.hpp"
#include <limits>
#include <type_traits>

namespace ledgerproof {

using nlohmann::json;

namespace {

ColumnValue columnFromJson(const std::string &name, const json &v) {
  switch (v.type()) {
  case json::value_t::null:
    return NullValue{};
  case json::value_t::boolean:
    return v.get<bool>();
  case json::value_t::number_integer:
    return v.get<int64_t>();
  case json::value_t::number_unsigned: {
    auto u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      throw EncodingError(name, "integer exceeds signed 64-bit range");
    return static_cast<int64_t>(u);
  }
  case json::value_t::number_float:
    return v.get<double>();
  case json::value_t::string:
    return v.get<std::string>();
  default:
    throw EncodingError(name, std::string("unsupported JSON type ") +
                                  v.type_name());
  }
}

json columnToJson(const ColumnValue &value) {
  return std::visit(
      [](const auto &v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, NullValue>)
          return nullptr;
        else if constexpr (std::is_same_v<T, Timestamp>)
          return formatIsoUtc(v);
        else
          return v;
      },
      value);
}

std::optional<std::string> optionalString(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  if (!it->is_string())
    throw InvalidRequest(std::string(key) + " must be a string");
  return it->get<std::string>();
}

const json &required(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    throw InvalidRequest(std::string("missing field ") + key);
  return *it;
}

Timestamp timestampFromJson(const json &v, const char *key) {
  if (v.is_number_integer() || v.is_number_unsigned())
    return fromUnixMillis(v.get<int64_t>());
  if (v.is_string()) {
    auto parsed = parseIsoUtc(v.get<std::string>());
    if (parsed)
      return *parsed.value;
  }
  throw InvalidRequest(std::string(key) +
                       " must be an ISO-8601 UTC timestamp or epoch millis");
}

Digest digestField(const json &v, const char *key) {
  if (v.is_string()) {
    if (auto d = digestFromHex(v.get<std::string>()))
      return *d;
  }
  throw InvalidRequest(std::string(key) + " must be a 32-byte hex digest");
}

std::optional<OperationKind> operationField(const json &j, const char *key) {
  auto text = optionalString(j, key);
  if (!text)
    return std::nullopt;
  auto op = parseOperation(*text);
  if (!op)
    throw InvalidRequest(std::string(key) + " must be INSERT, UPDATE or DELETE");
  return op;
}

uint64_t countField(const json &v, const char *key) {
  if (v.is_number_unsigned() ||
      (v.is_number_integer() && v.get<int64_t>() >= 0))
    return v.get<uint64_t>();
  throw InvalidRequest(std::string(key) + " must be a non-negative integer");
}

} // namespace

TransactionRecord recordFromJson(const json &j) {
  if (!j.is_object())
    throw InvalidRequest("transaction must be a JSON object");

  auto values = j.find("values");
  if (values == j.end() || !values->is_object()) {
    std::vector<std::pair<std::string, ColumnValue>> columns;
    for (auto it = j.begin(); it != j.end(); ++it)
      columns.emplace_back(it.key(), columnFromJson(it.key(), it.value()));
    return TransactionRecord::fromColumns("", "", std::nullopt,
                                          std::move(columns));
  }

  std::vector<std::pair<std::string, ColumnValue>> columns;
  for (auto it = values->begin(); it != values->end(); ++it)
    columns.emplace_back(it.key(), columnFromJson(it.key(), it.value()));

  std::optional<Timestamp> localTime;
  if (auto ts = j.find("timestamp"); ts != j.end() && !ts->is_null())
    localTime = timestampFromJson(*ts, "timestamp");

  return TransactionRecord::fromColumns(
      optionalString(j, "database_name").value_or(""),
      optionalString(j, "table_name").value_or(""),
      operationField(j, "operation"), std::move(columns), localTime);
}

json recordToJson(const TransactionRecord &record) {
  json values = json::object();
  for (const auto &[name, value] : record.values())
    values[name] = columnToJson(value);
  json out = {{"database_name", record.database()},
              {"table_name", record.table()},
              {"values", values}};
  if (record.operation())
    out["operation"] = toString(*record.operation());
  if (record.localTime())
    out["timestamp"] = formatIsoUtc(*record.localTime());
  return out;
}

VerificationHint hintFromJson(const json &j) {
  VerificationHint hint;
  if (j.is_null())
    return hint;
  if (!j.is_object())
    throw InvalidRequest("hints must be a JSON object");

  std::vector<InvalidHint::Field> errors;
  auto field = [&](const char *key, std::optional<std::string> &out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
      return;
    if (!it->is_string()) {
      errors.push_back({key, "must be a string"});
      return;
    }
    out = it->get<std::string>();
  };
  field("batch_id", hint.batchId);
  field("time_start", hint.timeStart);
  field("time_end", hint.timeEnd);
  field("database_name", hint.databaseName);
  field("table_name", hint.tableName);
  field("expected_operation", hint.expectedOperation);
  if (!errors.empty())
    throw InvalidHint(std::move(errors));
  return hint;
}

json proofToJson(const MerkleProof &proof) {
  json path = json::array();
  json sides = json::array();
  for (const auto &step : proof.steps) {
    path.push_back(toHex(step.sibling));
    sides.push_back(step.side == ProofSide::Left ? "left" : "right");
  }
  return {{"leaf_index", proof.leafIndex},
          {"proof_path", path},
          {"sibling_positions", sides}};
}

MerkleProof proofFromJson(const json &j) {
  if (!j.is_object())
    throw InvalidRequest("proof must be a JSON object");
  MerkleProof proof;
  proof.leafIndex = countField(required(j, "leaf_index"), "leaf_index");
  const json &path = required(j, "proof_path");
  const json &sides = required(j, "sibling_positions");
  if (!path.is_array() || !sides.is_array() || path.size() != sides.size())
    throw InvalidRequest("proof_path and sibling_positions must be arrays of "
                         "equal length");
  for (std::size_t i = 0; i < path.size(); ++i) {
    ProofStep step;
    auto bytes = path[i].is_string() ? fromHex(path[i].get<std::string>())
                                     : std::nullopt;
    if (!bytes)
      throw InvalidRequest("proof_path entries must be hex strings");
    step.sibling = std::move(*bytes);
    const std::string side = sides[i].is_string() ? sides[i].get<std::string>()
                                                  : std::string();
    if (side == "left")
      step.side = ProofSide::Left;
    else if (side == "right")
      step.side = ProofSide::Right;
    else
      throw InvalidRequest("sibling_positions entries must be left or right");
    proof.steps.push_back(std::move(step));
  }
  return proof;
}

json verdictToJson(const VerificationVerdict &v) {
  json out;
  out["outcome"] = toString(v.kind);
  out["verified"] = v.verified();
  out["transaction_hash"] = v.leafDigest ? json(toHex(*v.leafDigest)) : json();
  out["batch_id"] = v.batchId ? json(*v.batchId) : json();
  out["expected_root"] = v.expectedRoot ? json(toHex(*v.expectedRoot)) : json();
  if (v.proof && v.leafDigest && v.expectedRoot) {
    json proof = proofToJson(*v.proof);
    proof["leaf_hash"] = toHex(*v.leafDigest);
    proof["merkle_root"] = toHex(*v.expectedRoot);
    proof["is_valid"] = v.kind == VerdictKind::Verified;
    out["merkle_proof"] = proof;
  } else {
    out["merkle_proof"] = nullptr;
  }
  out["candidates"] = v.candidates;
  out["reason"] = v.reason;
  out["retryable"] = v.retryable;
  out["cancelled"] = v.cancelled;
  out["search_incomplete"] = v.searchIncomplete;
  out["operation_type"] = v.operation ? json(toString(*v.operation)) : json();
  out["position"] = v.position ? json(*v.position) : json();
  out["blockchain_timestamp"] =
      v.blockchainTimestamp ? json(formatIsoUtc(*v.blockchainTimestamp)) : json();
  out["processing_time_ms"] = v.elapsed.count();
  return out;
}

json descriptorToJson(const BatchDescriptor &b) {
  json counts = json::object();
  for (const auto &[op, n] : b.operationCounts)
    counts[toString(op)] = n;
  json out = {{"batch_id", b.batchId},
              {"merkle_root", toHex(b.merkleRoot)},
              {"timestamp", formatIsoUtc(b.createdAt)},
              {"database_name", b.databaseName},
              {"table_names", b.tableNames},
              {"transaction_count", b.transactionCount},
              {"operation_counts", counts},
              {"storage_ref", b.storageRef}};
  out["size_bytes"] = b.sizeBytes ? json(*b.sizeBytes) : json();
  return out;
}

BatchDescriptor descriptorFromJson(const json &j) {
  if (!j.is_object())
    throw InvalidRequest("batch must be a JSON object");
  BatchDescriptor b;
  const json &id = required(j, "batch_id");
  if (!id.is_string())
    throw InvalidRequest("batch_id must be a string");
  b.batchId = id.get<std::string>();
  b.merkleRoot = digestField(required(j, "merkle_root"), "merkle_root");
  b.createdAt = timestampFromJson(required(j, "timestamp"), "timestamp");
  b.databaseName = optionalString(j, "database_name").value_or("");
  if (auto tables = j.find("table_names"); tables != j.end()) {
    if (!tables->is_array())
      throw InvalidRequest("table_names must be an array");
    for (const auto &t : *tables) {
      if (!t.is_string())
        throw InvalidRequest("table_names entries must be strings");
      b.tableNames.push_back(t.get<std::string>());
    }
  }
  b.transactionCount =
      countField(required(j, "transaction_count"), "transaction_count");
  if (auto counts = j.find("operation_counts"); counts != j.end()) {
    if (!counts->is_object())
      throw InvalidRequest("operation_counts must be an object");
    for (auto it = counts->begin(); it != counts->end(); ++it) {
      auto op = parseOperation(it.key());
      if (!op)
        throw InvalidRequest("unknown operation in operation_counts: " +
                             it.key());
      b.operationCounts[*op] = countField(it.value(), "operation_counts");
    }
  }
  b.storageRef = optionalString(j, "storage_ref").value_or("");
  if (auto size = j.find("size_bytes"); size != j.end() && !size->is_null())
    b.sizeBytes = countField(*size, "size_bytes");
  return b;
}

json contentsToJson(const BatchContents &contents) {
  json leaves = json::array();
  for (const auto &leaf : contents.leaves) {
    json l = {{"hash", toHex(leaf.digest)}};
    l["operation"] = leaf.operation ? json(toString(*leaf.operation)) : json();
    leaves.push_back(l);
  }
  json out = {{"leaves", leaves}};
  if (!contents.proofs.empty()) {
    json proofs = json::object();
    for (const auto &[index, proof] : contents.proofs)
      proofs[std::to_string(index)] = proofToJson(proof);
    out["proofs"] = proofs;
  }
  return out;
}

BatchContents contentsFromJson(const json &j) {
  if (!j.is_object())
    throw InvalidRequest("batch contents must be a JSON object");
  BatchContents contents;
  const json &leaves = required(j, "leaves");
  if (!leaves.is_array())
    throw InvalidRequest("leaves must be an array");
  for (const auto &l : leaves) {
    if (!l.is_object())
      throw InvalidRequest("leaves entries must be objects");
    BatchLeaf leaf;
    leaf.digest = digestField(required(l, "hash"), "hash");
    leaf.operation = operationField(l, "operation");
    contents.leaves.push_back(leaf);
  }
  if (auto proofs = j.find("proofs"); proofs != j.end() && !proofs->is_null()) {
    if (!proofs->is_object())
      throw InvalidRequest("proofs must be an object keyed by leaf index");
    for (auto it = proofs->begin(); it != proofs->end(); ++it) {
      uint64_t index = 0;
      try {
        index = std::stoull(it.key());
      } catch (const std::exception &) {
        throw InvalidRequest("proof key is not a leaf index: " + it.key());
      }
      contents.proofs[index] = proofFromJson(it.value());
    }
  }
  return contents;
}

} // namespace ledgerproof
