#pragma once
#include "ledger/types.h"
#include <nlohmann/json.hpp>

/**
 * @file json_codec.h
 * @brief JSON shapes used by the tool API and the batch archive.
 *
 * Malformed input raises InvalidRequest, except unsupported column values
 * (EncodingError) and non-string hint fields (InvalidHint).
 */

namespace ledgerproof {

/**
 * Accepts either
 *   {"database_name", "table_name", "operation", "timestamp", "values": {...}}
 * or a flat object whose members are the column values.
 */
TransactionRecord recordFromJson(const nlohmann::json &j);
nlohmann::json recordToJson(const TransactionRecord &record);

/// A null or absent object yields an empty hint.
VerificationHint hintFromJson(const nlohmann::json &j);

nlohmann::json verdictToJson(const VerificationVerdict &verdict);
nlohmann::json proofToJson(const MerkleProof &proof);
MerkleProof proofFromJson(const nlohmann::json &j);

nlohmann::json descriptorToJson(const BatchDescriptor &batch);
BatchDescriptor descriptorFromJson(const nlohmann::json &j);

nlohmann::json contentsToJson(const BatchContents &contents);
BatchContents contentsFromJson(const nlohmann::json &j);

} // namespace ledgerproof
