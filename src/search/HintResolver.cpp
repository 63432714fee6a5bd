#include "search/HintResolver.h"
#include "ledger/errors.h"
#include "utilities/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace ledgerproof {

namespace {

bool blank(const std::string &s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

std::optional<Timestamp> parseBound(const std::optional<std::string> &text,
                                    const char *field,
                                    std::vector<InvalidHint::Field> &errors) {
  if (!text)
    return std::nullopt;
  auto parsed = parseIsoUtc(*text);
  if (parsed)
    return parsed.value;
  if (parsed.error == TimeParseError::Naive)
    errors.push_back({field, "must carry a UTC designator (Z or +HH:MM)"});
  else
    errors.push_back({field, "is not an ISO-8601 timestamp"});
  return std::nullopt;
}

} // namespace

bool HintResolver::isValidBatchId(const std::string &batchId) {
  static const std::regex pattern(
      R"(^BATCH-(\d{4})-(\d{2})-(\d{2})-[A-Za-z0-9_]+$)");
  std::smatch m;
  if (!std::regex_match(batchId, m, pattern))
    return false;
  return isValidDate(std::stoi(m[1].str()), std::stoi(m[2].str()),
                     std::stoi(m[3].str()));
}

ResolvedConstraint HintResolver::resolve(const VerificationHint &hint) {
  std::vector<InvalidHint::Field> errors;
  ResolvedConstraint out;

  if (hint.batchId) {
    if (isValidBatchId(*hint.batchId))
      out.batchId = *hint.batchId;
    else
      errors.push_back({"batch_id", "must match BATCH-YYYY-MM-DD-<suffix>"});
  }

  auto start = parseBound(hint.timeStart, "time_start", errors);
  auto end = parseBound(hint.timeEnd, "time_end", errors);
  if (hint.timeStart && !hint.timeEnd)
    errors.push_back({"time_end", "is required when time_start is given"});
  if (hint.timeEnd && !hint.timeStart)
    errors.push_back({"time_start", "is required when time_end is given"});
  if (start && end) {
    if (*start < *end)
      out.timeRange = TimeRange{*start, *end};
    else
      errors.push_back({"time_end", "must be after time_start"});
  }

  if (hint.databaseName) {
    if (blank(*hint.databaseName))
      errors.push_back({"database_name", "must not be blank"});
    else
      out.databaseName = *hint.databaseName;
  }
  if (hint.tableName) {
    if (blank(*hint.tableName))
      errors.push_back({"table_name", "must not be blank"});
    else
      out.tableName = *hint.tableName;
  }
  if (hint.expectedOperation) {
    if (auto op = parseOperation(*hint.expectedOperation))
      out.operation = op;
    else
      errors.push_back({"expected_operation", "must be INSERT, UPDATE or DELETE"});
  }

  if (!errors.empty())
    throw InvalidHint(std::move(errors));
  return out;
}

ResolvedConstraint HintResolver::merge(ResolvedConstraint constraint,
                                       const TransactionRecord &record) {
  std::vector<InvalidHint::Field> errors;

  if (!record.database().empty()) {
    if (!constraint.databaseName)
      constraint.databaseName = record.database();
    else if (*constraint.databaseName != record.database())
      errors.push_back({"database_name", "conflicts with the record's database"});
  }
  if (!record.table().empty()) {
    if (!constraint.tableName)
      constraint.tableName = record.table();
    else if (*constraint.tableName != record.table())
      errors.push_back({"table_name", "conflicts with the record's table"});
  }
  if (record.operation()) {
    if (!constraint.operation)
      constraint.operation = record.operation();
    else if (*constraint.operation != *record.operation())
      errors.push_back(
          {"expected_operation", "conflicts with the record's operation"});
  }

  if (!errors.empty())
    throw InvalidHint(std::move(errors));
  return constraint;
}

} // namespace ledgerproof
