#include "ledger/types.h"
#include "ledger/errors.h"
#include <algorithm>
#include <cctype>

namespace ledgerproof {

std::string toString(OperationKind op) {
  switch (op) {
  case OperationKind::INSERT:
    return "INSERT";
  case OperationKind::UPDATE:
    return "UPDATE";
  case OperationKind::DELETE:
    return "DELETE";
  }
  return "UNKNOWN";
}

std::optional<OperationKind> parseOperation(const std::string &text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "INSERT")
    return OperationKind::INSERT;
  if (upper == "UPDATE")
    return OperationKind::UPDATE;
  if (upper == "DELETE")
    return OperationKind::DELETE;
  return std::nullopt;
}

std::string toString(VerdictKind kind) {
  switch (kind) {
  case VerdictKind::Verified:
    return "verified";
  case VerdictKind::Tampered:
    return "tampered";
  case VerdictKind::NotFound:
    return "not_found";
  case VerdictKind::Ambiguous:
    return "ambiguous";
  case VerdictKind::Error:
    return "error";
  }
  return "error";
}

TransactionRecord TransactionRecord::fromColumns(
    std::string database, std::string table,
    std::optional<OperationKind> operation,
    std::vector<std::pair<std::string, ColumnValue>> columns,
    std::optional<Timestamp> localTime) {
  Columns values;
  for (auto &col : columns) {
    if (!values.emplace(col.first, std::move(col.second)).second)
      throw EncodingError(col.first, "duplicate column name");
  }
  return TransactionRecord(std::move(database), std::move(table), operation,
                           std::move(values), localTime);
}

bool BatchDescriptor::hasTable(const std::string &table) const {
  return std::find(tableNames.begin(), tableNames.end(), table) !=
         tableNames.end();
}

} // namespace ledgerproof
