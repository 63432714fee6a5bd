#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ledgerproof {

/** @brief Root of every exception raised by the verification engine. */
class LedgerProofError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief A verification hint failed validation.
 *
 * Carries one entry per offending field so callers can report all problems
 * at once.
 */
class InvalidHint : public LedgerProofError {
public:
  struct Field {
    std::string name;
    std::string problem;
  };

  explicit InvalidHint(std::vector<Field> fields)
      : LedgerProofError(describe(fields)), fields_(std::move(fields)) {}

  const std::vector<Field> &fields() const { return fields_; }

  std::vector<std::string> fieldNames() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto &f : fields_)
      names.push_back(f.name);
    return names;
  }

private:
  static std::string describe(const std::vector<Field> &fields) {
    std::string msg = "invalid hint";
    const char *sep = ": ";
    for (const auto &f : fields) {
      msg += sep + f.name + " " + f.problem;
      sep = "; ";
    }
    return msg;
  }

  std::vector<Field> fields_;
};

/** @brief A record could not be canonically encoded. */
class EncodingError : public LedgerProofError {
public:
  EncodingError(std::string column, const std::string &detail)
      : LedgerProofError("cannot encode column '" + column + "': " + detail),
        column_(std::move(column)) {}

  const std::string &column() const { return column_; }

private:
  std::string column_;
};

/** @brief A ledger or storage call failed. */
class CollaboratorError : public LedgerProofError {
public:
  CollaboratorError(std::string call, const std::string &detail)
      : LedgerProofError(call + ": " + detail), call_(std::move(call)) {}

  const std::string &call() const { return call_; }

private:
  std::string call_;
};

/// Failure that may succeed on retry (timeouts, I/O errors, throttling).
class TransientCollaboratorError : public CollaboratorError {
public:
  using CollaboratorError::CollaboratorError;
};

/// Failure that will not change on retry (malformed data, bad reference).
class PermanentCollaboratorError : public CollaboratorError {
public:
  using CollaboratorError::CollaboratorError;
};

/** @brief Work was abandoned because its cancellation token fired. */
class Cancelled : public LedgerProofError {
public:
  explicit Cancelled(const std::string &where)
      : LedgerProofError("cancelled during " + where) {}
};

class ConfigError : public LedgerProofError {
public:
  using LedgerProofError::LedgerProofError;
};

/** @brief A tool request was structurally invalid. */
class InvalidRequest : public LedgerProofError {
public:
  using LedgerProofError::LedgerProofError;
};

} // namespace ledgerproof
