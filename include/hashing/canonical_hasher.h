#ifndef LEDGERPROOF_CANONICAL_HASHER_H
#define LEDGERPROOF_CANONICAL_HASHER_H

#include "ledger/types.h"
#include "utilities/digest.hpp"
#include <cstdint>
#include <vector>

namespace ledgerproof {

/**
 * @brief Deterministic byte encoding and SHA-256 digest of a record.
 *
 * Encoding version 1:
 *   "LPCH" | 0x01 | u32 column count |
 *   per column (ascending name): u32 name length | name | tag | payload
 *
 * Tags: 0 null, 1 bool, 2 int64, 3 double, 4 string, 5 timestamp.
 * Integers are big-endian. Doubles are IEEE-754 bits with -0.0 folded into
 * +0.0; NaN and infinities are rejected. Timestamps are int64 microseconds
 * since the Unix epoch.
 *
 * Only the column values are covered. Database, table and operation are
 * matched against leaf metadata instead.
 */
class CanonicalHasher {
public:
  static constexpr uint8_t ENCODING_VERSION = 0x01;

  enum Tag : uint8_t {
    TAG_NULL = 0x00,
    TAG_BOOL = 0x01,
    TAG_INT = 0x02,
    TAG_DOUBLE = 0x03,
    TAG_STRING = 0x04,
    TAG_TIMESTAMP = 0x05,
  };

  /// Throws EncodingError for values that have no canonical form.
  static std::vector<uint8_t> serialize(const TransactionRecord &record);

  static Digest digest(const TransactionRecord &record);
};

} // namespace ledgerproof

#endif // LEDGERPROOF_CANONICAL_HASHER_H
