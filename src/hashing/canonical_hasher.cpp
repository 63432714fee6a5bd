#include "hashing/canonical_hasher.h"
#include "ledger/errors.h"
#include "utilities/hash_stream.hpp"
#include <bit>
#include <cmath>
#include <limits>
#include <type_traits>

namespace ledgerproof {

namespace {

void writeLength(HashStream &out, const std::string &column, std::size_t n) {
  if (n > std::numeric_limits<uint32_t>::max())
    throw EncodingError(column, "value too long");
  out.ingestU32(static_cast<uint32_t>(n));
}

struct ValueWriter {
  HashStream &out;
  const std::string &column;

  void operator()(const NullValue &) const {
    out.ingestU8(CanonicalHasher::TAG_NULL);
  }
  void operator()(bool v) const {
    out.ingestU8(CanonicalHasher::TAG_BOOL);
    out.ingestU8(v ? 1 : 0);
  }
  void operator()(int64_t v) const {
    out.ingestU8(CanonicalHasher::TAG_INT);
    out.ingestU64(static_cast<uint64_t>(v));
  }
  void operator()(double v) const {
    if (!std::isfinite(v))
      throw EncodingError(column, "non-finite floating point value");
    if (v == 0.0)
      v = 0.0;
    out.ingestU8(CanonicalHasher::TAG_DOUBLE);
    out.ingestU64(std::bit_cast<uint64_t>(v));
  }
  void operator()(const std::string &v) const {
    out.ingestU8(CanonicalHasher::TAG_STRING);
    writeLength(out, column, v.size());
    out.ingest(v);
  }
  void operator()(const Timestamp &v) const {
    out.ingestU8(CanonicalHasher::TAG_TIMESTAMP);
    out.ingestU64(static_cast<uint64_t>(v.time_since_epoch().count()));
  }
};

HashStream encode(const TransactionRecord &record) {
  HashStream out;
  out.ingest(std::string("LPCH"));
  out.ingestU8(CanonicalHasher::ENCODING_VERSION);
  const auto &values = record.values();
  writeLength(out, "", values.size());
  // std::map iterates in ascending name order.
  for (const auto &[name, value] : values) {
    writeLength(out, name, name.size());
    out.ingest(name);
    std::visit(ValueWriter{out, name}, value);
  }
  return out;
}

} // namespace

std::vector<uint8_t> CanonicalHasher::serialize(const TransactionRecord &record) {
  return encode(record).finalize_raw();
}

Digest CanonicalHasher::digest(const TransactionRecord &record) {
  return encode(record).finalize_hashed().digest;
}

} // namespace ledgerproof
