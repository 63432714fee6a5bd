#ifndef LEDGERPROOF_HASH_STREAM_HPP
#define LEDGERPROOF_HASH_STREAM_HPP

#include "utilities/digest.hpp"
#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <string>
#include <vector>

namespace ledgerproof {

struct DigestResult {
  Digest digest;
  std::string hex;
};

/**
 * @brief Incremental SHA-256 over a byte stream.
 *
 * Integers are appended big-endian. The ingested bytes are kept so callers
 * can inspect the exact encoding that was hashed.
 */
class HashStream {
public:
  HashStream();

  void ingest(const std::byte *data, std::size_t size);
  void ingest(const uint8_t *data, std::size_t size);
  void ingest(const std::string &bytes);

  void ingestU8(uint8_t value);
  void ingestU32(uint32_t value);
  void ingestU64(uint64_t value);

  /// Finish the hash. Throws std::logic_error when called twice.
  DigestResult finalize_hashed();

  /// Copy of every byte ingested so far.
  std::vector<uint8_t> finalize_raw() const { return buffer_; }

  static Digest sha256(const uint8_t *data, std::size_t size);
  static Digest sha256(const std::vector<uint8_t> &data) {
    return sha256(data.data(), data.size());
  }
  /// SHA-256(left || right).
  static Digest combine(const uint8_t *left, const uint8_t *right);

private:
  std::vector<uint8_t> buffer_;
  crypto_hash_sha256_state state_;
  bool finalized_ = false;
};

} // namespace ledgerproof

#endif // LEDGERPROOF_HASH_STREAM_HPP
