#include "utilities/hash_stream.hpp"
#include <stdexcept>

namespace ledgerproof {

namespace {

void ensureSodium() {
  // sodium_init() returns 1 when already initialized.
  if (sodium_init() < 0)
    throw std::runtime_error("Failed to initialize libsodium");
}

} // namespace

HashStream::HashStream() {
  ensureSodium();
  crypto_hash_sha256_init(&state_);
}

void HashStream::ingest(const uint8_t *data, std::size_t size) {
  if (finalized_)
    throw std::logic_error("Cannot ingest data after finalize_hashed()");
  if (!data || size == 0)
    return;
  buffer_.insert(buffer_.end(), data, data + size);
  crypto_hash_sha256_update(&state_, data, size);
}

void HashStream::ingest(const std::byte *data, std::size_t size) {
  ingest(reinterpret_cast<const uint8_t *>(data), size);
}

void HashStream::ingest(const std::string &bytes) {
  ingest(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size());
}

void HashStream::ingestU8(uint8_t value) { ingest(&value, 1); }

void HashStream::ingestU32(uint32_t value) {
  uint8_t be[4];
  for (int i = 3; i >= 0; --i) {
    be[i] = static_cast<uint8_t>(value & 0xFF);
    value >>= 8;
  }
  ingest(be, sizeof(be));
}

void HashStream::ingestU64(uint64_t value) {
  uint8_t be[8];
  for (int i = 7; i >= 0; --i) {
    be[i] = static_cast<uint8_t>(value & 0xFF);
    value >>= 8;
  }
  ingest(be, sizeof(be));
}

DigestResult HashStream::finalize_hashed() {
  if (finalized_)
    throw std::logic_error("finalize_hashed() already called");
  DigestResult result;
  crypto_hash_sha256_final(&state_, result.digest.data());
  result.hex = toHex(result.digest);
  finalized_ = true;
  return result;
}

Digest HashStream::sha256(const uint8_t *data, std::size_t size) {
  ensureSodium();
  Digest out{};
  crypto_hash_sha256(out.data(), data, size);
  return out;
}

Digest HashStream::combine(const uint8_t *left, const uint8_t *right) {
  ensureSodium();
  crypto_hash_sha256_state st;
  crypto_hash_sha256_init(&st);
  crypto_hash_sha256_update(&st, left, DIGEST_SIZE);
  crypto_hash_sha256_update(&st, right, DIGEST_SIZE);
  Digest out{};
  crypto_hash_sha256_final(&st, out.data());
  return out;
}

} // namespace ledgerproof
