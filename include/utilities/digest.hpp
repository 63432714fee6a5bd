#ifndef LEDGERPROOF_DIGEST_HPP
#define LEDGERPROOF_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledgerproof {

/// Digest size for SHA-256 (32 bytes).
inline constexpr std::size_t DIGEST_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/// Lower-case hex encoding of @p size bytes.
std::string toHex(const uint8_t *data, std::size_t size);

inline std::string toHex(const Digest &digest) {
  return toHex(digest.data(), digest.size());
}

inline std::string toHex(const std::vector<uint8_t> &bytes) {
  return toHex(bytes.data(), bytes.size());
}

/**
 * @brief Decode a hex string.
 *
 * Accepts an optional "0x" prefix and either letter case.
 * @return Decoded bytes, or std::nullopt for odd length or non-hex characters.
 */
std::optional<std::vector<uint8_t>> fromHex(const std::string &hex);

/// Decode a hex string that must hold exactly DIGEST_SIZE bytes.
std::optional<Digest> digestFromHex(const std::string &hex);

/**
 * @brief Compare two byte ranges without data-dependent early exit.
 *
 * Lengths are checked first; equal-length buffers are always compared in
 * full.
 */
bool constantTimeEquals(const uint8_t *a, std::size_t aLen, const uint8_t *b,
                        std::size_t bLen);

inline bool constantTimeEquals(const Digest &a, const Digest &b) {
  return constantTimeEquals(a.data(), a.size(), b.data(), b.size());
}

} // namespace ledgerproof

#endif // LEDGERPROOF_DIGEST_HPP
