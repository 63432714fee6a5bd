#include "utilities/digest.hpp"
#include <sodium.h>
#include <stdexcept>

namespace ledgerproof {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::string toHex(const uint8_t *data, std::size_t size) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> fromHex(const std::string &hex) {
  std::size_t start = 0;
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
    start = 2;
  if ((hex.size() - start) % 2 != 0)
    return std::nullopt;

  std::vector<uint8_t> out;
  out.reserve((hex.size() - start) / 2);
  for (std::size_t i = start; i < hex.size(); i += 2) {
    int hi = hexValue(hex[i]);
    int lo = hexValue(hex[i + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::optional<Digest> digestFromHex(const std::string &hex) {
  auto bytes = fromHex(hex);
  if (!bytes || bytes->size() != DIGEST_SIZE)
    return std::nullopt;
  Digest d{};
  std::copy(bytes->begin(), bytes->end(), d.begin());
  return d;
}

bool constantTimeEquals(const uint8_t *a, std::size_t aLen, const uint8_t *b,
                        std::size_t bLen) {
  if (aLen != bLen)
    return false;
  if (aLen == 0)
    return true;
  if (sodium_init() < 0)
    throw std::runtime_error("Failed to initialize libsodium");
  return sodium_memcmp(a, b, aLen) == 0;
}

} // namespace ledgerproof
