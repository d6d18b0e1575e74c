#include "docqa/hash/content_hash.hpp"

#include <array>

#include <openssl/evp.h>

namespace docqa::hash {

namespace {

auto to_hex(const unsigned char* digest, std::size_t n) -> std::string {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

} // namespace

auto content_hash(std::span<const std::uint8_t> bytes) -> std::expected<std::string, core::error> {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (EVP_Digest(bytes.data(), bytes.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
    return std::unexpected(core::error{core::error_code::internal, "EVP_Digest(sha256) failed", "hash.sha256"});
  }
  return to_hex(digest.data(), len);
}

auto content_hash(std::string_view bytes) -> std::expected<std::string, core::error> {
  return content_hash(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size()));
}

auto is_hex_digest(std::string_view s) noexcept -> bool {
  if (s.size() != kHexDigestLength) return false;
  for (char c : s) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) return false;
  }
  return true;
}

} // namespace docqa::hash
