#pragma once

/** \file content_hash.hpp
 *  \brief SHA-256 content fingerprint of raw upload bytes.
 *
 * The digest is the deduplication key of the document registry and is also
 * surfaced to callers as a stable identifier of the uploaded content.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "docqa/error.hpp"

namespace docqa::hash {

/** Length of a hex-encoded SHA-256 digest. */
inline constexpr std::size_t kHexDigestLength = 64;

/** \brief Lowercase hex SHA-256 digest of \p bytes. Pure and deterministic.
 *  Fails with error_code::internal only if the OpenSSL digest context cannot be set up.
 */
auto content_hash(std::span<const std::uint8_t> bytes) -> std::expected<std::string, core::error>;

/** \brief Convenience overload for byte strings. */
auto content_hash(std::string_view bytes) -> std::expected<std::string, core::error>;

/** \brief True if \p s looks like a digest produced by content_hash. */
auto is_hex_digest(std::string_view s) noexcept -> bool;

} // namespace docqa::hash
