#pragma once

/** \file durable_io.hpp
 *  \brief Internal helpers for durable file publication.
 *
 * Atomic, durable replace (POSIX):
 * - Write contents to a temporary sibling file (<name>.tmp) in the same directory
 * - fsync(tmp)
 * - rename(tmp, dst), which replaces dst if it exists
 * - Best-effort fsync of the parent directory
 * On failure the tmp file is removed and io_failed is returned.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "docqa/error.hpp"

namespace docqa::storage::detail {

/** \brief fsync an existing file. */
auto sync_file(const std::filesystem::path& p, std::string_view component)
    -> std::expected<void, core::error>;

/** \brief Best-effort fsync of a directory; errors are ignored. */
void sync_directory(const std::filesystem::path& dir) noexcept;

/** \brief Write \p contents to dir/name atomically (tmp + fsync + rename + dir fsync). */
auto atomic_write(const std::filesystem::path& dir, const std::string& name,
                  std::string_view contents, std::string_view component)
    -> std::expected<void, core::error>;

/** \brief FNV-1a 64-bit, as used by the binary store files. */
struct Fnv1a64 {
  std::uint64_t h{1469598103934665603ull};
  void update(const void* ptr, std::size_t nbytes) noexcept {
    const auto* p = static_cast<const std::uint8_t*>(ptr);
    constexpr std::uint64_t FNV_PRIME = 1099511628211ull;
    for (std::size_t i = 0; i < nbytes; ++i) { h ^= p[i]; h *= FNV_PRIME; }
  }
};

} // namespace docqa::storage::detail
