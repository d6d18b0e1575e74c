#pragma once

/** \file manifest.hpp
 *  \brief Store manifest format and load/save helpers.
 *
 * The manifest names the one generation of store files that is current. It is
 * the only file replaced in place; generation files are written beside it and
 * become visible when the manifest is atomically swapped.
 *
 * Format (v1):
 *   docqa-store-manifest v1\n
 *   generation=<u64>\n
 *   documents=<file>\n
 *   chunks=<file>\n
 *   vectors=<file>\n
 *   count=<u64>\n
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

#include "docqa/error.hpp"

namespace docqa::storage {

inline constexpr const char* kManifestName = "store.manifest";

struct Manifest {
  std::uint64_t generation{0};
  std::string documents;   /**< registry file, relative to the storage root */
  std::string chunks;      /**< chunk metadata file */
  std::string vectors;     /**< vector file */
  std::uint64_t count{0};  /**< chunk count at save time */
};

/** \brief File names of one generation: documents-00000007.reg, ... */
auto generation_manifest(std::uint64_t generation, std::uint64_t count) -> Manifest;

/** Errors: not_found if absent; data_integrity on malformed content. */
auto load_manifest(const std::filesystem::path& dir)
    -> std::expected<Manifest, core::error>;

/** Atomic, durable replace of store.manifest. Errors: io_failed. */
auto save_manifest(const std::filesystem::path& dir, const Manifest& m)
    -> std::expected<void, core::error>;

} // namespace docqa::storage
