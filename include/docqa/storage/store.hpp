#pragma once

/** \file store.hpp
 *  \brief Persistence coordinator: the registry, chunk metadata and vector
 *         index are loaded and saved as one logical unit.
 *
 * Save protocol
 * 1. Write documents-<g>.reg, chunks-<g>.bin, vectors-<g>.bin for the next
 *    generation g and fsync each.
 * 2. Atomically replace store.manifest (tmp + fsync + rename + dir fsync) so it
 *    names generation g.
 * 3. Best-effort removal of files from other generations.
 * A crash before step 2 completes leaves the previous generation current; the
 * loader therefore never sees a half-written set.
 *
 * Load protocol
 * - No manifest: empty registry and empty index of the configured dimension.
 * - Manifest present: all three files must exist and pass their checksums
 *   (data_integrity otherwise). A stored dimension different from the configured
 *   one fails with dimension_mismatch. If chunk and vector counts still differ,
 *   the mismatch is logged and the longer sequence is truncated.
 */

#include <cstdint>
#include <expected>
#include <filesystem>

#include "docqa/error.hpp"
#include "docqa/index/flat_index.hpp"
#include "docqa/registry/document_registry.hpp"

namespace docqa::storage {

/** \brief The triad owned by the engine, plus the generation it was loaded from. */
struct StoreState {
  registry::DocumentRegistry registry;
  index::FlatIndex index;
  std::uint64_t generation{0};   /**< 0 = never saved */

  explicit StoreState(std::size_t dim) : index(dim) {}
  StoreState(registry::DocumentRegistry r, index::FlatIndex i, std::uint64_t g)
      : registry(std::move(r)), index(std::move(i)), generation(g) {}
};

struct StoreOptions {
  int zstd_level{0};   /**< chunk payload compression, 0 = stored */
};

/** \brief Load the store under \p root, creating the directory if needed. */
auto load_store(const std::filesystem::path& root, std::size_t dim)
    -> std::expected<StoreState, core::error>;

/** \brief Persist \p state as the next generation.
 *  \return the generation now current on disk; the caller records it on success.
 *  Errors: io_failed (PersistenceError); nothing already current on disk is modified.
 */
auto save_store(const std::filesystem::path& root, const StoreState& state,
                const StoreOptions& opts = {})
    -> std::expected<std::uint64_t, core::error>;

/** \brief Cross-store consistency of \p state.
 *
 * Checks that every chunk's owner is a registered document whose filename is
 * the chunk's source, that each document's num_chunks equals the chunks it
 * owns, and that every record's vector has the index dimension. Errors: data_integrity naming the first
 * violation.
 */
auto check_invariants(const StoreState& state) -> std::expected<void, core::error>;

} // namespace docqa::storage
