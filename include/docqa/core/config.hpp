#pragma once

/** \file config.hpp
 *  \brief Engine configuration with defaults and environment overrides.
 *
 * Environment knobs (all optional):
 *   DOCQA_STORAGE_DIR    storage root directory
 *   DOCQA_EMBED_DIM      embedding dimension (> 0)
 *   DOCQA_CHUNK_WORDS    words per chunk (> 0)
 *   DOCQA_CHUNK_OVERLAP  overlapping words (< DOCQA_CHUNK_WORDS)
 *   DOCQA_TOP_K          default retrieval depth (> 0)
 *   DOCQA_WORKERS        worker threads (0 = hardware concurrency / 2)
 *   DOCQA_ZSTD_LEVEL     chunk payload compression level (0 = stored, 1..19)
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>

#include "docqa/error.hpp"

namespace docqa::core {

/** \brief Chunking parameters, in words. */
struct ChunkParams {
  std::size_t window_words{200};
  std::size_t overlap_words{50};
};

struct EngineConfig {
  std::filesystem::path storage_dir{"storage"};
  std::size_t dimension{384};
  ChunkParams chunking{};
  std::uint32_t top_k{5};
  std::size_t worker_threads{0};
  int zstd_level{0};
};

/** \brief Check chunking parameters, dimension, and compression level. */
auto validate(const EngineConfig& cfg) -> std::expected<void, error>;

/** \brief Overlay DOCQA_* environment variables on \p base, then validate. */
auto config_from_env(EngineConfig base = {}) -> std::expected<EngineConfig, error>;

} // namespace docqa::core
