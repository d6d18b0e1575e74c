#pragma once

/** \file chunker.hpp
 *  \brief Word-windowed overlapping segmentation of extracted page text.
 *
 * A window of `window_words` whitespace-delimited words advances by
 * `window_words - overlap_words` words. Windows are joined back with single
 * spaces. The final window is allowed to be shorter than `window_words`; once a
 * window reaches the last word, chunking stops.
 *
 * Preconditions checked at runtime: window_words > 0, overlap_words < window_words
 * (error_code::config_invalid otherwise).
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "docqa/core/config.hpp"
#include "docqa/error.hpp"

namespace docqa::text {

/** \brief One page of extracted text. Page numbers are 1-based. */
struct Page {
  std::uint32_t page_number{1};
  std::string text;
};

/** \brief A chunk of one page, before it is embedded. */
struct PageChunk {
  std::string text;
  std::uint32_t page{1};
};

/** \brief Split \p text into overlapping word windows. */
auto chunk_words(std::string_view text, const core::ChunkParams& params)
    -> std::expected<std::vector<std::string>, core::error>;

/** \brief Chunk every page independently; output keeps page order. */
auto chunk_pages(const std::vector<Page>& pages, const core::ChunkParams& params)
    -> std::expected<std::vector<PageChunk>, core::error>;

} // namespace docqa::text
