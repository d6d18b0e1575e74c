#include "docqa/text/chunker.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "docqa/core/platform_utils.hpp"

namespace docqa::text {

namespace {

auto split_words(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> words;
  std::size_t i = 0;
  const std::size_t n = text.size();
  while (i < n) {
    while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    const std::size_t start = i;
    while (i < n && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    if (i > start) words.push_back(text.substr(start, i - start));
  }
  return words;
}

auto check_params(const core::ChunkParams& params) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (params.window_words == 0) {
    return std::unexpected(error{error_code::config_invalid, "chunk window must be positive", "text.chunker"});
  }
  if (params.overlap_words >= params.window_words) {
    return std::unexpected(error{error_code::config_invalid,
        "overlap (" + std::to_string(params.overlap_words) + ") must be smaller than window ("
        + std::to_string(params.window_words) + ")", "text.chunker"});
  }
  return {};
}

} // namespace

auto chunk_words(std::string_view text, const core::ChunkParams& params)
    -> std::expected<std::vector<std::string>, core::error> {
  if (auto ok = check_params(params); !ok) return std::unexpected(ok.error());

  const auto words = split_words(text);
  std::vector<std::string> chunks;
  if (words.empty()) return chunks;

  const std::size_t step = params.window_words - params.overlap_words;
  for (std::size_t start = 0; start < words.size(); start += step) {
    const std::size_t end = std::min(start + params.window_words, words.size());
    std::string chunk;
    for (std::size_t i = start; i < end; ++i) {
      if (i > start) chunk.push_back(' ');
      chunk.append(words[i]);
    }
    // Words never contain whitespace, so a non-empty window is never blank.
    if (!chunk.empty()) chunks.push_back(std::move(chunk));
    if (end == words.size()) break;
  }
  return chunks;
}

auto chunk_pages(const std::vector<Page>& pages, const core::ChunkParams& params)
    -> std::expected<std::vector<PageChunk>, core::error> {
  if (auto ok = check_params(params); !ok) return std::unexpected(ok.error());

  const bool dbg = core::debug_enabled();
  std::vector<PageChunk> out;
  for (const auto& page : pages) {
    auto chunks = chunk_words(page.text, params);
    if (!chunks) return std::unexpected(chunks.error());
    if (dbg) {
      std::cerr << "[docqa][chunker] page=" << page.page_number << " chunks=" << chunks->size() << std::endl;
    }
    for (auto& c : *chunks) {
      out.push_back(PageChunk{std::move(c), page.page_number});
    }
  }
  return out;
}

} // namespace docqa::text
