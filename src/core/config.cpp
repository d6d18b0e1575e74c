#include "docqa/core/config.hpp"
#include "docqa/core/platform_utils.hpp"

#include <charconv>
#include <limits>
#include <string>

namespace docqa::core {

namespace {

auto parse_u64(const char* name, const std::string& s, std::uint64_t& out)
    -> std::expected<void, error> {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (s.empty() || ec != std::errc() || ptr != end) {
    return std::unexpected(error{error_code::config_invalid,
        std::string("malformed value for ") + name + ": '" + s + "'", "core.config"});
  }
  out = static_cast<std::uint64_t>(tmp);
  return {};
}

auto parse_u32(const char* name, const std::string& s, std::uint64_t& out)
    -> std::expected<void, error> {
  if (auto r = parse_u64(name, s, out); !r) return r;
  if (out > std::numeric_limits<std::uint32_t>::max()) {
    return std::unexpected(error{error_code::config_invalid,
        std::string("value out of range for ") + name + ": '" + s + "'", "core.config"});
  }
  return {};
}

} // namespace

auto validate(const EngineConfig& cfg) -> std::expected<void, error> {
  if (cfg.chunking.window_words == 0) {
    return std::unexpected(error{error_code::config_invalid, "chunk window must be positive", "core.config"});
  }
  if (cfg.chunking.overlap_words >= cfg.chunking.window_words) {
    return std::unexpected(error{error_code::config_invalid,
        "chunk overlap must be smaller than the chunk window", "core.config"});
  }
  if (cfg.dimension == 0) {
    return std::unexpected(error{error_code::config_invalid, "embedding dimension must be positive", "core.config"});
  }
  if (cfg.top_k == 0) {
    return std::unexpected(error{error_code::config_invalid, "top_k must be positive", "core.config"});
  }
  if (cfg.zstd_level < 0 || cfg.zstd_level > 19) {
    return std::unexpected(error{error_code::config_invalid, "zstd level must be within [0, 19]", "core.config"});
  }
  if (cfg.storage_dir.empty()) {
    return std::unexpected(error{error_code::config_invalid, "storage directory must not be empty", "core.config"});
  }
  return {};
}

auto config_from_env(EngineConfig base) -> std::expected<EngineConfig, error> {
  EngineConfig cfg = std::move(base);
  std::uint64_t v = 0;

  if (auto e = safe_getenv("DOCQA_STORAGE_DIR"); e && !e->empty()) {
    cfg.storage_dir = *e;
  }
  if (auto e = safe_getenv("DOCQA_EMBED_DIM")) {
    if (auto r = parse_u64("DOCQA_EMBED_DIM", *e, v); !r) return std::unexpected(r.error());
    cfg.dimension = static_cast<std::size_t>(v);
  }
  if (auto e = safe_getenv("DOCQA_CHUNK_WORDS")) {
    if (auto r = parse_u64("DOCQA_CHUNK_WORDS", *e, v); !r) return std::unexpected(r.error());
    cfg.chunking.window_words = static_cast<std::size_t>(v);
  }
  if (auto e = safe_getenv("DOCQA_CHUNK_OVERLAP")) {
    if (auto r = parse_u64("DOCQA_CHUNK_OVERLAP", *e, v); !r) return std::unexpected(r.error());
    cfg.chunking.overlap_words = static_cast<std::size_t>(v);
  }
  if (auto e = safe_getenv("DOCQA_TOP_K")) {
    if (auto r = parse_u32("DOCQA_TOP_K", *e, v); !r) return std::unexpected(r.error());
    cfg.top_k = static_cast<std::uint32_t>(v);
  }
  if (auto e = safe_getenv("DOCQA_WORKERS")) {
    if (auto r = parse_u32("DOCQA_WORKERS", *e, v); !r) return std::unexpected(r.error());
    cfg.worker_threads = static_cast<std::size_t>(v);
  }
  if (auto e = safe_getenv("DOCQA_ZSTD_LEVEL")) {
    if (auto r = parse_u64("DOCQA_ZSTD_LEVEL", *e, v); !r) return std::unexpected(r.error());
    cfg.zstd_level = v > 100 ? 100 : static_cast<int>(v);
  }

  if (auto ok = validate(cfg); !ok) return std::unexpected(ok.error());
  return cfg;
}

} // namespace docqa::core
