#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include "docqa/core/config.hpp"

using docqa::core::config_from_env;
using docqa::core::EngineConfig;
using docqa::core::error_code;
using docqa::core::validate;

namespace {

struct EnvGuard {
  const char* name;
  EnvGuard(const char* n, const char* v) : name(n) { ::setenv(n, v, 1); }
  ~EnvGuard() { ::unsetenv(name); }
};

} // namespace

TEST_CASE("config: defaults are valid", "[config]") {
  EngineConfig cfg;
  REQUIRE(cfg.dimension == 384);
  REQUIRE(cfg.chunking.window_words == 200);
  REQUIRE(cfg.chunking.overlap_words == 50);
  REQUIRE(cfg.top_k == 5);
  REQUIRE(validate(cfg).has_value());
}

TEST_CASE("config: validate rejects bad values", "[config]") {
  EngineConfig cfg;
  cfg.chunking.overlap_words = 200;
  REQUIRE(validate(cfg).error().code == error_code::config_invalid);

  cfg = EngineConfig{};
  cfg.dimension = 0;
  REQUIRE(validate(cfg).error().code == error_code::config_invalid);

  cfg = EngineConfig{};
  cfg.top_k = 0;
  REQUIRE_FALSE(validate(cfg).has_value());

  cfg = EngineConfig{};
  cfg.zstd_level = 20;
  REQUIRE_FALSE(validate(cfg).has_value());
}

TEST_CASE("config: environment overrides", "[config]") {
  EnvGuard dim("DOCQA_EMBED_DIM", "64");
  EnvGuard words("DOCQA_CHUNK_WORDS", "100");
  EnvGuard overlap("DOCQA_CHUNK_OVERLAP", "10");
  EnvGuard dir("DOCQA_STORAGE_DIR", "/tmp/docqa_cfg");
  auto cfg = config_from_env();
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->dimension == 64);
  REQUIRE(cfg->chunking.window_words == 100);
  REQUIRE(cfg->chunking.overlap_words == 10);
  REQUIRE(cfg->storage_dir == "/tmp/docqa_cfg");
}

TEST_CASE("config: malformed environment value fails", "[config]") {
  EnvGuard k("DOCQA_TOP_K", "five");
  auto cfg = config_from_env();
  REQUIRE_FALSE(cfg.has_value());
  REQUIRE(cfg.error().code == error_code::config_invalid);
}

TEST_CASE("config: overrides that break an invariant fail validation", "[config]") {
  EnvGuard overlap("DOCQA_CHUNK_OVERLAP", "500");
  auto cfg = config_from_env();
  REQUIRE_FALSE(cfg.has_value());
  REQUIRE(cfg.error().code == error_code::config_invalid);
}

TEST_CASE("config: 32-bit knobs reject values that would wrap", "[config]") {
  {
    EnvGuard k("DOCQA_TOP_K", "4294967301");
    auto cfg = config_from_env();
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == error_code::config_invalid);
  }
  {
    EnvGuard w("DOCQA_WORKERS", "4294967296");
    auto cfg = config_from_env();
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == error_code::config_invalid);
  }
  {
    EnvGuard k("DOCQA_TOP_K", "4294967295");
    auto cfg = config_from_env();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->top_k == 4294967295u);
  }
}
