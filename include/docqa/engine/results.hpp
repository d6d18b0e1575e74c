#pragma once

/** \file results.hpp
 *  \brief Request and result types of the engine operations.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "docqa/error.hpp"

namespace docqa::engine {

/** \brief What to do when an upload matches an existing document's content. */
enum class DuplicateAction : std::uint8_t { Auto, UseExisting, Replace, Cancel };

auto to_string(DuplicateAction a) noexcept -> std::string_view;
auto parse_duplicate_action(std::string_view s) -> std::optional<DuplicateAction>;

/** \brief Fresh ingestion, or reuse of an existing document (`reused`). */
struct UploadSuccess {
  std::string filename;
  std::string message;
  std::uint64_t chunks{0};
  std::optional<std::uint32_t> pages;   /**< set on fresh ingestion */
  std::string doc_id;                   /**< new document, or the reused one */
  bool reused{false};
};

/** \brief Decision point: the same content is already indexed. Nothing changed. */
struct UploadDuplicate {
  std::string filename;
  std::string existing_filename;
  std::string hash;
  std::string message;
  std::vector<DuplicateAction> options{DuplicateAction::UseExisting, DuplicateAction::Replace,
                                       DuplicateAction::Cancel};
};

struct UploadCancelled {
  std::string filename;
  std::string message;
};

struct UploadError {
  std::string filename;
  std::string message;
  core::error_code code{core::error_code::internal};
};

using UploadOutcome = std::variant<UploadSuccess, UploadDuplicate, UploadCancelled, UploadError>;

/** "success" | "duplicate" | "cancelled" | "error" */
auto status_name(const UploadOutcome& o) noexcept -> std::string_view;

struct UploadRequest {
  std::string filename;
  std::vector<std::uint8_t> bytes;
  DuplicateAction action{DuplicateAction::Auto};
};

struct Source {
  std::string file;
  std::uint32_t page{1};

  friend bool operator==(const Source&, const Source&) = default;
};

struct AskResult {
  std::string answer;
  std::vector<Source> sources;          /**< unique (file, page), first-seen order */
  std::uint64_t num_chunks_used{0};
};

struct DeleteResult {
  std::string message;
};

struct EngineStats {
  std::uint64_t total_documents{0};
  std::uint64_t total_chunks{0};
  std::uint64_t index_size{0};
  std::string embedding_model_name;
  std::uint64_t embedding_dimension{0};
};

} // namespace docqa::engine
