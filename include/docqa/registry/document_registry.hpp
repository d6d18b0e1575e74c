#pragma once

/** \file document_registry.hpp
 *  \brief Authoritative record of uploaded documents.
 *
 * Documents are kept in registration order. Lookups by hash (deduplication)
 * and by filename are linear scans; the registry is small at this scale.
 * Hash uniqueness is the caller's responsibility: register_document() does not
 * check for an existing document with the same hash.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "docqa/error.hpp"

namespace docqa::registry {

struct Document {
  std::string doc_id;
  std::string filename;
  std::string hash;               /**< hex SHA-256 of the uploaded bytes */
  std::string upload_timestamp;   /**< ISO-8601, UTC */
  std::uint64_t num_chunks{0};
  std::uint32_t num_pages{1};

  friend bool operator==(const Document&, const Document&) = default;
};

class DocumentRegistry {
public:
    DocumentRegistry() = default;

    [[nodiscard]] auto find(std::string_view doc_id) const -> std::optional<Document>;
    [[nodiscard]] auto find_by_hash(std::string_view hash) const -> std::optional<Document>;
    [[nodiscard]] auto find_by_filename(std::string_view filename) const -> std::optional<Document>;

    /** \brief Allocate a fresh doc_id, stamp the current time, append. */
    auto register_document(std::string filename, std::string hash,
                           std::uint64_t num_chunks, std::uint32_t num_pages) -> Document;

    /** \brief Remove a document. Errors: not_found if \p doc_id is unknown. */
    auto remove(std::string_view doc_id) -> std::expected<void, core::error>;

    [[nodiscard]] auto documents() const noexcept -> const std::vector<Document>& { return docs_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return docs_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return docs_.empty(); }

    /** Sequence number the next doc_id will carry. */
    [[nodiscard]] auto next_sequence() const noexcept -> std::uint64_t { return next_seq_; }

    /** \brief Rehydrate from persisted documents.
     *  Errors: data_integrity on duplicate doc_ids.
     */
    static auto restore(std::vector<Document> docs, std::uint64_t next_seq)
        -> std::expected<DocumentRegistry, core::error>;

private:
    std::vector<Document> docs_;
    std::uint64_t next_seq_{1};
};

/** \brief Current UTC time as ISO-8601 with microseconds, e.g. 2024-05-01T12:00:00.000000Z. */
auto utc_timestamp_now() -> std::string;

} // namespace docqa::registry
