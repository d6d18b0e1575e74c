#pragma once

/** \file flat_index.hpp
 *  \brief Exact (flat) vector index over an arena of chunk records.
 *
 * Every record bundles the chunk text, its source attribution, its owning
 * document, and its embedding vector, so the vector at position i and the chunk
 * at position i are the same object and cannot drift apart.
 *
 * The index has no point deletion. Removal evaluates a predicate into a Roaring
 * bitmap of surviving positions, builds a new arena from the survivors (relative
 * order preserved), and swaps it in. A failed insert or rebuild leaves the index
 * unchanged.
 *
 * Thread-safety: none. The engine serializes writers and guards readers.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "docqa/error.hpp"
#include "roaring.hh"

namespace docqa::index {

/** \brief One chunk and its embedding. Immutable once inserted. */
struct ChunkRecord {
  std::uint64_t key{0};        /**< stable key, assigned on insert, never reused */
  std::string text;
  std::string source;          /**< filename of the owning document */
  std::uint32_t page{1};       /**< 1-based page number */
  std::string owner;           /**< doc_id of the owning document */
  std::vector<float> vector;   /**< embedding, length == dimension() */
};

/** \brief One search hit: position in the arena and squared L2 distance. */
struct SearchHit {
  std::size_t position{};
  std::uint64_t key{};
  float distance{};
};

using RecordPredicate = std::function<bool(const ChunkRecord&)>;

class FlatIndex {
public:
    explicit FlatIndex(std::size_t dim);

    [[nodiscard]] auto dimension() const noexcept -> std::size_t { return dim_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return records_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return records_.empty(); }

    /** \brief Append records in input order.
     *
     * Keys are assigned by the index; any key set by the caller is overwritten.
     * \return number of records inserted
     * Errors: dimension_mismatch if any vector length differs from dimension();
     *         nothing is inserted in that case.
     */
    auto insert(std::vector<ChunkRecord> records) -> std::expected<std::size_t, core::error>;

    /** \brief Exact k-nearest-neighbour search by squared Euclidean distance.
     *
     * Results ascend by distance; ties go to the lower position. \p k is clamped
     * to size(); an empty index yields an empty result.
     * Errors: invalid_argument if k == 0; dimension_mismatch if the query length
     *         differs from dimension().
     */
    auto search(std::span<const float> query, std::uint32_t k) const
        -> std::expected<std::vector<SearchHit>, core::error>;

    /** \brief Positions of records matching \p pred, as a bitmap. */
    auto select(const RecordPredicate& pred) const -> std::expected<roaring::Roaring, core::error>;

    /** \brief Rebuild keeping only records for which \p keep is true.
     *  \return number of records removed
     */
    auto retain(const RecordPredicate& keep) -> std::expected<std::size_t, core::error>;

    /** \brief Rebuild dropping records for which \p pred is true. */
    auto remove_if(const RecordPredicate& pred) -> std::expected<std::size_t, core::error>;

    [[nodiscard]] auto at(std::size_t position) const -> const ChunkRecord& { return records_.at(position); }
    [[nodiscard]] auto records() const noexcept -> const std::vector<ChunkRecord>& { return records_; }

    /** Next key to be assigned; persisted so keys survive restarts. */
    [[nodiscard]] auto next_key() const noexcept -> std::uint64_t { return next_key_; }

    /** \brief Rehydrate from persisted records (keys kept as stored).
     *  Errors: dimension_mismatch on a vector of the wrong length.
     */
    static auto restore(std::size_t dim, std::vector<ChunkRecord> records, std::uint64_t next_key)
        -> std::expected<FlatIndex, core::error>;

private:
    auto rebuild_from(const roaring::Roaring& survivors) -> std::size_t;

    std::size_t dim_;
    std::vector<ChunkRecord> records_;
    std::uint64_t next_key_{1};
};

} // namespace docqa::index
