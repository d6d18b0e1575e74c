#pragma once

/** \file hashing_embedder.hpp
 *  \brief Deterministic bag-of-words embedder (feature hashing).
 *
 * Lowercased alphanumeric tokens are hashed with FNV-1a into dimension() buckets
 * and counted; the result is L2-normalized. Texts with no tokens map to the zero
 * vector. Output is stable across platforms and runs, so stored vectors remain
 * comparable after a restart.
 */

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "docqa/engine/collaborators.hpp"

namespace docqa::embed {

class HashingEmbedder final : public engine::Embedder {
public:
    explicit HashingEmbedder(std::size_t dim = 384) : dim_(dim) {}

    auto embed(const std::vector<std::string>& texts)
        -> std::expected<std::vector<std::vector<float>>, core::error> override;

    auto dimension() const noexcept -> std::size_t override { return dim_; }
    auto model_name() const -> std::string override;

    /** \brief Embed a single text. */
    auto embed_one(std::string_view text) const -> std::vector<float>;

private:
    std::size_t dim_;
};

} // namespace docqa::embed
