#pragma once

/** \file collaborators.hpp
 *  \brief Interfaces of the external collaborators the engine consumes.
 *
 * Implementations live outside this library (PDF parser, embedding model,
 * hosted language model). Each reports failure through core::error with its
 * own code so the engine can apply the per-collaborator policy:
 * - TextExtractor  -> error_code::extraction_failed
 * - Embedder       -> error_code::embedding_failed
 * - AnswerGenerator-> error_code::generation_failed
 *
 * Implementations must be safe to call from several threads at once; the
 * engine calls them from request workers without extra locking.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "docqa/error.hpp"
#include "docqa/text/chunker.hpp"

namespace docqa::engine {

class TextExtractor {
public:
    virtual ~TextExtractor() = default;

    /** \brief Pages of extracted text in document order, 1-based page numbers. */
    virtual auto extract(std::span<const std::uint8_t> pdf_bytes)
        -> std::expected<std::vector<text::Page>, core::error> = 0;
};

class Embedder {
public:
    virtual ~Embedder() = default;

    /** \brief One vector per input text, same order, each of length dimension(). */
    virtual auto embed(const std::vector<std::string>& texts)
        -> std::expected<std::vector<std::vector<float>>, core::error> = 0;

    virtual auto dimension() const noexcept -> std::size_t = 0;
    virtual auto model_name() const -> std::string = 0;
};

class AnswerGenerator {
public:
    virtual ~AnswerGenerator() = default;

    virtual auto generate(const std::string& prompt) -> std::expected<std::string, core::error> = 0;
};

} // namespace docqa::engine
