#pragma once

/** \file engine.hpp
 *  \brief Retrieval and answer orchestrator over one storage root.
 *
 * Thread-safety: all operations may be called concurrently. Readers (ask,
 * list_documents, get_stats) share a lock on the live state. Mutators (upload,
 * remove_document) are serialized; each builds a staged copy of the state,
 * persists it, and only then swaps it in under the exclusive lock. A failed
 * mutation, including a failed save, leaves the live state untouched.
 *
 * Every successful mutation is durable before the call returns.
 *
 * The staged copy duplicates every chunk record and its vector, so each upload
 * or delete costs O(chunks * dimension) on top of its own work.
 *
 * An engine holds the storage root's StoreLock while it lives; open() on a root
 * already held fails with unavailable.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "docqa/core/config.hpp"
#include "docqa/engine/collaborators.hpp"
#include "docqa/engine/results.hpp"
#include "docqa/error.hpp"
#include "docqa/registry/document_registry.hpp"
#include "docqa/storage/store.hpp"
#include "docqa/storage/store_lock.hpp"

namespace docqa::engine {

inline constexpr std::string_view kNoDocumentsAnswer =
    "No documents have been uploaded yet. Please upload PDF documents first.";
inline constexpr std::string_view kNotEnoughInformationAnswer =
    "I don't have enough information to answer this question. Please upload relevant documents first.";

/** \brief A retrieved chunk, copied out of the index for prompt assembly. */
struct RetrievedChunk {
  std::string text;
  std::string source;
  std::uint32_t page{1};
  float distance{0.0f};
};

/** \brief "[Source: f, Page n]\ntext" blocks separated by blank lines. */
auto build_context(const std::vector<RetrievedChunk>& chunks) -> std::string;

/** \brief Grounded-answer prompt: answer only from the context, say so when it is insufficient. */
auto build_prompt(std::string_view question, const std::vector<RetrievedChunk>& chunks) -> std::string;

/** \brief Unique (file, page) pairs in first-seen order. */
auto unique_sources(const std::vector<RetrievedChunk>& chunks) -> std::vector<Source>;

class Engine {
public:
    /** \brief Load (or initialize) the store under cfg.storage_dir.
     *
     * Errors: config_invalid for bad configuration or an embedder whose
     * dimension differs from cfg.dimension; unavailable if another engine holds
     * the storage root; any load_store error.
     */
    static auto open(core::EngineConfig cfg,
                     std::shared_ptr<TextExtractor> extractor,
                     std::shared_ptr<Embedder> embedder,
                     std::shared_ptr<AnswerGenerator> generator)
        -> std::expected<std::unique_ptr<Engine>, core::error>;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /** \brief Ingest one file, honouring \p action when its content is already indexed. */
    auto upload(const std::string& filename, std::span<const std::uint8_t> bytes,
                DuplicateAction action = DuplicateAction::Auto) -> UploadOutcome;

    /** \brief Upload each request in order; a failing file never aborts the rest. */
    auto upload_batch(const std::vector<UploadRequest>& requests) -> std::vector<UploadOutcome>;

    /** \brief Answer \p question from the top_k nearest chunks.
     *  Errors: invalid_argument for a blank question or top_k == 0;
     *          embedding_failed / dimension_mismatch from retrieval.
     */
    auto ask(const std::string& question, std::uint32_t top_k) -> std::expected<AskResult, core::error>;

    /** \brief ask() with the configured default depth. */
    auto ask(const std::string& question) -> std::expected<AskResult, core::error> { return ask(question, cfg_.top_k); }

    /** \brief Remove a document and all of its chunks. Errors: not_found, io_failed. */
    auto remove_document(const std::string& doc_id) -> std::expected<DeleteResult, core::error>;

    [[nodiscard]] auto list_documents() const -> std::vector<registry::Document>;
    [[nodiscard]] auto get_stats() const -> EngineStats;
    [[nodiscard]] auto config() const noexcept -> const core::EngineConfig& { return cfg_; }

private:
    Engine(core::EngineConfig cfg, storage::StoreLock lock, storage::StoreState state,
           std::shared_ptr<TextExtractor> extractor,
           std::shared_ptr<Embedder> embedder,
           std::shared_ptr<AnswerGenerator> generator);

    struct PreparedDocument {
        std::vector<text::PageChunk> chunks;
        std::vector<std::vector<float>> vectors;
        std::uint32_t num_pages{1};
    };

    // Extract, chunk and embed without touching any state.
    auto prepare(std::span<const std::uint8_t> bytes) -> std::expected<PreparedDocument, core::error>;
    // Persist the staged state, then swap it in. Caller holds write_mu_.
    auto commit(storage::StoreState staged) -> std::expected<void, core::error>;
    auto retrieve(const std::string& question, std::uint32_t top_k)
        -> std::expected<std::vector<RetrievedChunk>, core::error>;

    core::EngineConfig cfg_;
    std::shared_ptr<TextExtractor> extractor_;
    std::shared_ptr<Embedder> embedder_;
    std::shared_ptr<AnswerGenerator> generator_;

    storage::StoreLock lock_;             // exclusive writer on storage_dir
    std::mutex write_mu_;                 // serializes mutators
    mutable std::shared_mutex state_mu_;  // guards live_
    storage::StoreState live_;
};

} // namespace docqa::engine
