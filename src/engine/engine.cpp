/** \file engine.cpp
 *  \brief Upload, query and delete paths of the orchestrator.
 */

#include "docqa/engine/engine.hpp"
#include "docqa/core/platform_utils.hpp"
#include "docqa/hash/content_hash.hpp"
#include "docqa/text/chunker.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <set>
#include <utility>

namespace docqa::engine {

using core::error;
using core::error_code;

namespace {

auto is_pdf_name(std::string_view filename) -> bool {
    if (filename.size() < 4) return false;
    std::string ext(filename.substr(filename.size() - 4));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".pdf";
}

auto is_blank(std::string_view s) -> bool {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

// Collaborators live outside this library; an exception escaping one is
// reported with that collaborator's error code instead of unwinding the engine.
template <typename T, typename Fn>
auto call_collaborator(Fn&& fn, error_code code, const char* component) -> std::expected<T, error> {
    try {
        return std::forward<Fn>(fn)();
    } catch (const std::exception& e) {
        return std::unexpected(error{code, e.what(), component});
    }
}

} // namespace

auto build_context(const std::vector<RetrievedChunk>& chunks) -> std::string {
    std::string context;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (i > 0) context += "\n\n";
        context += "[Source: " + chunks[i].source + ", Page " + std::to_string(chunks[i].page) + "]\n";
        context += chunks[i].text;
    }
    return context;
}

auto build_prompt(std::string_view question, const std::vector<RetrievedChunk>& chunks) -> std::string {
    std::string prompt =
        "You are a helpful assistant that answers questions based ONLY on the provided context.\n"
        "Do NOT make up information that is not in the context.\n"
        "If the context doesn't contain enough information to answer, say so clearly.\n"
        "You may summarize, combine, or rephrase information from the context to make your answer clear and helpful.\n"
        "\n"
        "CONTEXT:\n";
    prompt += build_context(chunks);
    prompt += "\n\nQUESTION:\n";
    prompt += question;
    prompt += "\n\nANSWER:";
    return prompt;
}

auto unique_sources(const std::vector<RetrievedChunk>& chunks) -> std::vector<Source> {
    std::vector<Source> sources;
    std::set<std::pair<std::string, std::uint32_t>> seen;
    for (const auto& c : chunks) {
        if (seen.emplace(c.source, c.page).second) {
            sources.push_back(Source{c.source, c.page});
        }
    }
    return sources;
}

Engine::Engine(core::EngineConfig cfg, storage::StoreLock lock, storage::StoreState state,
               std::shared_ptr<TextExtractor> extractor,
               std::shared_ptr<Embedder> embedder,
               std::shared_ptr<AnswerGenerator> generator)
    : cfg_(std::move(cfg)),
      extractor_(std::move(extractor)),
      embedder_(std::move(embedder)),
      generator_(std::move(generator)),
      lock_(std::move(lock)),
      live_(std::move(state)) {}

auto Engine::open(core::EngineConfig cfg,
                  std::shared_ptr<TextExtractor> extractor,
                  std::shared_ptr<Embedder> embedder,
                  std::shared_ptr<AnswerGenerator> generator)
    -> std::expected<std::unique_ptr<Engine>, error> {
    if (auto ok = core::validate(cfg); !ok) return std::unexpected(ok.error());
    if (!extractor || !embedder || !generator) {
        return std::unexpected(error{error_code::config_invalid, "all collaborators are required", "engine"});
    }
    if (embedder->dimension() != cfg.dimension) {
        return std::unexpected(error{error_code::config_invalid,
            "embedder '" + embedder->model_name() + "' produces dimension " + std::to_string(embedder->dimension())
            + ", engine configured for " + std::to_string(cfg.dimension), "engine"});
    }

    auto lock = storage::StoreLock::acquire(cfg.storage_dir);
    if (!lock) return std::unexpected(lock.error());
    auto state = storage::load_store(cfg.storage_dir, cfg.dimension);
    if (!state) return std::unexpected(state.error());

    if (core::log_enabled()) {
        std::cerr << "[docqa][engine] ready: documents=" << state->registry.size()
                  << " chunks=" << state->index.size() << " model=" << embedder->model_name() << std::endl;
    }
    return std::unique_ptr<Engine>(new Engine(std::move(cfg), std::move(*lock), std::move(*state), std::move(extractor),
                                              std::move(embedder), std::move(generator)));
}

auto Engine::prepare(std::span<const std::uint8_t> bytes) -> std::expected<PreparedDocument, error> {
    auto pages = call_collaborator<std::vector<text::Page>>(
        [&] { return extractor_->extract(bytes); }, error_code::extraction_failed, "engine.extract");
    if (!pages) return std::unexpected(pages.error());

    auto chunks = text::chunk_pages(*pages, cfg_.chunking);
    if (!chunks) return std::unexpected(chunks.error());
    if (chunks->empty()) {
        return std::unexpected(error{error_code::empty_document, "No text could be extracted from PDF", "engine.upload"});
    }

    std::vector<std::string> texts;
    texts.reserve(chunks->size());
    for (const auto& c : *chunks) texts.push_back(c.text);

    auto vectors = call_collaborator<std::vector<std::vector<float>>>(
        [&] { return embedder_->embed(texts); }, error_code::embedding_failed, "engine.embed");
    if (!vectors) return std::unexpected(vectors.error());
    if (vectors->size() != texts.size()) {
        return std::unexpected(error{error_code::embedding_failed,
            "embedder returned " + std::to_string(vectors->size()) + " vectors for " + std::to_string(texts.size())
            + " chunks", "engine.embed"});
    }

    PreparedDocument doc;
    doc.num_pages = 1;
    for (const auto& c : *chunks) doc.num_pages = std::max(doc.num_pages, c.page);
    doc.chunks = std::move(*chunks);
    doc.vectors = std::move(*vectors);
    return doc;
}

auto Engine::commit(storage::StoreState staged) -> std::expected<void, error> {
    storage::StoreOptions opts;
    opts.zstd_level = cfg_.zstd_level;
    auto gen = storage::save_store(cfg_.storage_dir, staged, opts);
    if (!gen) return std::unexpected(gen.error());
    staged.generation = *gen;

    std::unique_lock<std::shared_mutex> lock(state_mu_);
    live_ = std::move(staged);
    return {};
}

auto Engine::upload(const std::string& filename, std::span<const std::uint8_t> bytes,
                    DuplicateAction action) -> UploadOutcome {
    if (!is_pdf_name(filename)) {
        return UploadError{filename, "Only PDF files are allowed", error_code::invalid_argument};
    }
    auto digest = hash::content_hash(bytes);
    if (!digest) {
        return UploadError{filename, "Error processing document: " + digest.error().message, digest.error().code};
    }

    std::lock_guard<std::mutex> write_lock(write_mu_);
    // live_ only changes under write_mu_, so it can be read here without state_mu_.
    const auto existing = live_.registry.find_by_hash(*digest);
    bool replacing = false;
    if (existing) {
        switch (action) {
            case DuplicateAction::Auto:
                return UploadDuplicate{filename, existing->filename, *digest,
                                       "Document already exists as '" + existing->filename + "'"};
            case DuplicateAction::UseExisting:
                return UploadSuccess{existing->filename, "Using existing document embeddings", 0, std::nullopt,
                                     existing->doc_id, true};
            case DuplicateAction::Cancel:
                return UploadCancelled{filename, "Upload cancelled"};
            case DuplicateAction::Replace:
                replacing = true;
                break;
        }
    }

    auto prepared = prepare(bytes);
    if (!prepared) {
        const auto& e = prepared.error();
        if (e.code == error_code::empty_document) return UploadError{filename, e.message, e.code};
        return UploadError{filename, "Error processing document: " + e.message, e.code};
    }

    storage::StoreState staged = live_;
    if (replacing) {
        const std::string old_id = existing->doc_id;
        auto removed = staged.index.remove_if([&](const index::ChunkRecord& r) { return r.owner == old_id; });
        if (!removed) return UploadError{filename, "Error processing document: " + removed.error().message, removed.error().code};
        if (auto r = staged.registry.remove(old_id); !r) {
            return UploadError{filename, "Error processing document: " + r.error().message, r.error().code};
        }
        if (core::log_enabled()) {
            std::cerr << "[docqa][engine] replacing " << old_id << " ('" << existing->filename << "'), dropped "
                      << *removed << " chunks" << std::endl;
        }
    }

    const std::uint64_t num_chunks = prepared->chunks.size();
    const auto doc = staged.registry.register_document(filename, *digest, num_chunks, prepared->num_pages);

    std::vector<index::ChunkRecord> records;
    records.reserve(prepared->chunks.size());
    for (std::size_t i = 0; i < prepared->chunks.size(); ++i) {
        index::ChunkRecord r;
        r.text = std::move(prepared->chunks[i].text);
        r.source = filename;
        r.page = prepared->chunks[i].page;
        r.owner = doc.doc_id;
        r.vector = std::move(prepared->vectors[i]);
        records.push_back(std::move(r));
    }
    if (auto ins = staged.index.insert(std::move(records)); !ins) {
        return UploadError{filename, "Error processing document: " + ins.error().message, ins.error().code};
    }

    if (auto c = commit(std::move(staged)); !c) {
        return UploadError{filename, "Error processing document: " + c.error().message, c.error().code};
    }

    if (core::log_enabled()) {
        std::cerr << "[docqa][engine] ingested '" << filename << "' as " << doc.doc_id << ": chunks=" << num_chunks
                  << " pages=" << doc.num_pages << std::endl;
    }
    return UploadSuccess{filename, "Document processed successfully", num_chunks, doc.num_pages, doc.doc_id, false};
}

auto Engine::upload_batch(const std::vector<UploadRequest>& requests) -> std::vector<UploadOutcome> {
    std::vector<UploadOutcome> out;
    out.reserve(requests.size());
    for (const auto& req : requests) {
        out.push_back(upload(req.filename, req.bytes, req.action));
    }
    return out;
}

auto Engine::retrieve(const std::string& question, std::uint32_t top_k)
    -> std::expected<std::vector<RetrievedChunk>, error> {
    auto qv = call_collaborator<std::vector<std::vector<float>>>(
        [&] { return embedder_->embed({question}); }, error_code::embedding_failed, "engine.embed");
    if (!qv) return std::unexpected(qv.error());
    if (qv->size() != 1) {
        return std::unexpected(error{error_code::embedding_failed, "embedder returned no query vector", "engine.embed"});
    }

    std::shared_lock<std::shared_mutex> lock(state_mu_);
    auto hits = live_.index.search(qv->front(), top_k);
    if (!hits) return std::unexpected(hits.error());

    std::vector<RetrievedChunk> out;
    out.reserve(hits->size());
    for (const auto& h : *hits) {
        const auto& r = live_.index.at(h.position);
        out.push_back(RetrievedChunk{r.text, r.source, r.page, h.distance});
    }
    return out;
}

auto Engine::ask(const std::string& question, std::uint32_t top_k) -> std::expected<AskResult, error> {
    if (is_blank(question)) {
        return std::unexpected(error{error_code::invalid_argument, "Question cannot be empty", "engine.ask"});
    }
    if (top_k == 0) {
        return std::unexpected(error{error_code::invalid_argument, "top_k must be positive", "engine.ask"});
    }
    {
        std::shared_lock<std::shared_mutex> lock(state_mu_);
        if (live_.registry.empty()) {
            return AskResult{std::string(kNoDocumentsAnswer), {}, 0};
        }
    }

    auto chunks = retrieve(question, top_k);
    if (!chunks) return std::unexpected(chunks.error());

    AskResult result;
    result.num_chunks_used = chunks->size();
    result.sources = unique_sources(*chunks);
    if (chunks->empty()) {
        result.answer = std::string(kNotEnoughInformationAnswer);
        return result;
    }

    const std::string prompt = build_prompt(question, *chunks);
    auto answer = call_collaborator<std::string>(
        [&] { return generator_->generate(prompt); }, error_code::generation_failed, "engine.generate");
    if (answer) {
        result.answer = std::move(*answer);
    } else {
        if (core::log_enabled()) {
            std::cerr << "[docqa][engine] generation failed: " << answer.error().message << std::endl;
        }
        result.answer = "Error generating answer: " + answer.error().message;
    }
    return result;
}

auto Engine::remove_document(const std::string& doc_id) -> std::expected<DeleteResult, error> {
    std::lock_guard<std::mutex> write_lock(write_mu_);
    const auto doc = live_.registry.find(doc_id);
    if (!doc) {
        return std::unexpected(error{error_code::not_found, "Document " + doc_id + " not found", "engine.delete"});
    }

    storage::StoreState staged = live_;
    auto removed = staged.index.remove_if([&](const index::ChunkRecord& r) { return r.owner == doc_id; });
    if (!removed) return std::unexpected(removed.error());
    if (auto r = staged.registry.remove(doc_id); !r) return std::unexpected(r.error());
    if (auto c = commit(std::move(staged)); !c) return std::unexpected(c.error());

    if (core::log_enabled()) {
        std::cerr << "[docqa][engine] removed " << doc_id << " ('" << doc->filename << "'), dropped "
                  << *removed << " chunks" << std::endl;
    }
    return DeleteResult{"Document '" + doc->filename + "' deleted successfully"};
}

auto Engine::list_documents() const -> std::vector<registry::Document> {
    std::shared_lock<std::shared_mutex> lock(state_mu_);
    return live_.registry.documents();
}

auto Engine::get_stats() const -> EngineStats {
    std::shared_lock<std::shared_mutex> lock(state_mu_);
    EngineStats s;
    s.total_documents = live_.registry.size();
    s.total_chunks = live_.index.size();
    s.index_size = live_.index.size();
    s.embedding_model_name = embedder_->model_name();
    s.embedding_dimension = live_.index.dimension();
    return s;
}

} // namespace docqa::engine
