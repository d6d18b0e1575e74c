#include "docqa/core/config.hpp"
#include "docqa/embed/hashing_embedder.hpp"
#include "docqa/engine/engine.hpp"
#include "docqa/storage/store.hpp"

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using docqa::core::error;
using docqa::core::error_code;

namespace {

// The admin tool never ingests or answers; these fail if reached.
class UnavailableExtractor final : public docqa::engine::TextExtractor {
public:
    auto extract(std::span<const std::uint8_t>)
        -> std::expected<std::vector<docqa::text::Page>, error> override {
        return std::unexpected(error{error_code::extraction_failed, "no extractor in docqa_admin", "admin"});
    }
};

class UnavailableGenerator final : public docqa::engine::AnswerGenerator {
public:
    auto generate(const std::string&) -> std::expected<std::string, error> override {
        return std::unexpected(error{error_code::generation_failed, "no generator in docqa_admin", "admin"});
    }
};

void usage() {
    std::cout << "Usage: docqa_admin [--storage DIR] [--dim N] <stats|list|delete ID|verify>\n"
                 "  Defaults come from DOCQA_STORAGE_DIR / DOCQA_EMBED_DIM, else ./storage and 384.\n"
                 "  stats, list and verify only read; delete fails while another engine holds the root.\n";
}

void print_error(const error& e) {
    std::cerr << "docqa_admin: " << e.message << " [" << docqa::core::to_string(e.code);
    if (!e.component.empty()) std::cerr << " @" << e.component;
    std::cerr << "]" << std::endl;
}

auto open_engine(const docqa::core::EngineConfig& cfg)
    -> std::expected<std::unique_ptr<docqa::engine::Engine>, error> {
    return docqa::engine::Engine::open(cfg, std::make_shared<UnavailableExtractor>(),
                                       std::make_shared<docqa::embed::HashingEmbedder>(cfg.dimension),
                                       std::make_shared<UnavailableGenerator>());
}

int cmd_stats(const docqa::core::EngineConfig& cfg) {
    auto state = docqa::storage::load_store(cfg.storage_dir, cfg.dimension);
    if (!state) { print_error(state.error()); return 1; }
    std::uint64_t chunks = 0;
    for (const auto& d : state->registry.documents()) chunks += d.num_chunks;
    std::cout << "storage:    " << cfg.storage_dir.string() << "\n"
              << "generation: " << state->generation << "\n"
              << "documents:  " << state->registry.size() << "\n"
              << "chunks:     " << chunks << "\n"
              << "index size: " << state->index.size() << "\n"
              << "model:      " << docqa::embed::HashingEmbedder(cfg.dimension).model_name() << "\n"
              << "dimension:  " << cfg.dimension << "\n";
    return 0;
}

int cmd_list(const docqa::core::EngineConfig& cfg) {
    auto state = docqa::storage::load_store(cfg.storage_dir, cfg.dimension);
    if (!state) { print_error(state.error()); return 1; }
    for (const auto& d : state->registry.documents()) {
        std::cout << d.doc_id << "\t" << d.filename << "\t" << d.upload_timestamp << "\tchunks=" << d.num_chunks
                  << "\tpages=" << d.num_pages << "\t" << d.hash << "\n";
    }
    return 0;
}

// Takes the storage lock through Engine::open, so it is refused while a
// service has the root open.
int cmd_delete(const docqa::core::EngineConfig& cfg, const std::string& doc_id) {
    auto engine = open_engine(cfg);
    if (!engine) { print_error(engine.error()); return 1; }
    auto r = (*engine)->remove_document(doc_id);
    if (!r) { print_error(r.error()); return 1; }
    std::cout << r->message << "\n";
    return 0;
}

int cmd_verify(const docqa::core::EngineConfig& cfg) {
    auto state = docqa::storage::load_store(cfg.storage_dir, cfg.dimension);
    if (!state) { print_error(state.error()); return 1; }
    if (auto ok = docqa::storage::check_invariants(*state); !ok) {
        print_error(ok.error());
        return 1;
    }
    std::cout << "ok: generation " << state->generation << ", documents=" << state->registry.size()
              << ", chunks=" << state->index.size() << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    auto cfg = docqa::core::config_from_env();
    if (!cfg) { print_error(cfg.error()); return 2; }

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--help" || a == "-h") { usage(); return 0; }
        if (a == "--storage" && i + 1 < argc) { cfg->storage_dir = argv[++i]; continue; }
        if (a == "--dim" && i + 1 < argc) {
            std::string_view v(argv[++i]);
            std::size_t dim = 0;
            auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), dim);
            if (ec != std::errc{} || p != v.data() + v.size() || dim == 0) {
                std::cerr << "docqa_admin: invalid --dim '" << v << "'" << std::endl;
                return 2;
            }
            cfg->dimension = dim;
            continue;
        }
        positional.emplace_back(a);
    }
    if (positional.empty()) { usage(); return 2; }

    const std::string& cmd = positional[0];
    if (cmd == "stats") return cmd_stats(*cfg);
    if (cmd == "list") return cmd_list(*cfg);
    if (cmd == "verify") return cmd_verify(*cfg);
    if (cmd == "delete" && positional.size() == 2) return cmd_delete(*cfg, positional[1]);
    usage();
    return 2;
}
