#include "docqa/storage/store.hpp"
#include "docqa/storage/manifest.hpp"
#include "docqa/storage/store_files.hpp"
#include "docqa/core/platform_utils.hpp"

#include <algorithm>
#include <iostream>
#include <regex>
#include <string_view>
#include <unordered_map>

namespace docqa::storage {

using core::error;
using core::error_code;
namespace fs = std::filesystem;

namespace {

// Removes store files that belong to any generation other than \p keep.
void purge_other_generations(const fs::path& root, const Manifest& keep) {
  static const std::regex rx("^(documents|chunks|vectors)-([0-9]{8,20})\\.(reg|bin)$");
  std::error_code ec;
  std::vector<fs::path> doomed;
  for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name == keep.documents || name == keep.chunks || name == keep.vectors) continue;
    if (std::regex_match(name, rx)) doomed.push_back(it->path());
  }
  for (const auto& p : doomed) {
    std::error_code rec;
    (void)fs::remove(p, rec);
  }
}

} // namespace

auto load_store(const fs::path& root, std::size_t dim) -> std::expected<StoreState, error> {
  std::error_code ec;
  fs::create_directories(root, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed,
        "Failed to create storage directory: " + root.string(), "storage.store"});
  }

  auto mx = load_manifest(root);
  if (!mx) {
    if (mx.error().code != error_code::not_found) return std::unexpected(mx.error());
    if (core::log_enabled()) {
      std::cerr << "[docqa][store] no manifest under " << root.string() << ", starting empty (dim=" << dim << ")" << std::endl;
    }
    return StoreState(dim);
  }
  const Manifest& m = *mx;

  auto rf = read_registry_file(root / m.documents);
  if (!rf) return std::unexpected(rf.error());
  auto cf = read_chunk_file(root / m.chunks);
  if (!cf) return std::unexpected(cf.error());
  auto vf = read_vector_file(root / m.vectors);
  if (!vf) return std::unexpected(vf.error());

  if (vf->dim != dim) {
    return std::unexpected(error{error_code::dimension_mismatch,
        "stored index has dimension " + std::to_string(vf->dim) + ", engine configured for " + std::to_string(dim),
        "storage.store"});
  }
  if (cf->generation != m.generation || vf->generation != m.generation) {
    std::cerr << "[docqa][store] generation stamps differ: manifest=" << m.generation
              << " chunks=" << cf->generation << " vectors=" << vf->generation << std::endl;
  }

  std::vector<index::ChunkRecord> records = std::move(cf->records);
  const std::size_t n_vec = static_cast<std::size_t>(vf->count);
  if (records.size() != n_vec) {
    const std::size_t keep = std::min(records.size(), n_vec);
    std::cerr << "[docqa][store] chunk/vector count mismatch: chunks=" << records.size()
              << " vectors=" << n_vec << ", truncating to " << keep << std::endl;
    records.resize(keep);
  }
  for (std::size_t i = 0; i < records.size(); ++i) {
    const float* row = vf->data.data() + i * dim;
    records[i].vector.assign(row, row + dim);
  }

  auto reg = registry::DocumentRegistry::restore(std::move(rf->documents), rf->next_seq);
  if (!reg) return std::unexpected(reg.error());
  auto idx = index::FlatIndex::restore(dim, std::move(records), cf->next_key);
  if (!idx) return std::unexpected(idx.error());

  if (core::log_enabled()) {
    std::cerr << "[docqa][store] loaded generation " << m.generation << ": documents=" << reg->size()
              << " chunks=" << idx->size() << std::endl;
  }
  return StoreState(std::move(*reg), std::move(*idx), m.generation);
}

auto save_store(const fs::path& root, const StoreState& state, const StoreOptions& opts)
    -> std::expected<std::uint64_t, error> {
  std::error_code ec;
  fs::create_directories(root, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed,
        "Failed to create storage directory: " + root.string(), "storage.store"});
  }

  const std::uint64_t gen = state.generation + 1;
  const Manifest m = generation_manifest(gen, state.index.size());

  auto cleanup = [&]() {
    std::error_code rec;
    (void)fs::remove(root / m.documents, rec);
    (void)fs::remove(root / m.chunks, rec);
    (void)fs::remove(root / m.vectors, rec);
  };

  // Metadata before vectors; neither is visible until the manifest names them.
  if (auto r = write_registry_file(root / m.documents, state.registry); !r) { cleanup(); return std::unexpected(r.error()); }
  if (auto r = write_chunk_file(root / m.chunks, gen, state.index, opts.zstd_level); !r) { cleanup(); return std::unexpected(r.error()); }
  if (auto r = write_vector_file(root / m.vectors, gen, state.index); !r) { cleanup(); return std::unexpected(r.error()); }
  if (auto r = save_manifest(root, m); !r) { cleanup(); return std::unexpected(r.error()); }

  purge_other_generations(root, m);

  if (core::log_enabled()) {
    std::cerr << "[docqa][store] saved generation " << gen << ": documents=" << state.registry.size()
              << " chunks=" << state.index.size() << std::endl;
  }
  return gen;
}

auto check_invariants(const StoreState& state) -> std::expected<void, error> {
  std::unordered_map<std::string, std::uint64_t> owned;
  std::unordered_map<std::string, std::string_view> filenames;
  for (const auto& d : state.registry.documents()) {
    owned.emplace(d.doc_id, 0);
    filenames.emplace(d.doc_id, d.filename);
  }

  const auto& records = state.index.records();
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& r = records[i];
    if (r.vector.size() != state.index.dimension()) {
      return std::unexpected(error{error_code::data_integrity,
          "chunk " + std::to_string(i) + " has vector length " + std::to_string(r.vector.size()), "storage.verify"});
    }
    auto it = owned.find(r.owner);
    if (it == owned.end()) {
      return std::unexpected(error{error_code::data_integrity,
          "chunk " + std::to_string(i) + " belongs to unknown document '" + r.owner + "'", "storage.verify"});
    }
    if (const auto name = filenames.at(r.owner); r.source != name) {
      return std::unexpected(error{error_code::data_integrity,
          "chunk " + std::to_string(i) + " names source '" + r.source + "' but " + r.owner + " is '"
          + std::string(name) + "'", "storage.verify"});
    }
    ++it->second;
  }
  for (const auto& d : state.registry.documents()) {
    if (owned[d.doc_id] != d.num_chunks) {
      return std::unexpected(error{error_code::data_integrity,
          d.doc_id + " records " + std::to_string(d.num_chunks) + " chunks, index holds "
          + std::to_string(owned[d.doc_id]), "storage.verify"});
    }
  }
  return {};
}

} // namespace docqa::storage
