#pragma once

/** \file store_files.hpp
 *  \brief Codecs for the three store artifacts.
 *
 * Registry (text, v1):
 *   docqa-registry v1\n
 *   next_seq=<u64>\n
 *   doc_id=<v> filename=<v> hash=<hex> uploaded=<v> chunks=<u64> pages=<u32>\n  (one per document)
 *   Values are percent-encoded (bytes <= 0x20, 0x7F and '%').
 *
 * Chunks (binary, native little-endian):
 *   magic "DQCHUNK1" | u16 major=1 | u16 minor=0 | u64 generation | u64 count | u64 next_key
 *   | u32 flags (bit0: zstd payload) | u64 raw_size | u64 stored_size | payload[stored_size]
 *   | u64 fnv1a64(all preceding bytes)
 *   payload record: u64 key | u32 page | str owner | str source | str text, where str = u32 len + bytes
 *
 * Vectors (binary, native little-endian):
 *   magic "DQVECS01" | u16 major=1 | u16 minor=0 | u64 generation | u32 dim | u64 count
 *   | f32[count * dim] row-major | u64 fnv1a64(all preceding bytes)
 *
 * Row i of the vector file belongs to record i of the chunk file.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "docqa/error.hpp"
#include "docqa/index/flat_index.hpp"
#include "docqa/registry/document_registry.hpp"

namespace docqa::storage {

struct RegistryFile {
  std::vector<registry::Document> documents;
  std::uint64_t next_seq{1};
};

struct ChunkFile {
  std::uint64_t generation{0};
  std::uint64_t next_key{1};
  std::vector<index::ChunkRecord> records;   /**< vectors left empty */
};

struct VectorFile {
  std::uint64_t generation{0};
  std::uint32_t dim{0};
  std::uint64_t count{0};
  std::vector<float> data;                   /**< count * dim floats */
};

auto write_registry_file(const std::filesystem::path& p, const registry::DocumentRegistry& r)
    -> std::expected<void, core::error>;
auto read_registry_file(const std::filesystem::path& p)
    -> std::expected<RegistryFile, core::error>;

/** \param zstd_level 0 stores the payload raw; 1..19 compresses it with zstd. */
auto write_chunk_file(const std::filesystem::path& p, std::uint64_t generation,
                      const index::FlatIndex& idx, int zstd_level)
    -> std::expected<void, core::error>;
auto read_chunk_file(const std::filesystem::path& p)
    -> std::expected<ChunkFile, core::error>;

auto write_vector_file(const std::filesystem::path& p, std::uint64_t generation,
                       const index::FlatIndex& idx)
    -> std::expected<void, core::error>;
auto read_vector_file(const std::filesystem::path& p)
    -> std::expected<VectorFile, core::error>;

/** Percent-encoding used by the registry file. */
auto percent_encode(std::string_view s) -> std::string;
auto percent_decode(std::string_view s) -> std::expected<std::string, core::error>;

} // namespace docqa::storage
