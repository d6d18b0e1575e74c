#include "docqa/storage/manifest.hpp"
#include "durable_io.hpp"

#include <charconv>
#include <cstdio>
#include <fstream>
#include <regex>
#include <sstream>

namespace docqa::storage {

using core::error;
using core::error_code;

namespace {

auto parse_u64(const std::string& s, std::uint64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (s.empty() || ec != std::errc() || ptr != end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

// Store files are plain names inside the storage root, never paths.
auto is_valid_file(const std::string& v) -> bool {
  static const std::regex rx("^(documents|chunks|vectors)-([0-9]{8,20})\\.(reg|bin)$");
  return std::regex_match(v, rx);
}

auto generation_name(const char* stem, std::uint64_t generation, const char* ext) -> std::string {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%s-%08llu.%s", stem,
                static_cast<unsigned long long>(generation), ext);
  return buf;
}

} // namespace

auto generation_manifest(std::uint64_t generation, std::uint64_t count) -> Manifest {
  Manifest m;
  m.generation = generation;
  m.documents = generation_name("documents", generation, "reg");
  m.chunks = generation_name("chunks", generation, "bin");
  m.vectors = generation_name("vectors", generation, "bin");
  m.count = count;
  return m;
}

auto load_manifest(const std::filesystem::path& dir)
    -> std::expected<Manifest, error> {
  auto p = dir / kManifestName;
  std::ifstream in(p);
  if (!in.good()) {
    return std::unexpected(error{error_code::not_found, "manifest open failed", "storage.manifest"});
  }
  std::string header; std::getline(in, header);
  if (header != std::string("docqa-store-manifest v1")) {
    return std::unexpected(error{error_code::data_integrity, "bad manifest header", "storage.manifest"});
  }

  Manifest m{};
  bool have_gen = false, have_docs = false, have_chunks = false, have_vecs = false, have_count = false;
  std::string line; std::size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      return std::unexpected(error{error_code::data_integrity,
          "malformed manifest line " + std::to_string(line_no), "storage.manifest"});
    }
    const std::string key = line.substr(0, eq);
    const std::string val = line.substr(eq + 1);
    if (key == "generation") {
      if (!parse_u64(val, m.generation)) {
        return std::unexpected(error{error_code::data_integrity, "malformed generation", "storage.manifest"});
      }
      have_gen = true;
    } else if (key == "count") {
      if (!parse_u64(val, m.count)) {
        return std::unexpected(error{error_code::data_integrity, "malformed count", "storage.manifest"});
      }
      have_count = true;
    } else if (key == "documents" || key == "chunks" || key == "vectors") {
      if (!is_valid_file(val)) {
        return std::unexpected(error{error_code::data_integrity, "invalid file name for " + key, "storage.manifest"});
      }
      if (key == "documents") { m.documents = val; have_docs = true; }
      else if (key == "chunks") { m.chunks = val; have_chunks = true; }
      else { m.vectors = val; have_vecs = true; }
    }
    // Unknown keys are ignored for forward compatibility.
  }
  if (!(have_gen && have_docs && have_chunks && have_vecs && have_count)) {
    return std::unexpected(error{error_code::data_integrity, "manifest missing required keys", "storage.manifest"});
  }
  return m;
}

auto save_manifest(const std::filesystem::path& dir, const Manifest& m)
    -> std::expected<void, error> {
  std::ostringstream out;
  out << "docqa-store-manifest v1\n";
  out << "generation=" << m.generation << "\n";
  out << "documents=" << m.documents << "\n";
  out << "chunks=" << m.chunks << "\n";
  out << "vectors=" << m.vectors << "\n";
  out << "count=" << m.count << "\n";
  return detail::atomic_write(dir, kManifestName, out.str(), "storage.manifest");
}

} // namespace docqa::storage
