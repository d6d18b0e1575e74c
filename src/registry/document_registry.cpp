#include "docqa/registry/document_registry.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <unordered_set>

namespace docqa::registry {

using core::error;
using core::error_code;

namespace {

template <typename Pred>
auto find_first(const std::vector<Document>& docs, Pred pred) -> std::optional<Document> {
  auto it = std::find_if(docs.begin(), docs.end(), pred);
  if (it == docs.end()) return std::nullopt;
  return *it;
}

} // namespace

auto utc_timestamp_now() -> std::string {
  const auto now = std::chrono::system_clock::now();
  const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(now);
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now - secs).count();
  const std::time_t t = std::chrono::system_clock::to_time_t(secs);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%06lldZ", buf, static_cast<long long>(micros));
  return out;
}

auto DocumentRegistry::find(std::string_view doc_id) const -> std::optional<Document> {
  return find_first(docs_, [&](const Document& d) { return d.doc_id == doc_id; });
}

auto DocumentRegistry::find_by_hash(std::string_view hash) const -> std::optional<Document> {
  return find_first(docs_, [&](const Document& d) { return d.hash == hash; });
}

auto DocumentRegistry::find_by_filename(std::string_view filename) const -> std::optional<Document> {
  return find_first(docs_, [&](const Document& d) { return d.filename == filename; });
}

auto DocumentRegistry::register_document(std::string filename, std::string hash,
                                         std::uint64_t num_chunks, std::uint32_t num_pages) -> Document {
  const auto unix_secs = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  Document d;
  d.doc_id = "doc_" + std::to_string(next_seq_++) + "_" + std::to_string(unix_secs);
  d.filename = std::move(filename);
  d.hash = std::move(hash);
  d.upload_timestamp = utc_timestamp_now();
  d.num_chunks = num_chunks;
  d.num_pages = num_pages;
  docs_.push_back(d);
  return d;
}

auto DocumentRegistry::remove(std::string_view doc_id) -> std::expected<void, error> {
  auto it = std::find_if(docs_.begin(), docs_.end(), [&](const Document& d) { return d.doc_id == doc_id; });
  if (it == docs_.end()) {
    return std::unexpected(error{error_code::not_found,
        "Document " + std::string(doc_id) + " not found", "registry"});
  }
  docs_.erase(it);
  return {};
}

auto DocumentRegistry::restore(std::vector<Document> docs, std::uint64_t next_seq)
    -> std::expected<DocumentRegistry, error> {
  std::unordered_set<std::string> seen;
  std::uint64_t floor = std::max<std::uint64_t>(next_seq, 1);
  for (const auto& d : docs) {
    if (!seen.insert(d.doc_id).second) {
      return std::unexpected(error{error_code::data_integrity, "duplicate doc_id " + d.doc_id, "registry"});
    }
    // doc_<seq>_<secs>: never hand out a sequence number already on disk.
    if (d.doc_id.rfind("doc_", 0) == 0) {
      const auto end = d.doc_id.find('_', 4);
      std::uint64_t seq = 0;
      const char* beg = d.doc_id.data() + 4;
      const char* stop = d.doc_id.data() + (end == std::string::npos ? d.doc_id.size() : end);
      auto [ptr, ec] = std::from_chars(beg, stop, seq, 10);
      if (ec == std::errc() && ptr == stop) floor = std::max(floor, seq + 1);
    }
  }
  DocumentRegistry r;
  r.docs_ = std::move(docs);
  r.next_seq_ = floor;
  return r;
}

} // namespace docqa::registry
