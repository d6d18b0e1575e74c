#include "docqa/storage/store_files.hpp"
#include "durable_io.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

#include <zstd.h>

namespace docqa::storage {

using core::error;
using core::error_code;

namespace {

constexpr char kChunkMagic[8] = {'D','Q','C','H','U','N','K','1'};
constexpr char kVectorMagic[8] = {'D','Q','V','E','C','S','0','1'};
constexpr std::uint16_t kMajor = 1;
constexpr std::uint16_t kMinor = 0;
constexpr std::uint32_t kFlagZstd = 0x1u;
constexpr std::uint64_t kMaxStringBytes = 1ull << 30;

auto parse_u64(std::string_view s, std::uint64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (s.empty() || ec != std::errc() || ptr != end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

template <typename T>
void put(std::string& buf, const T& v) {
  buf.append(reinterpret_cast<const char*>(&v), sizeof(T));
}

void put_str(std::string& buf, std::string_view s) {
  put(buf, static_cast<std::uint32_t>(s.size()));
  buf.append(s.data(), s.size());
}

// Bounds-checked cursor over a loaded file image.
struct Reader {
  std::string_view data;
  std::size_t pos{0};

  template <typename T>
  bool get(T& v) {
    if (data.size() - pos < sizeof(T)) return false;
    std::memcpy(&v, data.data() + pos, sizeof(T));
    pos += sizeof(T);
    return true;
  }
  bool get_str(std::string& s) {
    std::uint32_t n = 0;
    if (!get(n) || data.size() - pos < n) return false;
    s.assign(data.data() + pos, n);
    pos += n;
    return true;
  }
  bool get_bytes(void* dst, std::size_t n) {
    if (data.size() - pos < n) return false;
    std::memcpy(dst, data.data() + pos, n);
    pos += n;
    return true;
  }
};

auto slurp(const std::filesystem::path& p, const char* component) -> std::expected<std::string, error> {
  std::ifstream in(p, std::ios::binary);
  if (!in) {
    return std::unexpected(error{error_code::data_integrity, "missing store file " + p.filename().string(), component});
  }
  std::string buf((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::unexpected(error{error_code::io_failed, "read failed: " + p.filename().string(), component});
  }
  return buf;
}

// Checks and strips the FNV-1a trailer.
auto verify_checksum(std::string_view image, const char* component) -> std::expected<std::string_view, error> {
  if (image.size() < sizeof(std::uint64_t)) {
    return std::unexpected(error{error_code::data_integrity, "file too short", component});
  }
  const std::size_t body = image.size() - sizeof(std::uint64_t);
  std::uint64_t stored = 0;
  std::memcpy(&stored, image.data() + body, sizeof(stored));
  detail::Fnv1a64 h;
  h.update(image.data(), body);
  if (h.h != stored) {
    return std::unexpected(error{error_code::data_integrity, "checksum mismatch", component});
  }
  return image.substr(0, body);
}

auto write_image(const std::filesystem::path& p, std::string image, const char* component)
    -> std::expected<void, error> {
  detail::Fnv1a64 h;
  h.update(image.data(), image.size());
  put(image, h.h);
  {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) {
      return std::unexpected(error{error_code::io_failed, "Failed to open file for writing: " + p.string(), component});
    }
    out.write(image.data(), static_cast<std::streamsize>(image.size()));
    out.flush();
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "write failed: " + p.string(), component});
    }
  }
  return detail::sync_file(p, component);
}

} // namespace

auto percent_encode(std::string_view s) -> std::string {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (c <= 0x20 || c == 0x7F || c == '%') {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    } else {
      out.push_back(static_cast<char>(c));
    }
  }
  return out;
}

auto percent_decode(std::string_view s) -> std::expected<std::string, error> {
  auto hexval = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
  };
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '%') { out.push_back(s[i]); continue; }
    if (i + 2 >= s.size()) {
      return std::unexpected(error{error_code::data_integrity, "truncated percent escape", "storage.registry"});
    }
    const int hi = hexval(s[i + 1]);
    const int lo = hexval(s[i + 2]);
    if (hi < 0 || lo < 0) {
      return std::unexpected(error{error_code::data_integrity, "bad percent escape", "storage.registry"});
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

auto write_registry_file(const std::filesystem::path& p, const registry::DocumentRegistry& r)
    -> std::expected<void, error> {
  std::ostringstream out;
  out << "docqa-registry v1\n";
  out << "next_seq=" << r.next_sequence() << "\n";
  for (const auto& d : r.documents()) {
    out << "doc_id=" << percent_encode(d.doc_id)
        << " filename=" << percent_encode(d.filename)
        << " hash=" << percent_encode(d.hash)
        << " uploaded=" << percent_encode(d.upload_timestamp)
        << " chunks=" << d.num_chunks
        << " pages=" << d.num_pages << "\n";
  }
  const std::string text = out.str();
  {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) {
      return std::unexpected(error{error_code::io_failed, "Failed to open file for writing: " + p.string(), "storage.registry"});
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    f.flush();
    if (!f.good()) {
      return std::unexpected(error{error_code::io_failed, "write failed: " + p.string(), "storage.registry"});
    }
  }
  return detail::sync_file(p, "storage.registry");
}

auto read_registry_file(const std::filesystem::path& p) -> std::expected<RegistryFile, error> {
  std::ifstream in(p);
  if (!in.good()) {
    return std::unexpected(error{error_code::data_integrity, "missing store file " + p.filename().string(), "storage.registry"});
  }
  std::string header; std::getline(in, header);
  if (header != std::string("docqa-registry v1")) {
    return std::unexpected(error{error_code::data_integrity, "bad registry header", "storage.registry"});
  }
  RegistryFile rf;
  std::string line; std::getline(in, line);
  if (line.rfind("next_seq=", 0) != 0 || !parse_u64(std::string_view(line).substr(9), rf.next_seq)) {
    return std::unexpected(error{error_code::data_integrity, "missing next_seq", "storage.registry"});
  }

  std::size_t line_no = 2;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    auto bad = [&](const std::string& what) {
      return std::unexpected(error{error_code::data_integrity,
          what + " at registry line " + std::to_string(line_no), "storage.registry"});
    };

    registry::Document d;
    bool have_id = false, have_name = false, have_hash = false, have_ts = false, have_chunks = false, have_pages = false;
    std::istringstream ls(line);
    std::string tok;
    while (ls >> tok) {
      const auto eq = tok.find('=');
      if (eq == std::string::npos) return bad("malformed field");
      const std::string key = tok.substr(0, eq);
      auto val = percent_decode(std::string_view(tok).substr(eq + 1));
      if (!val) return bad(val.error().message);
      if (key == "doc_id") { d.doc_id = std::move(*val); have_id = true; }
      else if (key == "filename") { d.filename = std::move(*val); have_name = true; }
      else if (key == "hash") { d.hash = std::move(*val); have_hash = true; }
      else if (key == "uploaded") { d.upload_timestamp = std::move(*val); have_ts = true; }
      else if (key == "chunks") {
        if (!parse_u64(*val, d.num_chunks)) return bad("malformed chunks");
        have_chunks = true;
      } else if (key == "pages") {
        std::uint64_t pages = 0;
        if (!parse_u64(*val, pages) || pages == 0 || pages > 0xFFFFFFFFull) return bad("malformed pages");
        d.num_pages = static_cast<std::uint32_t>(pages);
        have_pages = true;
      }
    }
    if (!(have_id && have_name && have_hash && have_ts && have_chunks && have_pages)) {
      return bad("missing field");
    }
    if (d.doc_id.empty()) return bad("empty doc_id");
    rf.documents.push_back(std::move(d));
  }
  return rf;
}

auto write_chunk_file(const std::filesystem::path& p, std::uint64_t generation,
                      const index::FlatIndex& idx, int zstd_level)
    -> std::expected<void, error> {
  std::string payload;
  for (const auto& r : idx.records()) {
    put(payload, r.key);
    put(payload, r.page);
    put_str(payload, r.owner);
    put_str(payload, r.source);
    put_str(payload, r.text);
  }

  const std::uint64_t raw_size = payload.size();
  std::uint32_t flags = 0;
  std::string stored;
  if (zstd_level > 0 && !payload.empty()) {
    stored.resize(ZSTD_compressBound(payload.size()));
    const std::size_t n = ZSTD_compress(stored.data(), stored.size(), payload.data(), payload.size(), zstd_level);
    if (ZSTD_isError(n)) {
      return std::unexpected(error{error_code::internal,
          std::string("zstd compress failed: ") + ZSTD_getErrorName(n), "storage.chunks"});
    }
    stored.resize(n);
    flags |= kFlagZstd;
  } else {
    stored = std::move(payload);
  }

  std::string image;
  image.append(kChunkMagic, sizeof(kChunkMagic));
  put(image, kMajor);
  put(image, kMinor);
  put(image, generation);
  put(image, static_cast<std::uint64_t>(idx.size()));
  put(image, idx.next_key());
  put(image, flags);
  put(image, raw_size);
  put(image, static_cast<std::uint64_t>(stored.size()));
  image.append(stored);
  return write_image(p, std::move(image), "storage.chunks");
}

auto read_chunk_file(const std::filesystem::path& p) -> std::expected<ChunkFile, error> {
  constexpr const char* kComp = "storage.chunks";
  auto image = slurp(p, kComp);
  if (!image) return std::unexpected(image.error());
  auto body = verify_checksum(*image, kComp);
  if (!body) return std::unexpected(body.error());

  Reader rd{*body};
  char magic[8];
  std::uint16_t major = 0, minor = 0;
  std::uint64_t count = 0, raw_size = 0, stored_size = 0;
  std::uint32_t flags = 0;
  ChunkFile cf;
  if (!rd.get_bytes(magic, sizeof(magic)) || std::memcmp(magic, kChunkMagic, sizeof(magic)) != 0) {
    return std::unexpected(error{error_code::data_integrity, "bad chunk file magic", kComp});
  }
  if (!rd.get(major) || !rd.get(minor) || major != kMajor) {
    return std::unexpected(error{error_code::data_integrity, "unsupported chunk file version", kComp});
  }
  if (!rd.get(cf.generation) || !rd.get(count) || !rd.get(cf.next_key) || !rd.get(flags)
      || !rd.get(raw_size) || !rd.get(stored_size) || rd.data.size() - rd.pos != stored_size) {
    return std::unexpected(error{error_code::data_integrity, "truncated chunk file header", kComp});
  }

  std::string payload;
  const std::string_view stored = rd.data.substr(rd.pos, stored_size);
  if (flags & kFlagZstd) {
    if (raw_size > (kMaxStringBytes << 4)) {
      return std::unexpected(error{error_code::data_integrity, "implausible payload size", kComp});
    }
    payload.resize(raw_size);
    const std::size_t n = ZSTD_decompress(payload.data(), payload.size(), stored.data(), stored.size());
    if (ZSTD_isError(n) || n != raw_size) {
      return std::unexpected(error{error_code::data_integrity, "zstd decompress failed", kComp});
    }
  } else {
    payload.assign(stored);
  }

  Reader pr{payload};
  cf.records.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(count, 1u << 20)));
  for (std::uint64_t i = 0; i < count; ++i) {
    index::ChunkRecord r;
    if (!pr.get(r.key) || !pr.get(r.page) || !pr.get_str(r.owner) || !pr.get_str(r.source) || !pr.get_str(r.text)) {
      return std::unexpected(error{error_code::data_integrity,
          "truncated chunk record " + std::to_string(i), kComp});
    }
    cf.records.push_back(std::move(r));
  }
  if (pr.pos != payload.size()) {
    return std::unexpected(error{error_code::data_integrity, "trailing bytes in chunk payload", kComp});
  }
  return cf;
}

auto write_vector_file(const std::filesystem::path& p, std::uint64_t generation,
                       const index::FlatIndex& idx)
    -> std::expected<void, error> {
  std::string image;
  image.reserve(40 + idx.size() * idx.dimension() * sizeof(float));
  image.append(kVectorMagic, sizeof(kVectorMagic));
  put(image, kMajor);
  put(image, kMinor);
  put(image, generation);
  put(image, static_cast<std::uint32_t>(idx.dimension()));
  put(image, static_cast<std::uint64_t>(idx.size()));
  for (const auto& r : idx.records()) {
    image.append(reinterpret_cast<const char*>(r.vector.data()), r.vector.size() * sizeof(float));
  }
  return write_image(p, std::move(image), "storage.vectors");
}

auto read_vector_file(const std::filesystem::path& p) -> std::expected<VectorFile, error> {
  constexpr const char* kComp = "storage.vectors";
  auto image = slurp(p, kComp);
  if (!image) return std::unexpected(image.error());
  auto body = verify_checksum(*image, kComp);
  if (!body) return std::unexpected(body.error());

  Reader rd{*body};
  char magic[8];
  std::uint16_t major = 0, minor = 0;
  VectorFile vf;
  if (!rd.get_bytes(magic, sizeof(magic)) || std::memcmp(magic, kVectorMagic, sizeof(magic)) != 0) {
    return std::unexpected(error{error_code::data_integrity, "bad vector file magic", kComp});
  }
  if (!rd.get(major) || !rd.get(minor) || major != kMajor) {
    return std::unexpected(error{error_code::data_integrity, "unsupported vector file version", kComp});
  }
  if (!rd.get(vf.generation) || !rd.get(vf.dim) || !rd.get(vf.count)) {
    return std::unexpected(error{error_code::data_integrity, "truncated vector file header", kComp});
  }
  const std::size_t remaining = rd.data.size() - rd.pos;
  if (vf.dim == 0 || remaining % (static_cast<std::size_t>(vf.dim) * sizeof(float)) != 0
      || remaining / (static_cast<std::size_t>(vf.dim) * sizeof(float)) != vf.count) {
    return std::unexpected(error{error_code::data_integrity, "vector data size does not match header", kComp});
  }
  vf.data.resize(static_cast<std::size_t>(vf.count) * vf.dim);
  if (!vf.data.empty() && !rd.get_bytes(vf.data.data(), remaining)) {
    return std::unexpected(error{error_code::data_integrity, "truncated vector data", kComp});
  }
  return vf;
}

} // namespace docqa::storage
