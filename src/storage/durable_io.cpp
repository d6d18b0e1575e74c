#include "durable_io.hpp"

#include <fstream>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace docqa::storage::detail {

using core::error;
using core::error_code;

auto sync_file(const std::filesystem::path& p, std::string_view component)
    -> std::expected<void, error> {
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed: " + p.filename().string(),
                                 std::string(component)});
  }
  const int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return std::unexpected(error{error_code::io_failed, "fsync failed: " + p.filename().string(),
                                 std::string(component)});
  }
#else
  (void)p; (void)component;
#endif
  return {};
}

void sync_directory(const std::filesystem::path& dir) noexcept {
#if defined(__linux__) || defined(__APPLE__)
  int dfd = ::open(dir.string().c_str(), O_RDONLY);
  if (dfd >= 0) { (void)::fsync(dfd); (void)::close(dfd); }
#else
  (void)dir;
#endif
}

auto atomic_write(const std::filesystem::path& dir, const std::string& name,
                  std::string_view contents, std::string_view component)
    -> std::expected<void, error> {
  const auto p_tmp = dir / (name + ".tmp");
  const auto p_dst = dir / name;
  std::error_code rec;

  // 1) Write tmp
  {
    std::ofstream out(p_tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, name + " tmp open failed", std::string(component)});
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      (void)std::filesystem::remove(p_tmp, rec);
      return std::unexpected(error{error_code::io_failed, name + " tmp write failed", std::string(component)});
    }
  }
  // 2) Ensure tmp contents durable
  if (auto s = sync_file(p_tmp, component); !s) {
    (void)std::filesystem::remove(p_tmp, rec);
    return std::unexpected(s.error());
  }
  // 3) Atomic replace
  std::error_code ec;
  std::filesystem::rename(p_tmp, p_dst, ec);
  if (ec) {
    (void)std::filesystem::remove(p_tmp, rec);
    return std::unexpected(error{error_code::io_failed, name + " rename failed: " + ec.message(),
                                 std::string(component)});
  }
  // 4) Best-effort directory flush
  sync_directory(dir);
  return {};
}

} // namespace docqa::storage::detail
