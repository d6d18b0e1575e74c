#include "docqa/storage/store_lock.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace docqa::storage {

using core::error;
using core::error_code;

auto StoreLock::acquire(const std::filesystem::path& root) -> std::expected<StoreLock, error> {
  std::error_code ec;
  std::filesystem::create_directories(root, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed,
        "Failed to create storage directory: " + root.string(), "storage.lock"});
  }

  const auto p = root / kLockName;
  const int fd = ::open(p.string().c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed,
        "lock open failed: " + p.string() + ": " + std::strerror(errno), "storage.lock"});
  }

  struct flock fl = {};
  fl.l_type = F_WRLCK;
  fl.l_whence = SEEK_SET;
  fl.l_start = 0;
  fl.l_len = 0;
#if defined(F_OFD_SETLK)
  const int rc = ::fcntl(fd, F_OFD_SETLK, &fl);
#else
  const int rc = ::fcntl(fd, F_SETLK, &fl);
#endif
  if (rc == -1) {
    const int err = errno;
    (void)::close(fd);
    if (err == EAGAIN || err == EACCES) {
      return std::unexpected(error{error_code::unavailable,
          "storage root " + root.string() + " is in use by another engine", "storage.lock"});
    }
    return std::unexpected(error{error_code::io_failed,
        "lock failed: " + p.string() + ": " + std::strerror(err), "storage.lock"});
  }
  return StoreLock(fd);
}

StoreLock& StoreLock::operator=(StoreLock&& other) noexcept {
  if (this != &other) {
    release();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

StoreLock::~StoreLock() { release(); }

void StoreLock::release() noexcept {
  // Closing the descriptor drops the lock.
  if (fd_ >= 0) {
    (void)::close(fd_);
    fd_ = -1;
  }
}

} // namespace docqa::storage
