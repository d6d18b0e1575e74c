#pragma once

/** \file store_lock.hpp
 *  \brief Exclusive advisory lock on a storage root.
 *
 * An Engine holds the lock on <root>/store.lock for its whole lifetime, so a
 * second writer (another engine, docqa_admin delete) is refused instead of
 * publishing a competing generation. The lock is an fcntl write lock on an open
 * file description (F_OFD_SETLK where available), so it also excludes a second
 * engine inside the same process. It is released when the lock is destroyed or
 * the process exits. Read-only access through load_store() does not take it.
 */

#include <expected>
#include <filesystem>

#include "docqa/error.hpp"

namespace docqa::storage {

inline constexpr const char* kLockName = "store.lock";

class StoreLock {
public:
    /** \brief Lock \p root, creating the directory and lock file if needed.
     *  Errors: unavailable if another holder has the lock; io_failed otherwise.
     */
    static auto acquire(const std::filesystem::path& root) -> std::expected<StoreLock, core::error>;

    StoreLock(StoreLock&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    StoreLock& operator=(StoreLock&& other) noexcept;
    StoreLock(const StoreLock&) = delete;
    StoreLock& operator=(const StoreLock&) = delete;
    ~StoreLock();

    [[nodiscard]] auto held() const noexcept -> bool { return fd_ >= 0; }

private:
    explicit StoreLock(int fd) noexcept : fd_(fd) {}
    void release() noexcept;

    int fd_{-1};
};

} // namespace docqa::storage
