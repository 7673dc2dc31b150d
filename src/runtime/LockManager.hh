#pragma once

#include <filesystem>
#include <optional>
#include <utility>

namespace fs = std::filesystem;

/**
 * An exclusive advisory lock on a file. At most one live token exists per lock path on a machine.
 * The lock is released when the token is released or destroyed, whichever comes first.
 */
class LockToken {
 public:
  LockToken(fs::path path, int fd) noexcept : _path(std::move(path)), _fd(fd) {}

  // Disallow Copy
  LockToken(const LockToken&) = delete;
  LockToken& operator=(const LockToken&) = delete;

  // Allow Move
  LockToken(LockToken&& other) noexcept : _path(std::move(other._path)), _fd(other._fd) {
    other._fd = -1;
  }
  LockToken& operator=(LockToken&& other) noexcept;

  ~LockToken() noexcept { release(); }

  /// Is the lock still held?
  bool held() const noexcept { return _fd >= 0; }

  /// Get the locked path
  const fs::path& getPath() const noexcept { return _path; }

  /// Release the lock. Releasing an already-released lock does nothing.
  void release() noexcept;

 private:
  fs::path _path;
  int _fd = -1;
};

namespace LockManager {
  /**
   * Try to take the lock at `path` without blocking. The file is created if needed; its contents
   * are never used.
   *
   * \returns a token if the lock was acquired, or nullopt if another live process holds it.
   *          Any other failure to open or lock the file is fatal.
   */
  std::optional<LockToken> acquire(const fs::path& path) noexcept;
}
