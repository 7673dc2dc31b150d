#include "runtime/LockManager.hh"

#include <cerrno>
#include <filesystem>
#include <optional>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "util/log.hh"

LockToken& LockToken::operator=(LockToken&& other) noexcept {
  if (this != &other) {
    release();
    _path = std::move(other._path);
    _fd = other._fd;
    other._fd = -1;
  }
  return *this;
}

void LockToken::release() noexcept {
  if (_fd < 0) return;

  LOG(lock) << "Releasing lock " << _path;

  // The file stays in place. Unlinking it would let a process that already opened the old file
  // and a process that creates a new one both hold "the" lock.
  ::flock(_fd, LOCK_UN);
  ::close(_fd);
  _fd = -1;
}

namespace LockManager {
  std::optional<LockToken> acquire(const fs::path& path) noexcept {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    FAIL_IF(fd < 0) << "Failed to open lock file " << path << ": " << ERR;

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
      int err = errno;
      ::close(fd);
      FAIL_IF(err != EWOULDBLOCK) << "Failed to lock " << path << ": " << strerror(err);

      LOG(lock) << "Lock " << path << " is held by another process";
      return std::nullopt;
    }

    LOG(lock) << "Acquired lock " << path;
    return LockToken(path, fd);
  }
}
