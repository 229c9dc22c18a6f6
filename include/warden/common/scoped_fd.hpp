#pragma once

#include <unistd.h>

#include <utility>

namespace warden::common {

/// Owns a file descriptor and closes it on destruction.
class scoped_fd final {
 public:
  scoped_fd() = default;
  explicit scoped_fd(const int fd) : fd_{fd} {}
  ~scoped_fd() { reset(); }

  scoped_fd(scoped_fd&& other) noexcept : fd_{other.release()} {}
  scoped_fd& operator=(scoped_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  scoped_fd(const scoped_fd&) = delete;
  scoped_fd& operator=(const scoped_fd&) = delete;

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }

  int release() { return std::exchange(fd_, -1); }

  void reset(const int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_{-1};
};

}  // namespace warden::common
