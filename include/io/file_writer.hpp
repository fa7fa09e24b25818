#pragma once

#include <cerrno>
#include <cstddef>
#include <string_view>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace io {

namespace detail {

// Transient conditions are retried; anything else (closed pipe, full disk)
// ends the write.
inline bool ShouldRetry(int err) {
  if (err == EAGAIN || err == EWOULDBLOCK) {
    std::this_thread::yield();
    return true;
  }
  return err == EINTR;
}

} // namespace detail

// Blocking full write of `data`; false when the fd refused it.
inline bool WriteAll(int fd, std::string_view data) {
  while (!data.empty()) {
    ssize_t n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (detail::ShouldRetry(errno)) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return true;
}

// Gathered variant: `iov` is consumed in place as partial writes advance.
inline bool WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (detail::ShouldRetry(errno)) {
        continue;
      }
      return false;
    }
    auto consumed = static_cast<std::size_t>(n);
    for (; cnt > 0 && consumed >= iov->iov_len; ++iov, --cnt) {
      consumed -= iov->iov_len;
    }
    if (cnt > 0 && consumed > 0) {
      iov->iov_base = static_cast<char *>(iov->iov_base) + consumed;
      iov->iov_len -= consumed;
    }
  }
  return true;
}

} // namespace io
