#pragma once

#include "core/error.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <string>
#include <string_view>
#include <sys/uio.h>
#include <unistd.h>

namespace streaming {

class LineSink {
public:
  virtual ~LineSink() = default;
  // Appends `line` followed by a single '\n'.
  virtual core::Status Write(std::string_view line) = 0;
};

namespace detail {

inline core::Error ErrnoError(const std::string &what, int err) {
  return core::Error{core::ErrorKind::io, what + ": " + std::strerror(err)};
}

// Retries short writes and EINTR; any other failure is reported.
inline core::Status WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(ErrnoError("write", errno));
    }
    ssize_t consumed = n;
    while (consumed > 0 && cnt > 0) {
      if (consumed >= static_cast<ssize_t>(iov[0].iov_len)) {
        consumed -= static_cast<ssize_t>(iov[0].iov_len);
        ++iov;
        --cnt;
      } else {
        iov[0].iov_base = static_cast<char *>(iov[0].iov_base) + consumed;
        iov[0].iov_len -= static_cast<size_t>(consumed);
        consumed = 0;
      }
    }
  }
  return {};
}

} // namespace detail

// FdSink: one writev per line (payload + newline).
class FdSink : public LineSink {
public:
  FdSink(int fd, bool owned) : fd_(fd), owned_(owned) {}

  ~FdSink() override {
    if (owned_ && fd_ >= 0) {
      ::close(fd_);
    }
  }

  FdSink(const FdSink &) = delete;
  FdSink &operator=(const FdSink &) = delete;

  core::Status Write(std::string_view line) override {
    static char newline = '\n';
    struct iovec iov[2];
    iov[0].iov_base = const_cast<char *>(line.data());
    iov[0].iov_len = line.size();
    iov[1].iov_base = &newline;
    iov[1].iov_len = 1;
    return detail::WritevAll(fd_, iov, 2);
  }

private:
  int fd_;
  bool owned_;
};

// Empty path selects standard output; otherwise the file is created or
// truncated.
inline core::Result<std::unique_ptr<LineSink>> OpenSink(const std::string &path) {
  if (path.empty()) {
    return std::unique_ptr<LineSink>(
        std::make_unique<FdSink>(STDOUT_FILENO, false));
  }
  int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return std::unexpected(
        detail::ErrnoError("create output file " + path, errno));
  }
  return std::unique_ptr<LineSink>(std::make_unique<FdSink>(fd, true));
}

} // namespace streaming
