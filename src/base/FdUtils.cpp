#include "FdUtils.hpp"

namespace rx {
void FdUtils::writeAll(int fd, const char *buf, size_t count,
                       const std::atomic<bool> *cancelled) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }

  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        if (cancelled != NULL && cancelled->load()) {
          throw std::runtime_error("Write cancelled");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(ERROR) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write: descriptor closed");
    }
    bytesWritten += rc;
  }
}

bool FdUtils::waitForData(int fd, int timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, timeoutMs);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    throw std::runtime_error(string("poll failed: ") + strerror(GetErrno()));
  }
  if (rc > 0 && (pfd.revents & POLLNVAL)) {
    throw std::runtime_error("poll failed: descriptor is not open");
  }
  // A hung up or failed descriptor reads as EOF or an error
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR));
}

void FdUtils::setNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  FATAL_FAIL(flags);
  FATAL_FAIL(::fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void FdUtils::setCloseOnExec(int fd) {
  int flags = ::fcntl(fd, F_GETFD);
  FATAL_FAIL(flags);
  FATAL_FAIL(::fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}
}  // namespace rx
