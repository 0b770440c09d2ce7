#ifndef __RX_FD_UTILS__
#define __RX_FD_UTILS__

#include "Headers.hpp"

namespace rx {
/**
 * @brief Blocking helpers for pty masters and pipes.
 */
class FdUtils {
 public:
  /**
   * @brief Writes the whole buffer, retrying on EAGAIN and EINTR.
   *
   * On a non-blocking descriptor the retry loop gives up as soon as
   * @p cancelled becomes true.
   * @throws std::runtime_error if the descriptor is closed, broken or the
   * write was cancelled.
   */
  static void writeAll(int fd, const char *buf, size_t count,
                       const std::atomic<bool> *cancelled = NULL);

  static void setNonBlocking(int fd);

  /**
   * @brief Waits up to @p timeoutMs for @p fd to become readable.
   * @return true when data (or EOF) is ready.
   * @throws std::runtime_error if polling fails or @p fd is not open.
   */
  static bool waitForData(int fd, int timeoutMs);

  static void setCloseOnExec(int fd);
};
}  // namespace rx
#endif  // __RX_FD_UTILS__
