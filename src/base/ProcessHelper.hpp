#ifndef __RX_PROCESS_HELPER__
#define __RX_PROCESS_HELPER__

#include "Headers.hpp"

namespace rx {
/**
 * @brief Helpers shared by the pty and one-shot command spawners.
 */
class ProcessHelper {
 public:
  /**
   * @brief Replaces the current (child) process image.
   *
   * Only returns if exec failed, with errno describing why. Must only be
   * called between fork and exec.
   */
  static void execProgram(const string &program, const vector<string> &args,
                          const vector<string> &extraEnv);

  /**
   * @brief Creates a close-on-exec pipe used to report exec failures.
   *
   * The child writes its errno to fds[1] when exec fails; a parent reading
   * EOF from fds[0] knows the exec succeeded.
   */
  static void createExecErrorPipe(int fds[2]);

  /** @brief Child side: reports @p err on the error pipe and exits. */
  [[noreturn]] static void failExec(int errorFd, int err);

  /**
   * @brief Parent side: waits for the child's exec result.
   * @return 0 on a successful exec, otherwise the child's errno.
   */
  static int readExecResult(int errorFd);

  /**
   * @brief Non-blocking reap.
   * @return true if @p pid has exited (or was already reaped).
   */
  static bool tryReap(pid_t pid, int *status);

  /**
   * @brief Signal-then-reap teardown of a process group.
   *
   * Sends SIGHUP and SIGTERM to the group led by @p pid, waits up to
   * @p grace for it to exit, then sends SIGKILL and reaps it.
   */
  static void terminateGroup(pid_t pid, std::chrono::milliseconds grace);

  /** @brief SIGKILL to the whole group led by @p pid. */
  static void killGroup(pid_t pid);
};
}  // namespace rx

#endif  // __RX_PROCESS_HELPER__
