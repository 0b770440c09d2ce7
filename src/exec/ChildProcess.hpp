#ifndef __RX_CHILD_PROCESS__
#define __RX_CHILD_PROCESS__

#include "Headers.hpp"

namespace rx {
/**
 * @brief A `/bin/sh -c` child in its own process group, with stdout and
 * stderr merged into one pipe.
 */
class ChildProcess {
 public:
  ChildProcess();

  /** @brief Kills and reaps a child that is still running. */
  ~ChildProcess();

  /**
   * @brief Forks and execs @p shellCommand inside @p workingDir.
   * @throws SpawnFailedError if the fork, chdir or exec fails.
   */
  void spawn(const string &shellCommand, const string &workingDir);

  /** @brief Read end of the merged output pipe. */
  int getFd() const { return outputFd; }

  pid_t getPid() const { return pid; }

  /** @brief Non-blocking wait; fills @p status once the child exited. */
  bool tryWait(int *status);

  /** @brief Blocks until the child exited. */
  int wait();

  /** @brief SIGKILL to the child's whole process group. */
  void kill();

 protected:
  pid_t pid;
  int outputFd;
  bool reaped;
};
}  // namespace rx

#endif  // __RX_CHILD_PROCESS__
