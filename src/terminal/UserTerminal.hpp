#ifndef __RX_USER_TERMINAL__
#define __RX_USER_TERMINAL__

#include "Headers.hpp"

namespace rx {
/**
 * @brief A shell process reachable through a single read/write descriptor.
 */
class UserTerminal {
 public:
  virtual ~UserTerminal() {}

  /**
   * @brief Starts the shell.
   * @returns Descriptor carrying the shell's input and output.
   * @throws SpawnFailedError if the shell could not be started.
   */
  virtual int setup() = 0;
  virtual pid_t getPid() = 0;
  /** @brief Applies a new window geometry. */
  virtual void setInfo(const winsize &tmpwin) = 0;
  /** @brief Stops the shell and reaps it. Safe to call more than once. */
  virtual void terminate() = 0;
  /** @brief Closes the descriptor. Safe to call more than once. */
  virtual void cleanup() = 0;
};
}  // namespace rx

#endif  // __RX_USER_TERMINAL__
