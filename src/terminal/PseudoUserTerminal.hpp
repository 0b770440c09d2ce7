#ifndef __RX_PSEUDO_USER_TERMINAL__
#define __RX_PSEUDO_USER_TERMINAL__

#include "Errors.hpp"
#include "ProcessHelper.hpp"
#include "UserTerminal.hpp"

namespace rx {
/**
 * @brief Runs a shell under forkpty and exposes the pty master.
 */
class PseudoUserTerminal : public UserTerminal {
 public:
  explicit PseudoUserTerminal(const ShellSpec &_spec)
      : spec(_spec), pid(-1), masterFd(-1) {}

  virtual ~PseudoUserTerminal() {
    terminate();
    cleanup();
  }

  virtual int setup() {
    int errorPipe[2];
    try {
      ProcessHelper::createExecErrorPipe(errorPipe);
    } catch (const std::runtime_error &re) {
      throw SpawnFailedError(re.what());
    }

    winsize initialSize;
    memset(&initialSize, 0, sizeof(initialSize));
    initialSize.ws_col = 80;
    initialSize.ws_row = 24;

    int fd = -1;
    pid_t child = forkpty(&fd, NULL, NULL, &initialSize);
    if (child == -1) {
      int err = GetErrno();
      ::close(errorPipe[0]);
      ::close(errorPipe[1]);
      throw SpawnFailedError(string("forkpty failed: ") + strerror(err));
    }
    if (child == 0) {
      ::close(errorPipe[0]);
      runTerminal();
      ProcessHelper::failExec(errorPipe[1], GetErrno());
    }

    ::close(errorPipe[1]);
    int childErrno = ProcessHelper::readExecResult(errorPipe[0]);
    ::close(errorPipe[0]);
    pid = child;
    masterFd = fd;
    if (childErrno != 0) {
      terminate();
      cleanup();
      throw SpawnFailedError("Could not start " + spec.program() + ": " +
                             strerror(childErrno));
    }
    VLOG(1) << "pty opened " << masterFd << " for pid " << pid;
    return masterFd;
  }

  /**
   * @brief Child side of forkpty: moves to $HOME and execs the shell.
   */
  void runTerminal() {
    passwd *pwd = getpwuid(getuid());
    if (pwd != NULL && pwd->pw_dir != NULL) {
      if (chdir(pwd->pw_dir) == -1) {
        // Stay in the server's working directory
      }
    }
    vector<string> env;
    env.push_back("TERM=xterm-256color");
    env.push_back(string("RX_VERSION=") + RX_VERSION);
    for (const auto &kv : spec.env()) {
      env.push_back(kv);
    }
    vector<string> args(spec.args().begin(), spec.args().end());
    ProcessHelper::execProgram(spec.program(), args, env);
  }

  virtual void setInfo(const winsize &tmpwin) {
    if (masterFd >= 0 && ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
      LOG(WARNING) << "TIOCSWINSZ failed: " << strerror(GetErrno());
    }
  }

  virtual void terminate() {
    pid_t toStop = pid;
    pid = -1;
    ProcessHelper::terminateGroup(toStop, std::chrono::milliseconds(2000));
  }

  virtual void cleanup() {
    if (masterFd >= 0) {
      ::close(masterFd);
      masterFd = -1;
    }
  }

  virtual pid_t getPid() { return pid; }

 protected:
  ShellSpec spec;
  pid_t pid;
  int masterFd;
};
}  // namespace rx

#endif  // __RX_PSEUDO_USER_TERMINAL__
