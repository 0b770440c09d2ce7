#include "ProcessHelper.hpp"

namespace rx {
void ProcessHelper::execProgram(const string &program,
                                const vector<string> &args,
                                const vector<string> &extraEnv) {
  for (const auto &kv : extraEnv) {
    auto eq = kv.find('=');
    if (eq == string::npos) {
      continue;
    }
    setenv(kv.substr(0, eq).c_str(), kv.substr(eq + 1).c_str(), 1);
  }

  vector<char *> argv;
  argv.push_back(const_cast<char *>(program.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(NULL);

  // The server ignores SIGPIPE; children get the default dispositions back
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  signal(SIGINT, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  signal(SIGHUP, SIG_DFL);
  sigset_t noSignals;
  sigemptyset(&noSignals);
  sigprocmask(SIG_SETMASK, &noSignals, NULL);

  execvp(program.c_str(), argv.data());
}

void ProcessHelper::createExecErrorPipe(int fds[2]) {
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    throw std::runtime_error(string("Could not create pipe: ") +
                             strerror(GetErrno()));
  }
}

void ProcessHelper::failExec(int errorFd, int err) {
  ssize_t ignored = ::write(errorFd, &err, sizeof(err));
  (void)ignored;
  _exit(127);
}

int ProcessHelper::readExecResult(int errorFd) {
  int childErrno = 0;
  while (true) {
    ssize_t rc = ::read(errorFd, &childErrno, sizeof(childErrno));
    if (rc < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (rc == ssize_t(sizeof(childErrno))) {
      return childErrno;
    }
    // EOF means exec closed the pipe
    return 0;
  }
}

bool ProcessHelper::tryReap(pid_t pid, int *status) {
  while (true) {
    pid_t rc = ::waitpid(pid, status, WNOHANG);
    if (rc == pid) {
      return true;
    }
    if (rc == 0) {
      return false;
    }
    if (GetErrno() == EINTR) {
      continue;
    }
    if (GetErrno() == ECHILD) {
      // Already reaped elsewhere
      *status = 0;
      return true;
    }
    STERROR << "waitpid failed for " << pid << ": " << strerror(GetErrno());
    *status = 0;
    return true;
  }
}

void ProcessHelper::terminateGroup(pid_t pid, std::chrono::milliseconds grace) {
  if (pid <= 0) {
    return;
  }
  int status;
  if (tryReap(pid, &status)) {
    return;
  }
  ::kill(-pid, SIGHUP);
  ::kill(-pid, SIGTERM);
  ::kill(pid, SIGTERM);

  auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (tryReap(pid, &status)) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  LOG(WARNING) << "Process " << pid << " ignored SIGTERM, sending SIGKILL";
  killGroup(pid);
  while (::waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      break;
    }
  }
}

void ProcessHelper::killGroup(pid_t pid) {
  if (::kill(-pid, SIGKILL) == -1 && GetErrno() != ESRCH) {
    LOG(WARNING) << "Could not kill process group " << pid << ": "
                 << strerror(GetErrno());
  }
  ::kill(pid, SIGKILL);
}
}  // namespace rx
