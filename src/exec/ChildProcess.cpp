#include "ChildProcess.hpp"

#include "Errors.hpp"
#include "ProcessHelper.hpp"

namespace rx {
ChildProcess::ChildProcess() : pid(-1), outputFd(-1), reaped(false) {}

ChildProcess::~ChildProcess() {
  if (pid > 0 && !reaped) {
    kill();
    wait();
  }
  if (outputFd >= 0) {
    ::close(outputFd);
  }
}

void ChildProcess::spawn(const string &shellCommand, const string &workingDir) {
  int outputPipe[2];
  int errorPipe[2];
  try {
    if (::pipe2(outputPipe, O_CLOEXEC) == -1) {
      throw std::runtime_error(string("Could not create pipe: ") +
                               strerror(GetErrno()));
    }
    ProcessHelper::createExecErrorPipe(errorPipe);
  } catch (const std::runtime_error &re) {
    throw SpawnFailedError(re.what());
  }

  pid_t child = fork();
  if (child == -1) {
    int err = GetErrno();
    ::close(outputPipe[0]);
    ::close(outputPipe[1]);
    ::close(errorPipe[0]);
    ::close(errorPipe[1]);
    throw SpawnFailedError(string("fork failed: ") + strerror(err));
  }

  if (child == 0) {
    // Own group so a timeout can take down everything the command started
    setpgid(0, 0);
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull == -1 || dup2(devNull, STDIN_FILENO) == -1 ||
        dup2(outputPipe[1], STDOUT_FILENO) == -1 ||
        dup2(outputPipe[1], STDERR_FILENO) == -1) {
      ProcessHelper::failExec(errorPipe[1], GetErrno());
    }
    if (chdir(workingDir.c_str()) == -1) {
      ProcessHelper::failExec(errorPipe[1], GetErrno());
    }
    ProcessHelper::execProgram("/bin/sh", {"-c", shellCommand}, {});
    ProcessHelper::failExec(errorPipe[1], GetErrno());
  }

  // Set the group from this side too so kill(-pid) works before the child
  // gets scheduled
  setpgid(child, child);
  ::close(outputPipe[1]);
  ::close(errorPipe[1]);
  pid = child;
  outputFd = outputPipe[0];

  int childErrno = ProcessHelper::readExecResult(errorPipe[0]);
  ::close(errorPipe[0]);
  if (childErrno != 0) {
    wait();
    throw SpawnFailedError("Could not start command in " + workingDir + ": " +
                           strerror(childErrno));
  }
  VLOG(1) << "Spawned pid " << pid << " for: " << shellCommand;
}

bool ChildProcess::tryWait(int *status) {
  if (reaped) {
    *status = 0;
    return true;
  }
  if (ProcessHelper::tryReap(pid, status)) {
    reaped = true;
    return true;
  }
  return false;
}

int ChildProcess::wait() {
  int status = 0;
  while (!reaped) {
    pid_t rc = ::waitpid(pid, &status, 0);
    if (rc == pid) {
      reaped = true;
    } else if (rc == -1 && GetErrno() != EINTR) {
      if (GetErrno() != ECHILD) {
        STERROR << "waitpid failed for " << pid << ": " << strerror(GetErrno());
      }
      status = 0;
      reaped = true;
    }
  }
  return status;
}

void ChildProcess::kill() {
  if (pid > 0 && !reaped) {
    ProcessHelper::killGroup(pid);
  }
}
}  // namespace rx
