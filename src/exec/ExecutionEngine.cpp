#include "ExecutionEngine.hpp"

#include "ChildProcess.hpp"
#include "Errors.hpp"
#include "FdUtils.hpp"
#include "LogHandler.hpp"
#include "ProcessHelper.hpp"

namespace rx {
namespace {
const int DEFAULT_PAGE_SIZE = 50;
const int SPAWN_FAILED_EXIT_CODE = -1;
// Output still read after the shell exited, in case a background job keeps
// writing into the pipe
const size_t MAX_DRAIN_BYTES = 1024 * 1024;
}  // namespace

ExecutionEngine::ExecutionEngine(const ExecutionConfig &_config,
                                 shared_ptr<CommandCatalog> _catalog,
                                 shared_ptr<ExecutionStore> _store)
    : config(_config),
      catalog(_catalog),
      store(_store),
      shuttingDown(false),
      workerPool(new ThreadPool(_config.maxConcurrent)) {}

ExecutionEngine::~ExecutionEngine() { shutdown(); }

int64_t ExecutionEngine::effectiveTimeoutSeconds(const Command &command) const {
  int64_t timeout = command.timeout_seconds();
  if (timeout <= 0) {
    timeout = config.defaultTimeoutSeconds;
  }
  return std::min(timeout, config.maxTimeoutSeconds);
}

Execution ExecutionEngine::createExecution(const string &commandId,
                                           int64_t userId) {
  Command command = catalog->getCommandById(commandId);

  Execution execution;
  execution.set_id(sole::uuid4().str());
  execution.set_command_id(command.id());
  execution.set_user_id(userId);
  execution.set_status(PENDING);
  execution.set_created_at_ms(nowMillis());

  {
    lock_guard<std::mutex> guard(engineMutex);
    live[execution.id()].reset(new OutputAccumulator(config.maxOutputSize));
  }
  store->insert(execution);
  LOG(INFO) << "Created execution " << execution.id() << " of "
            << command.id() << " for user " << userId;
  return execution;
}

shared_ptr<OutputAccumulator> ExecutionEngine::liveOutput(
    const string &executionId) {
  lock_guard<std::mutex> guard(engineMutex);
  auto it = live.find(executionId);
  if (it == live.end()) {
    return nullptr;
  }
  return it->second;
}

void ExecutionEngine::execute(const string &executionId) {
  optional<Execution> record = store->get(executionId);
  if (!record) {
    throw NotFoundError("execution", executionId);
  }
  Execution &execution = *record;
  if (execution.status() != PENDING) {
    LOG(WARNING) << "Refusing to run execution " << executionId
                 << " in status " << ExecutionStatus_Name(execution.status());
    return;
  }

  auto output = liveOutput(executionId);
  if (!output) {
    // Created outside this engine instance
    lock_guard<std::mutex> guard(engineMutex);
    output.reset(new OutputAccumulator(config.maxOutputSize));
    live[executionId] = output;
  }

  execution.set_status(RUNNING);
  execution.set_started_at_ms(nowMillis());
  store->update(execution);

  if (shuttingDown) {
    output->append("Server is shutting down\n");
    finishExecution(&execution, FAILED, SPAWN_FAILED_EXIT_CODE, output);
    return;
  }

  Command command;
  try {
    command = catalog->getCommandById(execution.command_id());
  } catch (const NotFoundError &nfe) {
    output->append(string(nfe.what()) + "\n");
    finishExecution(&execution, FAILED, SPAWN_FAILED_EXIT_CODE, output);
    return;
  }

  std::error_code ec;
  if (!fs::is_directory(command.working_dir(), ec)) {
    output->append("Working directory does not exist: " +
                   command.working_dir() + "\n");
    finishExecution(&execution, FAILED, SPAWN_FAILED_EXIT_CODE, output);
    return;
  }

  runCommand(&execution, command, output);
}

void ExecutionEngine::runCommand(Execution *execution, const Command &command,
                                 const shared_ptr<OutputAccumulator> &output) {
  const int64_t timeoutSeconds = effectiveTimeoutSeconds(command);
  LOG(INFO) << "Running execution " << execution->id() << " (" << command.id()
            << ", timeout " << timeoutSeconds << "s)";

  ChildProcess child;
  try {
    child.spawn(command.command(), command.working_dir());
  } catch (const SpawnFailedError &sfe) {
    LOG(ERROR) << "Execution " << execution->id() << ": " << sfe.what();
    output->append(string(sfe.what()) + "\n");
    finishExecution(execution, FAILED, SPAWN_FAILED_EXIT_CODE, output);
    return;
  }
  {
    lock_guard<std::mutex> guard(engineMutex);
    running[execution->id()] = child.getPid();
    if (shuttingDown) {
      child.kill();
    }
  }

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(timeoutSeconds);
  auto remainingMs = [&deadline]() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               deadline - std::chrono::steady_clock::now())
        .count();
  };

  bool timedOut = false;
  bool exited = false;
  int status = 0;
  char b[READ_CHUNK_SIZE];
  const int fd = child.getFd();
  while (true) {
    int64_t left = remainingMs();
    if (left <= 0) {
      timedOut = true;
      break;
    }
    if (child.tryWait(&status)) {
      // Background jobs may still hold the pipe; keep only what is queued
      exited = true;
      drainOutput(execution->id(), fd, output);
      break;
    }
    bool ready = false;
    try {
      ready = FdUtils::waitForData(
          fd, int(std::min<int64_t>(left, POLL_INTERVAL_MS)));
    } catch (const std::runtime_error &re) {
      LOG(ERROR) << "Execution " << execution->id() << ": " << re.what();
      break;
    }
    if (!ready) {
      continue;
    }
    ssize_t rc = ::read(fd, b, sizeof(b));
    if (rc > 0) {
      VLOG(4) << "Execution " << execution->id() << " read " << rc << " bytes";
      output->append(b, size_t(rc));
      continue;
    }
    if (rc == 0) {
      break;
    }
    int readErrno = GetErrno();
    if (readErrno == EINTR || readErrno == EAGAIN) {
      continue;
    }
    LOG(ERROR) << "Execution " << execution->id()
               << " output read error: " << strerror(readErrno);
    break;
  }

  // Output closed; the shell may still be exiting
  while (!timedOut && !exited && !child.tryWait(&status)) {
    if (remainingMs() <= 0) {
      timedOut = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  {
    lock_guard<std::mutex> guard(engineMutex);
    running.erase(execution->id());
  }

  if (timedOut) {
    LOG(INFO) << "Execution " << execution->id() << " exceeded "
              << timeoutSeconds << "s, killing process group";
    child.kill();
    child.wait();
    finishExecution(execution, TIMEOUT, nullopt, output);
    return;
  }

  if (WIFEXITED(status)) {
    int exitCode = WEXITSTATUS(status);
    finishExecution(execution, exitCode == 0 ? SUCCESS : FAILED, exitCode,
                    output);
  } else if (WIFSIGNALED(status)) {
    finishExecution(execution, FAILED, 128 + WTERMSIG(status), output);
  } else {
    finishExecution(execution, FAILED, SPAWN_FAILED_EXIT_CODE, output);
  }
}

void ExecutionEngine::drainOutput(const string &executionId, int fd,
                                  const shared_ptr<OutputAccumulator> &output) {
  char b[READ_CHUNK_SIZE];
  size_t drained = 0;
  while (drained < MAX_DRAIN_BYTES) {
    bool ready = false;
    try {
      ready = FdUtils::waitForData(fd, 0);
    } catch (const std::runtime_error &re) {
      LOG(ERROR) << "Execution " << executionId << ": " << re.what();
      return;
    }
    if (!ready) {
      return;
    }
    ssize_t rc = ::read(fd, b, sizeof(b));
    if (rc == 0) {
      return;
    }
    if (rc < 0) {
      if (GetErrno() == EINTR) {
        continue;
      }
      LOG(ERROR) << "Execution " << executionId
                 << " output read error: " << strerror(GetErrno());
      return;
    }
    output->append(b, size_t(rc));
    drained += size_t(rc);
  }
}

void ExecutionEngine::finishExecution(
    Execution *execution, ExecutionStatus status, optional<int> exitCode,
    const shared_ptr<OutputAccumulator> &output) {
  execution->set_status(status);
  if (exitCode) {
    execution->set_exit_code(*exitCode);
  } else {
    execution->clear_exit_code();
  }
  execution->set_output(output->output());
  execution->set_output_truncated(output->isTruncated());
  execution->set_finished_at_ms(nowMillis());
  store->update(*execution);

  output->finish();
  {
    lock_guard<std::mutex> guard(engineMutex);
    live.erase(execution->id());
  }

  LOG(INFO) << "Execution " << execution->id() << " finished: "
            << ExecutionStatus_Name(status) << " exit "
            << (exitCode ? to_string(*exitCode) : string("none")) << ", "
            << execution->output().length() << " bytes"
            << (execution->output_truncated() ? " (truncated)" : "");
}

void ExecutionEngine::executeSafely(const string &executionId) {
  LogHandler::setThreadName("exec-" + executionId.substr(0, 8));
  try {
    execute(executionId);
  } catch (const std::exception &ex) {
    STERROR << "Execution " << executionId << " aborted: " << ex.what();
  }
}

void ExecutionEngine::executeAsync(const string &executionId) {
  {
    lock_guard<std::mutex> guard(poolMutex);
    if (workerPool) {
      workerPool->enqueue(
          [this, executionId]() { this->executeSafely(executionId); });
      return;
    }
  }
  // Shutting down: execute() fails a pending record without spawning, so it
  // does not stay pending forever
  execute(executionId);
  throw std::runtime_error("Execution engine is shut down");
}

OutputAttachment ExecutionEngine::attach(const string &executionId) {
  auto output = liveOutput(executionId);
  if (output) {
    OutputAttachment attachment = output->attach();
    if (!attachment.finished) {
      return attachment;
    }
  }
  // Already finished; the stored record holds the complete output
  Execution execution = getExecutionById(executionId);
  OutputAttachment attachment;
  attachment.replay = execution.output();
  attachment.finished = true;
  return attachment;
}

void ExecutionEngine::detach(const string &executionId,
                             const shared_ptr<Channel> &channel) {
  auto output = liveOutput(executionId);
  if (output) {
    output->detach(channel);
  } else if (channel) {
    channel->close();
  }
}

Execution ExecutionEngine::getExecutionById(const string &executionId) {
  optional<Execution> execution = store->get(executionId);
  if (!execution) {
    throw NotFoundError("execution", executionId);
  }
  return *execution;
}

vector<ExecutionSummary> ExecutionEngine::getExecutions(int limit,
                                                        int offset) {
  if (limit <= 0) {
    limit = DEFAULT_PAGE_SIZE;
  }
  if (offset < 0) {
    offset = 0;
  }
  vector<ExecutionSummary> summaries;
  for (const auto &execution : store->list(limit, offset)) {
    ExecutionSummary summary;
    *summary.mutable_execution() = execution;
    try {
      summary.set_command_name(
          catalog->getCommandById(execution.command_id()).name());
    } catch (const NotFoundError &) {
      summary.set_command_name(execution.command_id());
    }
    summaries.push_back(summary);
  }
  return summaries;
}

void ExecutionEngine::shutdown() {
  if (shuttingDown.exchange(true)) {
    return;
  }
  {
    lock_guard<std::mutex> guard(engineMutex);
    for (const auto &it : running) {
      LOG(INFO) << "Killing execution " << it.first << " for shutdown";
      ProcessHelper::killGroup(it.second);
    }
  }
  std::unique_ptr<ThreadPool> pool;
  {
    lock_guard<std::mutex> guard(poolMutex);
    pool.swap(workerPool);
  }
  // Joins the workers once queued runs have failed fast
  pool.reset();
}
}  // namespace rx
