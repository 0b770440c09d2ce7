#ifndef __RX_EXECUTION_ENGINE__
#define __RX_EXECUTION_ENGINE__

#include "CommandCatalog.hpp"
#include "ExecutionStore.hpp"
#include "Headers.hpp"
#include "OutputAccumulator.hpp"
#include "ServerConfig.hpp"

namespace rx {
/**
 * @brief Runs catalog commands once each, under a deadline, and lets
 * viewers follow their output.
 *
 * Status only ever moves pending -> running -> success|failed|timeout. The
 * thread running execute() is the only writer of a record after creation.
 */
class ExecutionEngine {
 public:
  ExecutionEngine(const ExecutionConfig &_config,
                  shared_ptr<CommandCatalog> _catalog,
                  shared_ptr<ExecutionStore> _store);

  ~ExecutionEngine();

  /**
   * @brief Records a pending run of @p commandId. Nothing is started.
   * @throws NotFoundError if the command is unknown.
   */
  Execution createExecution(const string &commandId, int64_t userId);

  /**
   * @brief Runs a pending execution to completion on the calling thread.
   *
   * Records that are not pending are left untouched.
   * @throws NotFoundError if the execution is unknown.
   */
  void execute(const string &executionId);

  /**
   * @brief Queues execute() on the worker pool.
   * @throws std::runtime_error after shutdown(); a pending record is marked
   * failed first.
   */
  void executeAsync(const string &executionId);

  /**
   * @brief Output so far plus a live feed until the run finishes.
   * @throws NotFoundError
   */
  OutputAttachment attach(const string &executionId);

  void detach(const string &executionId, const shared_ptr<Channel> &channel);

  /** @throws NotFoundError */
  Execution getExecutionById(const string &executionId);

  /** @brief Newest first; a @p limit of 0 means 50. */
  vector<ExecutionSummary> getExecutions(int limit, int offset);

  /**
   * @brief Kills running commands, fails queued ones and waits for the
   * workers. Idempotent.
   */
  void shutdown();

  /** @brief Command timeout, or the default, capped at the maximum. */
  int64_t effectiveTimeoutSeconds(const Command &command) const;

 protected:
  void executeSafely(const string &executionId);

  void runCommand(Execution *execution, const Command &command,
                  const shared_ptr<OutputAccumulator> &output);

  /** @brief Reads whatever is already queued on @p fd without blocking. */
  void drainOutput(const string &executionId, int fd,
                   const shared_ptr<OutputAccumulator> &output);

  /**
   * @brief Single terminal write: stores the record, then releases viewers.
   */
  void finishExecution(Execution *execution, ExecutionStatus status,
                       optional<int> exitCode,
                       const shared_ptr<OutputAccumulator> &output);

  shared_ptr<OutputAccumulator> liveOutput(const string &executionId);

  ExecutionConfig config;
  shared_ptr<CommandCatalog> catalog;
  shared_ptr<ExecutionStore> store;

  std::mutex engineMutex;
  unordered_map<string, shared_ptr<OutputAccumulator>> live;
  // Process group leaders of commands currently running
  unordered_map<string, pid_t> running;
  std::atomic<bool> shuttingDown;

  std::mutex poolMutex;
  std::unique_ptr<ThreadPool> workerPool;
};
}  // namespace rx

#endif  // __RX_EXECUTION_ENGINE__
