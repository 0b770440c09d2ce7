#ifndef __RX_TERMINAL_SESSION_MANAGER__
#define __RX_TERMINAL_SESSION_MANAGER__

#include "Headers.hpp"
#include "ServerConfig.hpp"
#include "TerminalSession.hpp"
#include "UserTerminal.hpp"

namespace rx {
/**
 * @brief Registry of live terminal sessions, indexed by id and by user.
 *
 * Both maps sit behind one reader/writer lock and change together. Each
 * session's own state stays behind the session's locks, so fan-out never
 * waits on registry operations.
 */
class TerminalSessionManager {
 public:
  typedef std::function<shared_ptr<UserTerminal>(const ShellSpec &)>
      TerminalFactory;

  /**
   * @param _terminalFactory Builds the pty wrapper for each new session;
   * defaults to PseudoUserTerminal.
   */
  explicit TerminalSessionManager(const TerminalConfig &_config,
                                  TerminalFactory _terminalFactory = nullptr);

  ~TerminalSessionManager();

  /**
   * @brief Spawns a shell for @p userId and registers it.
   * @throws QuotaExceededError when the user is at the session limit.
   * @throws SpawnFailedError when the shell could not start; nothing is
   * registered in that case.
   */
  shared_ptr<TerminalSession> createSession(int64_t userId,
                                            const string &username);

  /** @throws NotFoundError */
  shared_ptr<TerminalSession> getSession(const string &id);

  vector<shared_ptr<TerminalSession>> getUserSessions(int64_t userId);

  /** @throws NotFoundError */
  void closeSession(const string &id);

  /**
   * @brief Closes and deregisters sessions idle longer than the TTL as of
   * @p nowMs, plus any whose shell already exited.
   * @return Number of sessions removed.
   */
  int sweepIdleSessions(int64_t nowMs);

  /** @brief Starts the periodic sweep thread. */
  void startSweeper();

  /** @brief Stops the sweeper and closes every session. Idempotent. */
  void shutdown();

  int sessionCount();

  int userSessionCount(int64_t userId);

  ShellSpec shellSpec() const;

 protected:
  string newSessionId(int64_t userId);

  // Caller holds registryMutex exclusively
  void deregisterLocked(const string &id);

  void sweepLoop();

  TerminalConfig config;
  TerminalFactory terminalFactory;

  std::shared_mutex registryMutex;
  unordered_map<string, shared_ptr<TerminalSession>> sessions;
  unordered_map<int64_t, vector<string>> userSessions;

  std::mutex sweeperMutex;
  std::condition_variable sweeperCv;
  std::atomic<bool> stopping;
  std::thread sweeperThread;
};
}  // namespace rx

#endif  // __RX_TERMINAL_SESSION_MANAGER__
