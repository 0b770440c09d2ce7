#ifndef __RX_TERMINAL_SESSION__
#define __RX_TERMINAL_SESSION__

#include "Channel.hpp"
#include "Headers.hpp"
#include "RingBuffer.hpp"
#include "ServerConfig.hpp"
#include "UserTerminal.hpp"

namespace rx {
/**
 * @brief Replay snapshot plus live feed handed to a newly attached viewer.
 */
struct TerminalSubscription {
  shared_ptr<Channel> channel;
  string replay;
};

/**
 * @brief One long-lived shell behind a pty, shared by any number of viewers.
 *
 * A dedicated thread reads the pty, appends every chunk to the replay buffer
 * and offers it to each subscriber without blocking. Viewers that fall
 * behind lose live chunks but can reattach and replay recent history.
 */
class TerminalSession {
 public:
  TerminalSession(const string &_id, int64_t _userId, const string &_username,
                  shared_ptr<UserTerminal> _term, const TerminalConfig &config);

  ~TerminalSession();

  /**
   * @brief Spawns the shell and starts the read thread.
   * @throws SpawnFailedError if the shell could not be started.
   */
  void start();

  /**
   * @brief Sends keystrokes to the shell.
   * @throws SessionClosedError after close().
   */
  void write(const string &data);

  /** @throws SessionClosedError after close(). */
  void resize(int cols, int rows);

  /**
   * @brief Attaches a viewer. Re-subscribing an id replaces its channel.
   * @throws SessionClosedError after close().
   */
  TerminalSubscription subscribe(const string &clientId);

  /**
   * @brief Detaches the viewer holding @p channel. The slot is left alone
   * when @p clientId was re-subscribed with a newer channel.
   */
  void unsubscribe(const string &clientId, const shared_ptr<Channel> &channel);

  /** @brief Tears the session down once; later calls return immediately. */
  void close();

  bool isClosed() const { return closed.load(); }

  int clientCount() const;

  TerminalSessionInfo info() const;

  const string &getId() const { return id; }
  int64_t getUserId() const { return userId; }
  int64_t getLastActivityMs() const { return lastActivityMs.load(); }

  /** @brief `Session ` plus the last 8 characters of @p id. */
  static string displayName(const string &id);

 protected:
  void readLoop();

  void broadcast(const string &chunk);

  string id;
  string name;
  int64_t userId;
  string username;
  int64_t createdAtMs;
  std::atomic<int64_t> lastActivityMs;

  shared_ptr<UserTerminal> term;
  int masterFd;
  RingBuffer buffer;
  size_t subscriberCapacity;

  // Serializes writes and resizes against teardown of the pty
  std::mutex ioMutex;
  std::atomic<bool> closed;

  // Guards clients; broadcast appends to the buffer under it as well
  mutable std::mutex clientsMutex;
  map<string, shared_ptr<Channel>> clients;

  std::thread readThread;
};
}  // namespace rx

#endif  // __RX_TERMINAL_SESSION__
