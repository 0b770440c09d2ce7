#include "TerminalSession.hpp"

#include "Errors.hpp"
#include "FdUtils.hpp"
#include "LogHandler.hpp"

namespace rx {
TerminalSession::TerminalSession(const string &_id, int64_t _userId,
                                 const string &_username,
                                 shared_ptr<UserTerminal> _term,
                                 const TerminalConfig &config)
    : id(_id),
      name(displayName(_id)),
      userId(_userId),
      username(_username),
      createdAtMs(nowMillis()),
      lastActivityMs(createdAtMs),
      term(_term),
      masterFd(-1),
      buffer(config.bufferSize),
      subscriberCapacity(config.subscriberCapacity),
      closed(false) {}

TerminalSession::~TerminalSession() {
  close();
  if (readThread.joinable()) {
    readThread.join();
  }
}

string TerminalSession::displayName(const string &id) {
  if (id.length() <= 8) {
    return "Session " + id;
  }
  return "Session " + id.substr(id.length() - 8);
}

void TerminalSession::start() {
  masterFd = term->setup();
  FdUtils::setCloseOnExec(masterFd);
  FdUtils::setNonBlocking(masterFd);
  LOG(INFO) << "Terminal session " << id << " started for user " << userId
            << " (pid " << term->getPid() << ")";
  readThread = std::thread(&TerminalSession::readLoop, this);
}

void TerminalSession::write(const string &data) {
  lock_guard<std::mutex> guard(ioMutex);
  if (closed) {
    throw SessionClosedError(id);
  }
  FdUtils::writeAll(masterFd, data.data(), data.length(), &closed);
  lastActivityMs = nowMillis();
  VLOG(3) << "Wrote " << data.length() << " bytes to " << id;
}

void TerminalSession::resize(int cols, int rows) {
  if (cols <= 0 || rows <= 0 || cols > 0xFFFF || rows > 0xFFFF) {
    throw std::runtime_error("Invalid terminal size");
  }
  lock_guard<std::mutex> guard(ioMutex);
  if (closed) {
    throw SessionClosedError(id);
  }
  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(tmpwin));
  tmpwin.ws_col = (unsigned short)cols;
  tmpwin.ws_row = (unsigned short)rows;
  term->setInfo(tmpwin);
}

TerminalSubscription TerminalSession::subscribe(const string &clientId) {
  TerminalSubscription subscription;
  {
    lock_guard<std::mutex> guard(clientsMutex);
    if (closed) {
      throw SessionClosedError(id);
    }
    auto it = clients.find(clientId);
    if (it != clients.end()) {
      it->second->close();
      clients.erase(it);
    }
    subscription.channel.reset(new Channel(subscriberCapacity));
    subscription.replay = buffer.readAll();
    clients[clientId] = subscription.channel;
  }
  LOG(INFO) << "Client " << clientId << " attached to " << id;
  return subscription;
}

void TerminalSession::unsubscribe(const string &clientId,
                                  const shared_ptr<Channel> &channel) {
  if (!channel) {
    return;
  }
  {
    lock_guard<std::mutex> guard(clientsMutex);
    auto it = clients.find(clientId);
    // A reconnect under the same id owns the slot now
    if (it != clients.end() && it->second == channel) {
      clients.erase(it);
    }
  }
  channel->close();
  LOG(INFO) << "Client " << clientId << " detached from " << id << " ("
            << channel->dropped() << " chunks dropped)";
}

void TerminalSession::close() {
  if (closed.exchange(true)) {
    return;
  }
  LOG(INFO) << "Closing terminal session " << id;

  {
    lock_guard<std::mutex> guard(clientsMutex);
    for (auto &it : clients) {
      it.second->close();
      if (it.second->dropped()) {
        LOG(INFO) << "Client " << it.first << " of " << id << " dropped "
                  << it.second->dropped() << " chunks";
      }
    }
    clients.clear();
  }

  term->terminate();

  if (readThread.joinable() &&
      readThread.get_id() != std::this_thread::get_id()) {
    readThread.join();
  }

  lock_guard<std::mutex> guard(ioMutex);
  term->cleanup();
  masterFd = -1;
}

int TerminalSession::clientCount() const {
  lock_guard<std::mutex> guard(clientsMutex);
  return int(clients.size());
}

TerminalSessionInfo TerminalSession::info() const {
  TerminalSessionInfo tsi;
  tsi.set_id(id);
  tsi.set_name(name);
  tsi.set_user_id(userId);
  tsi.set_username(username);
  tsi.set_created_at_ms(createdAtMs);
  tsi.set_last_activity_ms(lastActivityMs.load());
  tsi.set_client_count(clientCount());
  tsi.set_is_active(!closed.load());
  return tsi;
}

void TerminalSession::broadcast(const string &chunk) {
  lock_guard<std::mutex> guard(clientsMutex);
  buffer.write(chunk);
  for (auto &it : clients) {
    if (!it.second->trySend(chunk)) {
      VLOG(2) << "Dropped chunk for client " << it.first << " of " << id;
    }
  }
}

void TerminalSession::readLoop() {
  LogHandler::setThreadName("term-" + id.substr(id.length() > 8
                                                    ? id.length() - 8
                                                    : 0));
  char b[READ_CHUNK_SIZE];
  int fd = masterFd;
  while (!closed) {
    try {
      if (!FdUtils::waitForData(fd, POLL_INTERVAL_MS)) {
        continue;
      }
    } catch (const std::runtime_error &re) {
      LOG(ERROR) << "Terminal " << id << " wait failed: " << re.what();
      break;
    }

    ssize_t rc = ::read(fd, b, sizeof(b));
    int readErrno = GetErrno();
    if (rc > 0) {
      VLOG(4) << "Read " << rc << " bytes from " << id;
      lastActivityMs = nowMillis();
      broadcast(string(b, rc));
      continue;
    }
    if (rc == 0) {
      LOG(INFO) << "Terminal " << id << " reached end of stream";
      break;
    }
    if (readErrno == EAGAIN || readErrno == EWOULDBLOCK ||
        readErrno == EINTR) {
      continue;
    }
    if (readErrno == EIO) {
      // Linux reports a hung up pty slave as EIO
      LOG(INFO) << "Terminal " << id << " shell exited";
    } else {
      LOG(ERROR) << "Terminal " << id << " read error: " << readErrno << " "
                 << strerror(readErrno);
    }
    break;
  }
  close();
}
}  // namespace rx
