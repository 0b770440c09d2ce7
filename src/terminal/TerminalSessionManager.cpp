#include "TerminalSessionManager.hpp"

#include "Errors.hpp"
#include "LogHandler.hpp"
#include "PseudoUserTerminal.hpp"

namespace rx {
TerminalSessionManager::TerminalSessionManager(
    const TerminalConfig &_config, TerminalFactory _terminalFactory)
    : config(_config), terminalFactory(_terminalFactory), stopping(false) {
  if (!terminalFactory) {
    terminalFactory = [](const ShellSpec &spec) -> shared_ptr<UserTerminal> {
      return shared_ptr<UserTerminal>(new PseudoUserTerminal(spec));
    };
  }
}

TerminalSessionManager::~TerminalSessionManager() { shutdown(); }

ShellSpec TerminalSessionManager::shellSpec() const {
  ShellSpec spec;
  spec.set_program(config.shell);
  for (const auto &arg : config.args) {
    spec.add_args(arg);
  }
  for (const auto &kv : config.env) {
    spec.add_env(kv);
  }
  return spec;
}

string TerminalSessionManager::newSessionId(int64_t userId) {
  while (true) {
    string id = "term-" + to_string(userId) + "-" + genRandomAlphaNum(16);
    if (sessions.find(id) == sessions.end()) {
      return id;
    }
  }
}

void TerminalSessionManager::deregisterLocked(const string &id) {
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return;
  }
  int64_t userId = it->second->getUserId();
  sessions.erase(it);
  auto userIt = userSessions.find(userId);
  if (userIt != userSessions.end()) {
    auto &ids = userIt->second;
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    if (ids.empty()) {
      userSessions.erase(userIt);
    }
  }
}

shared_ptr<TerminalSession> TerminalSessionManager::createSession(
    int64_t userId, const string &username) {
  vector<shared_ptr<TerminalSession>> dead;
  shared_ptr<TerminalSession> session;
  {
    std::unique_lock<std::shared_mutex> lock(registryMutex);
    if (stopping) {
      throw std::runtime_error("Terminal manager is shutting down");
    }

    // A shell that exited on its own must not count against the quota
    auto userIt = userSessions.find(userId);
    if (userIt != userSessions.end()) {
      vector<string> ids = userIt->second;
      for (const auto &id : ids) {
        auto s = sessions.at(id);
        if (s->isClosed()) {
          dead.push_back(s);
          deregisterLocked(id);
        }
      }
    }

    int live = 0;
    userIt = userSessions.find(userId);
    if (userIt != userSessions.end()) {
      live = int(userIt->second.size());
    }
    if (live >= config.maxSessionsPerUser) {
      LOG(WARNING) << "User " << userId << " hit the session limit of "
                   << config.maxSessionsPerUser;
      throw QuotaExceededError("Maximum number of terminal sessions (" +
                               to_string(config.maxSessionsPerUser) +
                               ") reached");
    }

    string id = newSessionId(userId);
    session.reset(new TerminalSession(id, userId, username,
                                      terminalFactory(shellSpec()), config));
    session->start();

    sessions[id] = session;
    userSessions[userId].push_back(id);
  }
  for (auto &s : dead) {
    LOG(INFO) << "Pruned exited session " << s->getId();
  }
  LOG(INFO) << "Created terminal session " << session->getId() << " for "
            << username << " (" << userId << ")";
  return session;
}

shared_ptr<TerminalSession> TerminalSessionManager::getSession(
    const string &id) {
  std::shared_lock<std::shared_mutex> lock(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    throw NotFoundError("session", id);
  }
  return it->second;
}

vector<shared_ptr<TerminalSession>> TerminalSessionManager::getUserSessions(
    int64_t userId) {
  std::shared_lock<std::shared_mutex> lock(registryMutex);
  vector<shared_ptr<TerminalSession>> result;
  auto userIt = userSessions.find(userId);
  if (userIt == userSessions.end()) {
    return result;
  }
  for (const auto &id : userIt->second) {
    auto it = sessions.find(id);
    if (it != sessions.end()) {
      result.push_back(it->second);
    }
  }
  return result;
}

void TerminalSessionManager::closeSession(const string &id) {
  shared_ptr<TerminalSession> session;
  {
    std::unique_lock<std::shared_mutex> lock(registryMutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
      throw NotFoundError("session", id);
    }
    session = it->second;
    deregisterLocked(id);
  }
  session->close();
}

int TerminalSessionManager::sweepIdleSessions(int64_t nowMs) {
  const int64_t ttlMs = config.sessionTtlSeconds * 1000;
  vector<shared_ptr<TerminalSession>> expired;
  {
    std::unique_lock<std::shared_mutex> lock(registryMutex);
    vector<string> ids;
    for (const auto &it : sessions) {
      const auto &session = it.second;
      if (session->isClosed() ||
          nowMs - session->getLastActivityMs() > ttlMs) {
        ids.push_back(it.first);
        expired.push_back(session);
      }
    }
    for (const auto &id : ids) {
      deregisterLocked(id);
    }
  }
  for (auto &session : expired) {
    if (session->isClosed()) {
      LOG(INFO) << "Removed exited session " << session->getId();
    } else {
      LOG(INFO) << "Closing idle session " << session->getId();
      session->close();
    }
  }
  return int(expired.size());
}

void TerminalSessionManager::startSweeper() {
  lock_guard<std::mutex> guard(sweeperMutex);
  if (sweeperThread.joinable() || stopping) {
    return;
  }
  sweeperThread = std::thread(&TerminalSessionManager::sweepLoop, this);
}

void TerminalSessionManager::sweepLoop() {
  LogHandler::setThreadName("session-sweeper");
  const auto interval = std::chrono::seconds(config.sweepIntervalSeconds);
  std::unique_lock<std::mutex> lock(sweeperMutex);
  while (!stopping) {
    if (sweeperCv.wait_for(lock, interval,
                           [this] { return stopping.load(); })) {
      break;
    }
    lock.unlock();
    int swept = sweepIdleSessions(nowMillis());
    if (swept) {
      LOG(INFO) << "Sweep removed " << swept << " sessions";
    }
    lock.lock();
  }
}

void TerminalSessionManager::shutdown() {
  {
    lock_guard<std::mutex> guard(sweeperMutex);
    stopping = true;
    sweeperCv.notify_all();
  }
  if (sweeperThread.joinable()) {
    sweeperThread.join();
  }

  unordered_map<string, shared_ptr<TerminalSession>> toClose;
  {
    std::unique_lock<std::shared_mutex> lock(registryMutex);
    toClose.swap(sessions);
    userSessions.clear();
  }
  if (!toClose.empty()) {
    LOG(INFO) << "Closing " << toClose.size() << " terminal sessions";
  }
  for (auto &it : toClose) {
    it.second->close();
  }
}

int TerminalSessionManager::sessionCount() {
  std::shared_lock<std::shared_mutex> lock(registryMutex);
  return int(sessions.size());
}

int TerminalSessionManager::userSessionCount(int64_t userId) {
  std::shared_lock<std::shared_mutex> lock(registryMutex);
  auto it = userSessions.find(userId);
  return it == userSessions.end() ? 0 : int(it->second.size());
}
}  // namespace rx
