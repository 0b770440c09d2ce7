#ifndef __RX_HTTP_SERVER__
#define __RX_HTTP_SERVER__

#include "CommandCatalog.hpp"
#include "EventStream.hpp"
#include "ExecutionEngine.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "ServerConfig.hpp"
#include "TerminalSessionManager.hpp"

namespace rx {
/**
 * @brief Request-level failure carrying its HTTP status.
 */
class HttpError : public std::runtime_error {
 public:
  HttpError(int _status, const string &what)
      : std::runtime_error(what), status(_status) {}

  int getStatus() const { return status; }

 protected:
  int status;
};

/**
 * @brief Identity asserted by the fronting proxy.
 */
struct RequestUser {
  int64_t id = 0;
  string name;
};

/**
 * @brief REST and event-stream front end for the execution engine and the
 * terminal sessions.
 */
class HttpServer {
 public:
  /** @brief Interval between keepalive comments on an idle stream. */
  static constexpr int KEEPALIVE_SECONDS = 15;

  HttpServer(const NetworkConfig &_config, bool _terminalEnabled,
             shared_ptr<ExecutionEngine> _engine,
             shared_ptr<TerminalSessionManager> _terminals,
             shared_ptr<CommandCatalog> _catalog);

  /**
   * @brief Binds the listening socket. A port of 0 picks a free one.
   * @return The bound port.
   * @throws std::runtime_error if the address cannot be bound.
   */
  int bind();

  /** @brief Serves requests until stop() is called. */
  void listen();

  void stop();

  bool isRunning();

  int getPort() const { return port; }

  const string &getPathPrefix() const { return config.pathPrefix; }

 protected:
  typedef std::function<void(const httplib::Request &, httplib::Response &)>
      Handler;

  void registerRoutes();

  /** @brief Maps exceptions thrown by @p handler to JSON error replies. */
  Handler guarded(Handler handler);

  string route(const string &pattern) const;

  bool authorized(const httplib::Request &req) const;

  RequestUser requestUser(const httplib::Request &req) const;

  void requireTerminalEnabled() const;

  shared_ptr<TerminalSession> ownedSession(const httplib::Request &req,
                                           const string &id);

  json startExecution(const string &commandId, int64_t userId);

  void streamEvents(httplib::Response &res, shared_ptr<EventStream> stream);

  static void sendJson(httplib::Response &res, const json &body,
                       int status = 200);

  static int queryInt(const httplib::Request &req, const string &key,
                      int defaultValue);

  NetworkConfig config;
  bool terminalEnabled;
  shared_ptr<ExecutionEngine> engine;
  shared_ptr<TerminalSessionManager> terminals;
  shared_ptr<CommandCatalog> catalog;
  std::unique_ptr<httplib::Server> server;
  int port;
};
}  // namespace rx

#endif  // __RX_HTTP_SERVER__
