#include "HttpServer.hpp"

#include "Errors.hpp"
#include "JsonViews.hpp"

namespace rx {
namespace {
string escapeRegex(const string &s) {
  static const string special = R"(\^$.|?*+()[]{})";
  string out;
  for (char c : s) {
    if (special.find(c) != string::npos) {
      out += '\\';
    }
    out += c;
  }
  return out;
}
}  // namespace

HttpServer::HttpServer(const NetworkConfig &_config, bool _terminalEnabled,
                       shared_ptr<ExecutionEngine> _engine,
                       shared_ptr<TerminalSessionManager> _terminals,
                       shared_ptr<CommandCatalog> _catalog)
    : config(_config),
      terminalEnabled(_terminalEnabled),
      engine(_engine),
      terminals(_terminals),
      catalog(_catalog),
      port(0) {
  if (!config.tlsCert.empty()) {
    auto sslServer = new httplib::SSLServer(config.tlsCert.c_str(),
                                            config.tlsKey.c_str());
    server.reset(sslServer);
    if (!sslServer->is_valid()) {
      throw std::runtime_error("Could not load TLS certificate " +
                               config.tlsCert + " / " + config.tlsKey);
    }
  } else {
    server.reset(new httplib::Server());
  }

  const int threads = config.httpThreads;
  server->new_task_queue = [threads] {
    return new httplib::ThreadPool(threads);
  };
  registerRoutes();
}

int HttpServer::bind() {
  if (config.port == 0) {
    port = server->bind_to_any_port(config.bindIp.c_str());
    if (port < 0) {
      throw std::runtime_error("Could not bind to " + config.bindIp);
    }
  } else {
    if (!server->bind_to_port(config.bindIp.c_str(), config.port)) {
      throw std::runtime_error("Could not bind to " + config.bindIp + ":" +
                               to_string(config.port));
    }
    port = config.port;
  }
  LOG(INFO) << "Listening on " << config.bindIp << ":" << port
            << (config.tlsCert.empty() ? "" : " (tls)") << " under '"
            << config.pathPrefix << "'";
  return port;
}

void HttpServer::listen() {
  if (!server->listen_after_bind()) {
    LOG(WARNING) << "HTTP listener exited with an error";
  }
}

void HttpServer::stop() {
  LOG(INFO) << "Stopping HTTP listener";
  server->stop();
}

bool HttpServer::isRunning() { return server->is_running(); }

string HttpServer::route(const string &pattern) const {
  return escapeRegex(config.pathPrefix) + pattern;
}

void HttpServer::sendJson(httplib::Response &res, const json &body,
                          int status) {
  res.status = status;
  res.set_content(dumpJson(body), "application/json");
}

int HttpServer::queryInt(const httplib::Request &req, const string &key,
                         int defaultValue) {
  if (!req.has_param(key.c_str())) {
    return defaultValue;
  }
  string raw = req.get_param_value(key.c_str());
  size_t consumed = 0;
  int value = 0;
  try {
    value = std::stoi(raw, &consumed);
  } catch (const std::logic_error &) {
    consumed = 0;
  }
  if (raw.empty() || consumed != raw.length() || value < 0) {
    throw HttpError(400, "Invalid value for " + key + ": " + raw);
  }
  return value;
}

bool HttpServer::authorized(const httplib::Request &req) const {
  if (config.apiToken.empty()) {
    return true;
  }
  if (!req.has_header("X-Api-Token")) {
    return false;
  }
  string token = req.get_header_value("X-Api-Token");
  return token.length() == config.apiToken.length() &&
         sodium_memcmp(token.data(), config.apiToken.data(), token.length()) ==
             0;
}

RequestUser HttpServer::requestUser(const httplib::Request &req) const {
  RequestUser user;
  if (req.has_header("X-Remote-User-Id")) {
    string raw = req.get_header_value("X-Remote-User-Id");
    size_t consumed = 0;
    try {
      user.id = std::stoll(raw, &consumed);
    } catch (const std::logic_error &) {
      consumed = 0;
    }
    if (raw.empty() || consumed != raw.length() || user.id < 0) {
      throw HttpError(400, "Invalid X-Remote-User-Id: " + raw);
    }
  }
  if (req.has_header("X-Remote-User")) {
    user.name = req.get_header_value("X-Remote-User");
  }
  if (user.name.empty()) {
    user.name = user.id == 0 ? "api" : "user-" + to_string(user.id);
  }
  return user;
}

void HttpServer::requireTerminalEnabled() const {
  if (!terminalEnabled) {
    throw HttpError(403, "Terminal access is disabled");
  }
}

shared_ptr<TerminalSession> HttpServer::ownedSession(
    const httplib::Request &req, const string &id) {
  requireTerminalEnabled();
  RequestUser user = requestUser(req);
  auto session = terminals->getSession(id);
  if (session->getUserId() != user.id) {
    throw HttpError(403, "Session belongs to another user");
  }
  return session;
}

HttpServer::Handler HttpServer::guarded(Handler handler) {
  return [handler](const httplib::Request &req, httplib::Response &res) {
    try {
      handler(req, res);
    } catch (const HttpError &he) {
      sendJson(res, json{{"error", he.what()}}, he.getStatus());
    } catch (const NotFoundError &nfe) {
      sendJson(res, json{{"error", nfe.what()}}, 404);
    } catch (const QuotaExceededError &qee) {
      sendJson(res, json{{"error", qee.what()}}, 429);
    } catch (const SessionClosedError &sce) {
      sendJson(res, json{{"error", sce.what()}}, 409);
    } catch (const SpawnFailedError &sfe) {
      LOG(ERROR) << req.method << " " << req.path << ": " << sfe.what();
      sendJson(res, json{{"error", sfe.what()}}, 500);
    } catch (const json::exception &je) {
      sendJson(res, json{{"error", string("Invalid JSON: ") + je.what()}},
               400);
    } catch (const std::exception &ex) {
      STERROR << req.method << " " << req.path << " failed: " << ex.what();
      sendJson(res, json{{"error", ex.what()}}, 500);
    }
  };
}

json HttpServer::startExecution(const string &commandId, int64_t userId) {
  Execution execution = engine->createExecution(commandId, userId);
  engine->executeAsync(execution.id());
  const string base = config.pathPrefix + "/api/executions/" + execution.id();
  json j;
  j["execution_id"] = execution.id();
  j["status_url"] = base;
  j["stream_url"] = base + "/stream";
  return j;
}

void HttpServer::streamEvents(httplib::Response &res,
                              shared_ptr<EventStream> stream) {
  res.set_header("Cache-Control", "no-cache");
  res.set_header("X-Accel-Buffering", "no");
  res.set_chunked_content_provider(
      "text/event-stream",
      [stream](size_t offset, httplib::DataSink &sink) {
        vector<EventFrame> frames;
        bool more = stream->next(&frames,
                                 std::chrono::seconds(KEEPALIVE_SECONDS));
        for (const auto &frame : frames) {
          string wire = frame.format();
          if (!sink.write(wire.data(), wire.length())) {
            VLOG(1) << "Event stream client went away";
            return false;
          }
        }
        if (!more) {
          sink.done();
        }
        return true;
      },
      [stream](bool success) { stream->close(); });
}

void HttpServer::registerRoutes() {
  server->set_pre_routing_handler(
      [this](const httplib::Request &req, httplib::Response &res) {
        VLOG(1) << req.method << " " << req.path << " from "
                << req.remote_addr;
        if (!authorized(req)) {
          LOG(WARNING) << "Rejected request without a valid token from "
                       << req.remote_addr;
          sendJson(res, json{{"error", "Unauthorized"}}, 401);
          return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
      });

  server->Get(route("/api/version"),
              guarded([](const httplib::Request &, httplib::Response &res) {
                sendJson(res, json{{"version", RX_VERSION}});
              }));

  server->Get(route("/api/commands"),
              guarded([this](const httplib::Request &, httplib::Response &res) {
                json commands = json::array();
                for (const auto &command : catalog->getCommands()) {
                  commands.push_back(commandToJson(command));
                }
                sendJson(res, json{{"commands", commands}});
              }));

  server->Post(
      route(R"(/api/commands/([^/]+)/execute)"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        RequestUser user = requestUser(req);
        sendJson(res, startExecution(req.matches[1], user.id), 202);
      }));

  server->Post(
      route("/deploy"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        string commandId;
        if (!req.body.empty()) {
          json body = json::parse(req.body);
          if (body.contains("command_id")) {
            commandId = body["command_id"].get<string>();
          }
        }
        if (commandId.empty()) {
          commandId = catalog->getDefaultCommand().id();
        }
        LOG(INFO) << "Deploy triggered for " << commandId << " from "
                  << req.remote_addr;
        sendJson(res, startExecution(commandId, 0), 202);
      }));

  server->Get(
      route("/api/executions"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        int limit = queryInt(req, "limit", 0);
        int offset = queryInt(req, "offset", 0);
        json executions = json::array();
        for (const auto &summary : engine->getExecutions(limit, offset)) {
          executions.push_back(executionSummaryToJson(summary));
        }
        sendJson(res, json{{"executions", executions}});
      }));

  server->Get(
      route(R"(/api/executions/([^/]+))"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        sendJson(res, executionToJson(
                          engine->getExecutionById(req.matches[1]), true));
      }));

  server->Get(
      route(R"(/api/executions/([^/]+)/stream)"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        shared_ptr<EventStream> stream(
            new ExecutionEventStream(engine, req.matches[1]));
        streamEvents(res, stream);
      }));

  server->Get(
      route("/api/terminal/sessions"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        requireTerminalEnabled();
        RequestUser user = requestUser(req);
        json sessions = json::array();
        for (const auto &session : terminals->getUserSessions(user.id)) {
          if (!session->isClosed()) {
            sessions.push_back(sessionInfoToJson(session->info()));
          }
        }
        sendJson(res, json{{"sessions", sessions}});
      }));

  server->Post(
      route("/api/terminal/sessions"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        requireTerminalEnabled();
        RequestUser user = requestUser(req);
        auto session = terminals->createSession(user.id, user.name);
        sendJson(res, sessionInfoToJson(session->info()), 201);
      }));

  server->Delete(
      route(R"(/api/terminal/sessions/([^/]+))"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        string id = req.matches[1];
        ownedSession(req, id);
        terminals->closeSession(id);
        sendJson(res, json{{"closed", id}});
      }));

  server->Get(
      route(R"(/api/terminal/sessions/([^/]+)/stream)"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        auto session = ownedSession(req, req.matches[1]);
        string clientId = req.get_param_value("client_id");
        if (clientId.empty()) {
          clientId = sole::uuid4().str();
        }
        shared_ptr<EventStream> stream(
            new TerminalEventStream(session, clientId));
        streamEvents(res, stream);
      }));

  server->Post(
      route(R"(/api/terminal/sessions/([^/]+)/input)"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        auto session = ownedSession(req, req.matches[1]);
        session->write(req.body);
        sendJson(res, json{{"written", req.body.length()}});
      }));

  server->Post(
      route(R"(/api/terminal/sessions/([^/]+)/resize)"),
      guarded([this](const httplib::Request &req, httplib::Response &res) {
        auto session = ownedSession(req, req.matches[1]);
        json body = json::parse(req.body);
        int cols = body.at("cols").get<int>();
        int rows = body.at("rows").get<int>();
        if (cols <= 0 || rows <= 0 || cols > 0xFFFF || rows > 0xFFFF) {
          throw HttpError(400, "cols and rows must be between 1 and 65535");
        }
        session->resize(cols, rows);
        sendJson(res, json{{"cols", cols}, {"rows", rows}});
      }));
}
}  // namespace rx
