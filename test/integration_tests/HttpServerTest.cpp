#include "Errors.hpp"
#include "FakeUserTerminal.hpp"
#include "HttpServer.hpp"
#include "TestHeaders.hpp"

using namespace rx;

namespace {
Command makeCommand(const string &id, const string &line, int sortOrder) {
  Command command;
  command.set_id(id);
  command.set_name(id);
  command.set_command(line);
  command.set_working_dir("/");
  command.set_sort_order(sortOrder);
  return command;
}

class ServerFixture {
 public:
  explicit ServerFixture(const string &token = "", bool terminalEnabled = true) {
    NetworkConfig network;
    network.port = 0;
    network.bindIp = "127.0.0.1";
    network.pathPrefix = "/devops";
    network.httpThreads = 8;
    network.apiToken = token;

    ExecutionConfig execution;
    execution.defaultTimeoutSeconds = 10;
    execution.maxTimeoutSeconds = 10;

    TerminalConfig terminal;
    terminal.bufferSize = 4096;

    catalog.reset(new IniCommandCatalog(vector<Command>{
        makeCommand("greet", "echo greetings", 2),
        makeCommand("deploy", "echo deploying", 1),
    }));
    store.reset(new InMemoryExecutionStore());
    engine.reset(new ExecutionEngine(execution, catalog, store));
    terminals.reset(new TerminalSessionManager(
        terminal, [this](const ShellSpec &) -> shared_ptr<UserTerminal> {
          lock_guard<std::mutex> guard(fakeMutex);
          auto term = std::make_shared<FakeUserTerminal>();
          fakes.push_back(term);
          return term;
        }));
    server.reset(
        new HttpServer(network, terminalEnabled, engine, terminals, catalog));
    port = server->bind();
    listenThread = std::thread([this]() { server->listen(); });
    REQUIRE(waitUntil([this]() { return server->isRunning(); },
                      std::chrono::seconds(5)));
    client.reset(new httplib::Client("127.0.0.1", port));
    client->set_read_timeout(10, 0);
  }

  ~ServerFixture() {
    server->stop();
    listenThread.join();
    terminals->shutdown();
    engine->shutdown();
  }

  shared_ptr<FakeUserTerminal> fake(size_t index) {
    lock_guard<std::mutex> guard(fakeMutex);
    return fakes.at(index);
  }

  json waitForFinished(const string &executionId,
                       const httplib::Headers &headers = {}) {
    json body;
    REQUIRE(waitUntil(
        [&]() {
          auto res =
              client->Get("/devops/api/executions/" + executionId, headers);
          if (!res || res->status != 200) {
            return false;
          }
          body = json::parse(res->body);
          return !body["finished_at"].is_null();
        },
        std::chrono::seconds(10)));
    return body;
  }

  shared_ptr<IniCommandCatalog> catalog;
  shared_ptr<InMemoryExecutionStore> store;
  shared_ptr<ExecutionEngine> engine;
  shared_ptr<TerminalSessionManager> terminals;
  std::unique_ptr<HttpServer> server;
  std::unique_ptr<httplib::Client> client;
  std::thread listenThread;
  int port;

  std::mutex fakeMutex;
  vector<shared_ptr<FakeUserTerminal>> fakes;
};

// Splits an SSE body into (event, data) pairs, skipping comments.
vector<pair<string, string>> parseEvents(const string &body) {
  vector<pair<string, string>> events;
  string event;
  string data;
  for (const auto &line : split(body, '\n')) {
    if (line.empty()) {
      if (!event.empty()) {
        events.push_back(make_pair(event, data));
      }
      event.clear();
      data.clear();
    } else if (line.rfind("event: ", 0) == 0) {
      event = line.substr(7);
    } else if (line.rfind("data: ", 0) == 0) {
      data += (data.empty() ? "" : "\n") + line.substr(6);
    }
  }
  return events;
}
}  // namespace

TEST_CASE("HttpServer serves the catalog and runs commands", "[HttpServer]") {
  ServerFixture fixture;

  auto version = fixture.client->Get("/devops/api/version");
  REQUIRE(version);
  REQUIRE(version->status == 200);
  REQUIRE(json::parse(version->body)["version"] == RX_VERSION);

  auto commands = fixture.client->Get("/devops/api/commands");
  REQUIRE(commands->status == 200);
  json listed = json::parse(commands->body)["commands"];
  REQUIRE(listed.size() == 2);
  REQUIRE(listed[0]["id"] == "deploy");
  REQUIRE(listed[1]["id"] == "greet");

  httplib::Headers user = {{"X-Remote-User-Id", "17"}};
  auto started =
      fixture.client->Post("/devops/api/commands/greet/execute", user, "",
                           "application/json");
  REQUIRE(started->status == 202);
  json handle = json::parse(started->body);
  const string executionId = handle["execution_id"];
  REQUIRE(handle["status_url"] == "/devops/api/executions/" + executionId);
  REQUIRE(handle["stream_url"] ==
          "/devops/api/executions/" + executionId + "/stream");

  json finished = fixture.waitForFinished(executionId);
  REQUIRE(finished["status"] == "success");
  REQUIRE(finished["exit_code"] == 0);
  REQUIRE(finished["user_id"] == 17);
  REQUIRE(finished["output"] == "greetings\n");
  REQUIRE(finished["output_truncated"] == false);

  auto stream = fixture.client->Get(handle["stream_url"].get<string>());
  REQUIRE(stream->status == 200);
  REQUIRE_THAT(stream->get_header_value("Content-Type"),
               Catch::Matchers::StartsWith("text/event-stream"));
  auto events = parseEvents(stream->body);
  REQUIRE(events.size() == 2);
  REQUIRE(events[0].first == "output");
  REQUIRE(decodeBase64(events[0].second) == "greetings\n");
  REQUIRE(events[1].first == "complete");
  REQUIRE(json::parse(events[1].second)["status"] == "success");

  auto listing = fixture.client->Get("/devops/api/executions?limit=10");
  REQUIRE(listing->status == 200);
  json executions = json::parse(listing->body)["executions"];
  REQUIRE(executions.size() == 1);
  REQUIRE(executions[0]["command_name"] == "greet");
  REQUIRE_FALSE(executions[0].contains("output"));
}

TEST_CASE("HttpServer deploy hook runs the default command", "[HttpServer]") {
  ServerFixture fixture;

  auto started = fixture.client->Post("/devops/deploy", "", "application/json");
  REQUIRE(started->status == 202);
  json finished = fixture.waitForFinished(
      json::parse(started->body)["execution_id"].get<string>());
  REQUIRE(finished["command_id"] == "deploy");
  REQUIRE(finished["user_id"] == 0);

  auto chosen = fixture.client->Post(
      "/devops/deploy", R"({"command_id": "greet"})", "application/json");
  REQUIRE(chosen->status == 202);

  auto bogus = fixture.client->Post("/devops/deploy", "{not json",
                                    "application/json");
  REQUIRE(bogus->status == 400);
}

TEST_CASE("HttpServer maps failures to status codes", "[HttpServer]") {
  ServerFixture fixture;

  REQUIRE(fixture.client->Post("/devops/api/commands/nope/execute", "",
                               "application/json")
              ->status == 404);
  REQUIRE(fixture.client->Get("/devops/api/executions/nope")->status == 404);
  REQUIRE(fixture.client->Get("/devops/api/executions?limit=abc")->status ==
          400);
  REQUIRE(fixture.client
              ->Get("/devops/api/terminal/sessions",
                    httplib::Headers{{"X-Remote-User-Id", "not-a-number"}})
              ->status == 400);
  REQUIRE(fixture.client->Get("/api/version")->status == 404);
}

TEST_CASE("HttpServer checks the API token", "[HttpServer]") {
  ServerFixture fixture("s3cret");

  auto missing = fixture.client->Get("/devops/api/version");
  REQUIRE(missing->status == 401);
  auto wrong =
      fixture.client->Get("/devops/api/version",
                          httplib::Headers{{"X-Api-Token", "s3cre"}});
  REQUIRE(wrong->status == 401);
  auto right =
      fixture.client->Get("/devops/api/version",
                          httplib::Headers{{"X-Api-Token", "s3cret"}});
  REQUIRE(right->status == 200);
}

TEST_CASE("HttpServer refuses terminals when disabled", "[HttpServer]") {
  ServerFixture fixture("", false);
  REQUIRE(fixture.client->Get("/devops/api/terminal/sessions")->status == 403);
  REQUIRE(fixture.client->Post("/devops/api/terminal/sessions", "",
                               "application/json")
              ->status == 403);
  REQUIRE(fixture.terminals->sessionCount() == 0);
}

TEST_CASE("HttpServer drives terminal sessions", "[HttpServer]") {
  ServerFixture fixture;
  httplib::Headers owner = {{"X-Remote-User-Id", "5"},
                            {"X-Remote-User", "alice"}};
  httplib::Headers stranger = {{"X-Remote-User-Id", "6"}};

  auto created = fixture.client->Post("/devops/api/terminal/sessions", owner,
                                      "", "application/json");
  REQUIRE(created->status == 201);
  json info = json::parse(created->body);
  const string id = info["id"];
  REQUIRE(info["username"] == "alice");
  REQUIRE(info["is_active"] == true);
  const string base = "/devops/api/terminal/sessions/" + id;

  auto listed = fixture.client->Get("/devops/api/terminal/sessions", owner);
  REQUIRE(json::parse(listed->body)["sessions"].size() == 1);
  auto others = fixture.client->Get("/devops/api/terminal/sessions", stranger);
  REQUIRE(json::parse(others->body)["sessions"].empty());

  auto input = fixture.client->Post(base + "/input", owner, "ls\n",
                                    "application/octet-stream");
  REQUIRE(input->status == 200);
  REQUIRE(fixture.fake(0)->readInput(3) == "ls\n");

  auto resized = fixture.client->Post(base + "/resize", owner,
                                      R"({"cols": 100, "rows": 30})",
                                      "application/json");
  REQUIRE(resized->status == 200);
  REQUIRE(fixture.fake(0)->getLastWinInfo().ws_col == 100);
  REQUIRE(fixture.client
              ->Post(base + "/resize", owner, R"({"cols": 0, "rows": 30})",
                     "application/json")
              ->status == 400);

  REQUIRE(fixture.client
              ->Post(base + "/input", stranger, "rm\n",
                     "application/octet-stream")
              ->status == 403);

  fixture.fake(0)->emit("before attach\n");
  REQUIRE(waitUntil(
      [&]() {
        auto session = fixture.terminals->getSession(id);
        auto peek = session->subscribe("peek");
        session->unsubscribe("peek", peek.channel);
        return peek.replay == "before attach\n";
      },
      std::chrono::seconds(5)));

  SECTION("Streaming replays history and ends on close") {
    string body;
    std::thread closer([&]() {
      waitUntil(
          [&]() { return fixture.terminals->getSession(id)->clientCount(); },
          std::chrono::seconds(5));
      fixture.fake(0)->emit("live\n");
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      fixture.terminals->closeSession(id);
    });
    auto stream = fixture.client->Get(
        base + "/stream?client_id=viewer", owner,
        [&body](const char *data, size_t length) {
          body.append(data, length);
          return true;
        });
    closer.join();
    REQUIRE(stream);
    auto events = parseEvents(body);
    REQUIRE(events.size() == 4);
    REQUIRE(events[0].first == "session_info");
    REQUIRE(json::parse(events[0].second)["client_id"] == "viewer");
    REQUIRE(events[1].first == "replay");
    REQUIRE(decodeBase64(events[1].second) == "before attach\n");
    REQUIRE(events[2].first == "output");
    REQUIRE(decodeBase64(events[2].second) == "live\n");
    REQUIRE(events[3].first == "closed");
  }

  SECTION("Only the owner can close") {
    REQUIRE(fixture.client->Delete(base, stranger)->status == 403);
    REQUIRE(fixture.client->Delete(base, owner)->status == 200);
    REQUIRE(fixture.client->Delete(base, owner)->status == 404);
    REQUIRE(fixture.client
                ->Post(base + "/input", owner, "ls\n",
                       "application/octet-stream")
                ->status == 404);
  }
}
