#include "Errors.hpp"
#include "FakeUserTerminal.hpp"
#include "TerminalSessionManager.hpp"
#include "TestHeaders.hpp"

using namespace rx;

namespace {
struct FakeTerminals {
  std::mutex mutex;
  vector<shared_ptr<FakeUserTerminal>> created;
  bool failNext = false;
  ShellSpec lastSpec;

  TerminalSessionManager::TerminalFactory factory() {
    return [this](const ShellSpec &spec) -> shared_ptr<UserTerminal> {
      lock_guard<std::mutex> guard(mutex);
      auto term = std::make_shared<FakeUserTerminal>();
      term->failSetup = failNext;
      lastSpec = spec;
      created.push_back(term);
      return term;
    };
  }
};

TerminalConfig managerConfig() {
  TerminalConfig config;
  config.shell = "/bin/sh";
  config.args = {"-i"};
  config.env = {"FOO=bar"};
  config.maxSessionsPerUser = 10;
  config.sessionTtlSeconds = 60;
  config.bufferSize = 1024;
  return config;
}
}  // namespace

TEST_CASE("TerminalSessionManager creates and indexes sessions",
          "[TerminalSessionManager]") {
  FakeTerminals fakes;
  TerminalSessionManager manager(managerConfig(), fakes.factory());

  auto session = manager.createSession(42, "alice");
  REQUIRE_THAT(session->getId(), Catch::Matchers::StartsWith("term-42-"));
  REQUIRE(session->getId().length() == string("term-42-").length() + 16);
  REQUIRE(session->info().username() == "alice");
  REQUIRE(fakes.lastSpec.program() == "/bin/sh");
  REQUIRE(fakes.lastSpec.args_size() == 1);
  REQUIRE(fakes.lastSpec.env(0) == "FOO=bar");

  REQUIRE(manager.getSession(session->getId()) == session);
  REQUIRE(manager.getUserSessions(42).size() == 1);
  REQUIRE(manager.getUserSessions(7).empty());
  REQUIRE_THROWS_AS(manager.getSession("term-42-nope"), NotFoundError);

  manager.closeSession(session->getId());
  REQUIRE(session->isClosed());
  REQUIRE(manager.sessionCount() == 0);
  REQUIRE(manager.userSessionCount(42) == 0);
  REQUIRE_THROWS_AS(manager.closeSession(session->getId()), NotFoundError);
}

TEST_CASE("TerminalSessionManager enforces the per-user quota",
          "[TerminalSessionManager]") {
  FakeTerminals fakes;
  TerminalSessionManager manager(managerConfig(), fakes.factory());

  for (int i = 0; i < 10; i++) {
    manager.createSession(1, "busy");
  }
  manager.createSession(2, "other");
  REQUIRE(manager.sessionCount() == 11);

  REQUIRE_THROWS_AS(manager.createSession(1, "busy"), QuotaExceededError);
  REQUIRE(manager.sessionCount() == 11);
  REQUIRE(manager.userSessionCount(1) == 10);
  REQUIRE(fakes.created.size() == 11);

  SECTION("Closing one frees a slot") {
    auto first = manager.getUserSessions(1).front();
    manager.closeSession(first->getId());
    manager.createSession(1, "busy");
    REQUIRE(manager.userSessionCount(1) == 10);
  }

  SECTION("An exited shell does not hold quota") {
    auto victim = manager.getUserSessions(1).back();
    fakes.created[9]->closeShellSide();
    REQUIRE(waitUntil([&victim]() { return victim->isClosed(); },
                      std::chrono::seconds(5)));
    auto replacement = manager.createSession(1, "busy");
    REQUIRE(manager.userSessionCount(1) == 10);
    REQUIRE_THROWS_AS(manager.getSession(victim->getId()), NotFoundError);
  }

  manager.shutdown();
  REQUIRE(manager.sessionCount() == 0);
}

TEST_CASE("TerminalSessionManager leaves the registry alone on spawn failure",
          "[TerminalSessionManager]") {
  FakeTerminals fakes;
  TerminalSessionManager manager(managerConfig(), fakes.factory());
  manager.createSession(5, "eve");

  fakes.failNext = true;
  REQUIRE_THROWS_AS(manager.createSession(5, "eve"), SpawnFailedError);
  REQUIRE(manager.sessionCount() == 1);
  REQUIRE(manager.userSessionCount(5) == 1);
}

TEST_CASE("TerminalSessionManager sweeps idle sessions",
          "[TerminalSessionManager]") {
  FakeTerminals fakes;
  TerminalSessionManager manager(managerConfig(), fakes.factory());

  auto idle = manager.createSession(1, "idle");
  auto busy = manager.createSession(2, "busy");

  // Only busy sees traffic right before the sweep
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  busy->write("x");
  const int64_t now = idle->getLastActivityMs() + 60 * 1000 + 10;
  REQUIRE(busy->getLastActivityMs() > idle->getLastActivityMs());

  REQUIRE(manager.sweepIdleSessions(now) == 1);
  REQUIRE(idle->isClosed());
  REQUIRE_FALSE(busy->isClosed());
  REQUIRE_THROWS_AS(manager.getSession(idle->getId()), NotFoundError);
  REQUIRE(manager.getUserSessions(1).empty());
  REQUIRE(manager.getSession(busy->getId()) == busy);

  REQUIRE(manager.sweepIdleSessions(nowMillis()) == 0);
}

TEST_CASE("TerminalSessionManager sweeper thread runs on its interval",
          "[TerminalSessionManager]") {
  FakeTerminals fakes;
  TerminalConfig config = managerConfig();
  config.sessionTtlSeconds = 1;
  config.sweepIntervalSeconds = 1;
  TerminalSessionManager manager(config, fakes.factory());
  manager.startSweeper();

  auto session = manager.createSession(9, "sleepy");
  REQUIRE(waitUntil([&manager]() { return manager.sessionCount() == 0; },
                    std::chrono::seconds(10)));
  REQUIRE(session->isClosed());
}

TEST_CASE("TerminalSessionManager shutdown closes everything",
          "[TerminalSessionManager]") {
  FakeTerminals fakes;
  TerminalSessionManager manager(managerConfig(), fakes.factory());
  manager.startSweeper();
  auto a = manager.createSession(1, "a");
  auto b = manager.createSession(2, "b");

  manager.shutdown();
  manager.shutdown();
  REQUIRE(a->isClosed());
  REQUIRE(b->isClosed());
  REQUIRE(manager.sessionCount() == 0);
  REQUIRE_THROWS_AS(manager.createSession(1, "a"), std::runtime_error);
}
