#include "Errors.hpp"
#include "TerminalSessionManager.hpp"
#include "TestHeaders.hpp"

using namespace rx;

namespace {
TerminalConfig shellConfig() {
  TerminalConfig config;
  config.shell = "/bin/sh";
  config.args = {};
  config.env = {"RX_TEST_MARKER=marker"};
  config.bufferSize = 16 * 1024;
  return config;
}

// Drains @p channel until @p needle shows up or @p timeout passes.
bool readUntil(const shared_ptr<Channel> &channel, const string &needle,
               string *seen, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (seen->find(needle) == string::npos) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left.count() <= 0) {
      return false;
    }
    string chunk;
    auto result = channel->receive(&chunk, left);
    if (result == Channel::CLOSED) {
      return seen->find(needle) != string::npos;
    }
    if (result == Channel::VALUE) {
      *seen += chunk;
    }
  }
  return true;
}
}  // namespace

TEST_CASE("A real shell runs behind the pty", "[PseudoTerminal]") {
  TerminalSessionManager manager(shellConfig());
  auto session = manager.createSession(1, "tester");
  auto first = session->subscribe("first");
  auto second = session->subscribe("second");
  REQUIRE(session->clientCount() == 2);

  session->write("echo hi$((40+2)) $RX_TEST_MARKER\n");

  string firstSeen = first.replay;
  string secondSeen = second.replay;
  REQUIRE(readUntil(first.channel, "hi42 marker", &firstSeen,
                    std::chrono::seconds(10)));
  REQUIRE(readUntil(second.channel, "hi42 marker", &secondSeen,
                    std::chrono::seconds(10)));

  SECTION("Late viewers replay the history") {
    auto late = session->subscribe("late");
    REQUIRE_THAT(late.replay, Catch::Matchers::ContainsSubstring("hi42"));
  }

  SECTION("Resizing reaches the shell") {
    session->resize(120, 40);
    session->write("stty size\n");
    REQUIRE(readUntil(first.channel, "40 120", &firstSeen,
                      std::chrono::seconds(10)));
  }

  SECTION("Exiting the shell closes the session") {
    session->write("exit\n");
    REQUIRE(waitUntil([&session]() { return session->isClosed(); },
                      std::chrono::seconds(10)));
    string chunk;
    while (first.channel->receive(&chunk, std::chrono::milliseconds(100)) ==
           Channel::VALUE) {
    }
    REQUIRE(first.channel->isClosed());
    REQUIRE_THROWS_AS(session->write("echo nope\n"), SessionClosedError);
    REQUIRE(manager.sweepIdleSessions(nowMillis()) == 1);
    REQUIRE(manager.sessionCount() == 0);
  }

  manager.shutdown();
  REQUIRE(session->isClosed());
}

TEST_CASE("A missing shell fails to spawn", "[PseudoTerminal]") {
  TerminalConfig config = shellConfig();
  config.shell = "/definitely/not/a/shell";
  TerminalSessionManager manager(config);
  REQUIRE_THROWS_AS(manager.createSession(1, "tester"), SpawnFailedError);
  REQUIRE(manager.sessionCount() == 0);
}
