#include "ServerConfig.hpp"

#include "TestHeaders.hpp"

using namespace rx;

namespace {
ServerConfig parse(const string &text) {
  CSimpleIniA ini(true, false, false);
  REQUIRE(ini.LoadData(text.c_str(), text.length()) >= 0);
  return ServerConfig::fromIni(ini);
}
}  // namespace

TEST_CASE("ServerConfig defaults", "[ServerConfig]") {
  ServerConfig config = parse("");
  REQUIRE(config.network.port == 8080);
  REQUIRE(config.network.bindIp == "0.0.0.0");
  REQUIRE(config.network.pathPrefix == "/devops");
  REQUIRE(config.network.apiToken.empty());
  REQUIRE(config.execution.defaultTimeoutSeconds == 300);
  REQUIRE(config.execution.maxTimeoutSeconds == 3600);
  REQUIRE(config.execution.maxOutputSize == 10485760);
  REQUIRE(config.terminal.enabled);
  REQUIRE(config.terminal.shell == "/bin/bash");
  REQUIRE(config.terminal.args == vector<string>{"-l"});
  REQUIRE(config.terminal.env.empty());
  REQUIRE(config.terminal.maxSessionsPerUser == 10);
  REQUIRE(config.terminal.bufferSize == 65536);
  REQUIRE(config.terminal.sessionTtlSeconds == 86400);
  REQUIRE(config.terminal.sweepIntervalSeconds == 300);
  REQUIRE(config.terminal.subscriberCapacity == 256);
}

TEST_CASE("ServerConfig reads every section", "[ServerConfig]") {
  ServerConfig config = parse(
      "[Networking]\n"
      "port = 9090\n"
      "bind_ip = 127.0.0.1\n"
      "path_prefix = /ops/\n"
      "http_threads = 8\n"
      "[Security]\n"
      "api_token = s3cret\n"
      "[Execution]\n"
      "default_timeout = 60\n"
      "max_timeout = 120\n"
      "max_output_size = 1024\n"
      "max_concurrent = 2\n"
      "history_limit = 25\n"
      "[Terminal]\n"
      "enabled = false\n"
      "shell = /bin/sh\n"
      "args = -i   -x\n"
      "env = FOO=bar; LANG=C.UTF-8 ;\n"
      "max_sessions_per_user = 3\n"
      "buffer_size = 128\n"
      "session_ttl = 30\n"
      "sweep_interval = 5\n"
      "subscriber_capacity = 4\n"
      "[Debug]\n"
      "verbose = 3\n"
      "silent = 1\n"
      "logsize = 4096\n"
      "logdir = /tmp/rxlogs\n");

  REQUIRE(config.network.port == 9090);
  REQUIRE(config.network.bindIp == "127.0.0.1");
  REQUIRE(config.network.pathPrefix == "/ops");
  REQUIRE(config.network.httpThreads == 8);
  REQUIRE(config.network.apiToken == "s3cret");
  REQUIRE(config.execution.defaultTimeoutSeconds == 60);
  REQUIRE(config.execution.maxTimeoutSeconds == 120);
  REQUIRE(config.execution.maxOutputSize == 1024);
  REQUIRE(config.execution.maxConcurrent == 2);
  REQUIRE(config.execution.historyLimit == 25);
  REQUIRE_FALSE(config.terminal.enabled);
  REQUIRE(config.terminal.shell == "/bin/sh");
  REQUIRE(config.terminal.args == vector<string>{"-i", "-x"});
  REQUIRE(config.terminal.env == vector<string>{"FOO=bar", "LANG=C.UTF-8"});
  REQUIRE(config.terminal.maxSessionsPerUser == 3);
  REQUIRE(config.terminal.bufferSize == 128);
  REQUIRE(config.terminal.sessionTtlSeconds == 30);
  REQUIRE(config.terminal.sweepIntervalSeconds == 5);
  REQUIRE(config.terminal.subscriberCapacity == 4);
  REQUIRE(config.debug.verbose == 3);
  REQUIRE(config.debug.silent);
  REQUIRE(config.debug.logSize == "4096");
  REQUIRE(config.debug.logDir == "/tmp/rxlogs");
}

TEST_CASE("ServerConfig empty args run the bare shell", "[ServerConfig]") {
  ServerConfig config = parse("[Terminal]\nargs =\n");
  REQUIRE(config.terminal.args.empty());
}

TEST_CASE("ServerConfig rejects bad values", "[ServerConfig]") {
  REQUIRE_THROWS_AS(parse("[Networking]\nport = eighty\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(parse("[Networking]\nport = 70000\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(parse("[Execution]\nmax_timeout = 0\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(parse("[Execution]\nhistory_limit = -1\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(parse("[Terminal]\nenabled = maybe\n"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(parse("[Terminal]\nenv = NOEQUALS\n"), std::runtime_error);
  REQUIRE_THROWS_AS(parse("[Networking]\ntls_cert = /etc/cert.pem\n"),
                    std::runtime_error);
}

TEST_CASE("ServerConfig reports unreadable files", "[ServerConfig]") {
  CSimpleIniA ini(true, false, false);
  REQUIRE_THROWS_AS(
      ServerConfig::loadIniFile("/nonexistent/rxserver.cfg", &ini),
      std::runtime_error);
}
