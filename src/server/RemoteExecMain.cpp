#include <cxxopts.hpp>

#include "CommandCatalog.hpp"
#include "ExecutionEngine.hpp"
#include "ExecutionStore.hpp"
#include "HttpServer.hpp"
#include "LogHandler.hpp"
#include "ServerConfig.hpp"
#include "SimpleIni.h"
#include "TerminalSessionManager.hpp"

using namespace rx;

namespace {
// Blocks the shutdown signals in every thread; a dedicated thread waits for
// them with sigwait so stopping the server never happens in signal context
sigset_t blockShutdownSignals() {
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGUSR1);
  pthread_sigmask(SIG_BLOCK, &signals, NULL);
  return signals;
}
}  // namespace

int main(int argc, char **argv) {
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  rx::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("rxserver",
                           "Run operator commands and shared shells over HTTP");
  ServerConfig config;
  shared_ptr<CommandCatalog> catalog;
  bool logToStdout = false;
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on",
         cxxopts::value<int>()->default_value("0"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "rxserver version " << RX_VERSION << endl;
      exit(0);
    }

    string cfgfile = result["cfgfile"].as<string>();
    bool explicitCfg = !cfgfile.empty();
    if (!explicitCfg) {
      cfgfile = ServerConfig::defaultConfigPath();
    }

    CSimpleIniA ini(true, false, false);
    if (explicitCfg || fs::exists(cfgfile)) {
      ServerConfig::loadIniFile(cfgfile, &ini);
    }
    config = ServerConfig::fromIni(ini);
    catalog.reset(new IniCommandCatalog(ini));

    if (result.count("port")) {
      config.network.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.network.bindIp = result["bindip"].as<string>();
    }
    if (result.count("verbose")) {
      config.debug.verbose = result["verbose"].as<int>();
    }
    logToStdout = result.count("logtostdout") > 0;
  } catch (const cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(INFO, "stdout") << "Invalid configuration: " << re.what() << endl;
    exit(1);
  }

  if (config.debug.silent) {
    defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
  }
  LogHandler::setupLogFiles(&defaultConf, config.debug.logDir, "rxserver",
                            logToStdout, !logToStdout, true,
                            config.debug.logSize);
  LogHandler::apply(defaultConf, config.debug.verbose);
  LogHandler::setThreadName("rxserver-main");

  GOOGLE_PROTOBUF_VERIFY_VERSION;
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }

  sigset_t shutdownSignals = blockShutdownSignals();

  int exitCode = 0;
  {
    shared_ptr<ExecutionStore> store(
        new InMemoryExecutionStore(config.execution.historyLimit));
    shared_ptr<ExecutionEngine> engine(
        new ExecutionEngine(config.execution, catalog, store));
    shared_ptr<TerminalSessionManager> terminals(
        new TerminalSessionManager(config.terminal));
    if (config.terminal.enabled) {
      terminals->startSweeper();
    }

    std::unique_ptr<HttpServer> httpServer;
    try {
      httpServer.reset(new HttpServer(config.network, config.terminal.enabled,
                                      engine, terminals, catalog));
      httpServer->bind();
    } catch (const std::runtime_error &re) {
      LOG(ERROR) << re.what();
      CLOG(INFO, "stdout") << re.what() << endl;
      exitCode = 1;
    }

    if (exitCode == 0) {
      HttpServer *listener = httpServer.get();
      std::thread signalThread([listener, shutdownSignals]() {
        LogHandler::setThreadName("signal-watcher");
        int signal = 0;
        if (sigwait(&shutdownSignals, &signal) == 0 && signal != SIGUSR1) {
          LOG(INFO) << "Received signal " << signal << ", shutting down";
          listener->stop();
        }
      });

      LOG(INFO) << "rxserver " << RX_VERSION << " started";
      httpServer->listen();

      // Wakes the watcher if the listener stopped on its own
      pthread_kill(signalThread.native_handle(), SIGUSR1);
      signalThread.join();
    }

    terminals->shutdown();
    engine->shutdown();
    LOG(INFO) << "rxserver stopped";
  }

  el::Helpers::uninstallPreRollOutCallback();
  google::protobuf::ShutdownProtobufLibrary();
  return exitCode;
}
