#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace rx {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts/ini, not from easylogging's own --v flag
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return conf;
}

void LogHandler::setupLogFiles(el::Configurations *conf, const string &dir,
                               const string &filenamePrefix, bool logToStdout,
                               bool redirectStderrToFile, bool appendPid,
                               const string &maxLogSize) {
  char stamp[80];
  time_t rawtime = time(NULL);
  struct tm localTime;
  localtime_r(&rawtime, &localTime);
  strftime(stamp, sizeof(stamp), "%Y-%m-%d_%H-%M-%S", &localTime);

  string suffix = string(stamp);
  if (appendPid) {
    suffix += "_" + std::to_string(getpid());
  }
  suffix += ".log";

  string logPath = createLogFile(dir, filenamePrefix + "-" + suffix);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  conf->setGlobally(el::ConfigurationType::Filename, logPath);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(dir, filenamePrefix + "-stderr-" + suffix);
  }
}

void LogHandler::apply(const el::Configurations &conf, int verbosity) {
  el::Loggers::setVerboseLevel(verbosity);
  el::Loggers::reconfigureAllLoggers(conf);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed at this point, so nothing may be logged here
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

void LogHandler::setThreadName(const string &name) {
  el::Helpers::setThreadName(name);
}

string LogHandler::createLogFile(const string &dir, const string &filename) {
  string fullPath = dir + "/" + filename;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << dir << ": "
                          << ec.message() << endl;
    exit(1);
  }
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullPath;
}

void LogHandler::stderrToFile(const string &dir, const string &stderrFilename) {
  string fullPath = createLogFile(dir, stderrFilename);
  FILE *stream = freopen(fullPath.c_str(), "w", stderr);
  if (!stream) {
    STFATAL << "Could not redirect stderr to " << fullPath;
  }
  setvbuf(stream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace rx
