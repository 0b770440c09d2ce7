#ifndef __RX_LOG_HANDLER__
#define __RX_LOG_HANDLER__

#include "Headers.hpp"

namespace rx {
/**
 * @brief Owns the easylogging++ setup shared by rxserver and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the base configuration.
   *
   * The returned configuration is not applied yet; callers add file and
   * verbosity settings and then call apply().
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Routes all loggers into a fresh file under @p dir.
   * @param conf Configuration to mutate.
   * @param maxLogSize Size in bytes after which the file is rolled out.
   */
  static void setupLogFiles(el::Configurations *conf, const string &dir,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            bool appendPid = false,
                            const string &maxLogSize = "20971520");

  /** @brief Applies @p conf to every logger and sets the VLOG level. */
  static void apply(const el::Configurations &conf, int verbosity);

  /** @brief Deletes a log file that easylogging rolled out. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Makes the "stdout" logger print bare messages. */
  static void setupStdoutLogger();

  /** @brief Names the calling thread in log lines. */
  static void setThreadName(const string &name);

 private:
  static void stderrToFile(const string &dir, const string &stderrFilename);

  static string createLogFile(const string &dir, const string &filename);
};
}  // namespace rx
#endif  // __RX_LOG_HANDLER__
