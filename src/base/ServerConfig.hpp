#ifndef __RX_SERVER_CONFIG__
#define __RX_SERVER_CONFIG__

#include "Headers.hpp"
#include "SimpleIni.h"

namespace rx {
struct NetworkConfig {
  int port = 8080;
  string bindIp = "0.0.0.0";
  string pathPrefix = "/devops";
  string tlsCert;
  string tlsKey;
  int httpThreads = 64;
  // Empty disables the X-Api-Token check
  string apiToken;
};

struct ExecutionConfig {
  int64_t defaultTimeoutSeconds = 300;
  int64_t maxTimeoutSeconds = 3600;
  size_t maxOutputSize = 10 * 1024 * 1024;
  int maxConcurrent = 16;
  // Finished executions kept in memory
  size_t historyLimit = 1000;
};

struct TerminalConfig {
  bool enabled = true;
  string shell = "/bin/bash";
  vector<string> args = {"-l"};
  // Extra K=V pairs appended to the server environment
  vector<string> env;
  int maxSessionsPerUser = 10;
  size_t bufferSize = 64 * 1024;
  int64_t sessionTtlSeconds = 24 * 60 * 60;
  int64_t sweepIntervalSeconds = 5 * 60;
  size_t subscriberCapacity = 256;
};

struct DebugConfig {
  int verbose = 0;
  bool silent = false;
  string logSize = "20971520";
  string logDir = GetTempDirectory() + "rxserver";
};

/**
 * @brief Every tunable of rxserver, read from one INI file.
 */
class ServerConfig {
 public:
  NetworkConfig network;
  ExecutionConfig execution;
  TerminalConfig terminal;
  DebugConfig debug;

  /**
   * @brief Reads all known sections, keeping defaults for absent keys.
   * @throws std::runtime_error on malformed numbers or out of range values.
   */
  static ServerConfig fromIni(const CSimpleIniA &ini);

  /**
   * @brief Loads @p path into @p ini.
   * @throws std::runtime_error if the file cannot be read or parsed.
   */
  static void loadIniFile(const string &path, CSimpleIniA *ini);

  /** @brief `<config home>/rxserver/rxserver.cfg`. */
  static string defaultConfigPath();

  static int64_t getInt(const CSimpleIniA &ini, const char *section,
                        const char *key, int64_t defaultValue);

  static bool getBool(const CSimpleIniA &ini, const char *section,
                      const char *key, bool defaultValue);

  static string getString(const CSimpleIniA &ini, const char *section,
                          const char *key, const string &defaultValue);
};
}  // namespace rx

#endif  // __RX_SERVER_CONFIG__
