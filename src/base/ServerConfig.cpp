#include "ServerConfig.hpp"

namespace rx {
namespace {
void requirePositive(int64_t value, const string &name) {
  if (value <= 0) {
    throw std::runtime_error("Config value " + name + " must be positive");
  }
}
}  // namespace

int64_t ServerConfig::getInt(const CSimpleIniA &ini, const char *section,
                             const char *key, int64_t defaultValue) {
  const char *raw = ini.GetValue(section, key, NULL);
  if (raw == NULL) {
    return defaultValue;
  }
  string value = trim(raw);
  if (value.empty()) {
    return defaultValue;
  }
  size_t consumed = 0;
  int64_t parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error &) {
    consumed = 0;
  }
  if (consumed != value.length()) {
    throw std::runtime_error(string("Invalid integer for [") + section + "] " +
                             key + ": " + value);
  }
  return parsed;
}

bool ServerConfig::getBool(const CSimpleIniA &ini, const char *section,
                           const char *key, bool defaultValue) {
  const char *raw = ini.GetValue(section, key, NULL);
  if (raw == NULL) {
    return defaultValue;
  }
  string value = trim(raw);
  std::transform(value.begin(), value.end(), value.begin(), ::tolower);
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  throw std::runtime_error(string("Invalid boolean for [") + section + "] " +
                           key + ": " + raw);
}

string ServerConfig::getString(const CSimpleIniA &ini, const char *section,
                               const char *key, const string &defaultValue) {
  const char *raw = ini.GetValue(section, key, NULL);
  if (raw == NULL) {
    return defaultValue;
  }
  return trim(raw);
}

ServerConfig ServerConfig::fromIni(const CSimpleIniA &ini) {
  ServerConfig config;

  NetworkConfig &net = config.network;
  net.port = int(getInt(ini, "Networking", "port", net.port));
  if (net.port <= 0 || net.port > 65535) {
    throw std::runtime_error("Invalid port: " + to_string(net.port));
  }
  net.bindIp = getString(ini, "Networking", "bind_ip", net.bindIp);
  net.pathPrefix = getString(ini, "Networking", "path_prefix", net.pathPrefix);
  while (!net.pathPrefix.empty() && net.pathPrefix.back() == '/') {
    net.pathPrefix.pop_back();
  }
  net.tlsCert = getString(ini, "Networking", "tls_cert", net.tlsCert);
  net.tlsKey = getString(ini, "Networking", "tls_key", net.tlsKey);
  if (net.tlsCert.empty() != net.tlsKey.empty()) {
    throw std::runtime_error("tls_cert and tls_key must be set together");
  }
  net.httpThreads =
      int(getInt(ini, "Networking", "http_threads", net.httpThreads));
  requirePositive(net.httpThreads, "http_threads");
  net.apiToken = getString(ini, "Security", "api_token", net.apiToken);

  ExecutionConfig &exec = config.execution;
  exec.defaultTimeoutSeconds = getInt(ini, "Execution", "default_timeout",
                                      exec.defaultTimeoutSeconds);
  exec.maxTimeoutSeconds =
      getInt(ini, "Execution", "max_timeout", exec.maxTimeoutSeconds);
  exec.maxOutputSize = size_t(
      getInt(ini, "Execution", "max_output_size", int64_t(exec.maxOutputSize)));
  exec.maxConcurrent =
      int(getInt(ini, "Execution", "max_concurrent", exec.maxConcurrent));
  requirePositive(exec.defaultTimeoutSeconds, "default_timeout");
  requirePositive(exec.maxTimeoutSeconds, "max_timeout");
  requirePositive(int64_t(exec.maxOutputSize), "max_output_size");
  exec.historyLimit = size_t(
      getInt(ini, "Execution", "history_limit", int64_t(exec.historyLimit)));
  requirePositive(exec.maxConcurrent, "max_concurrent");
  requirePositive(int64_t(exec.historyLimit), "history_limit");

  TerminalConfig &term = config.terminal;
  term.enabled = getBool(ini, "Terminal", "enabled", term.enabled);
  term.shell = getString(ini, "Terminal", "shell", term.shell);
  if (ini.GetValue("Terminal", "args", NULL) != NULL) {
    term.args = splitWhitespace(ini.GetValue("Terminal", "args", ""));
  }
  if (ini.GetValue("Terminal", "env", NULL) != NULL) {
    term.env.clear();
    for (const auto &entry : split(ini.GetValue("Terminal", "env", ""), ';')) {
      string kv = trim(entry);
      if (kv.empty()) {
        continue;
      }
      if (kv.find('=') == string::npos || kv[0] == '=') {
        throw std::runtime_error("Invalid terminal env entry: " + kv);
      }
      term.env.push_back(kv);
    }
  }
  term.maxSessionsPerUser = int(getInt(ini, "Terminal", "max_sessions_per_user",
                                       term.maxSessionsPerUser));
  term.bufferSize = size_t(
      getInt(ini, "Terminal", "buffer_size", int64_t(term.bufferSize)));
  term.sessionTtlSeconds =
      getInt(ini, "Terminal", "session_ttl", term.sessionTtlSeconds);
  term.sweepIntervalSeconds =
      getInt(ini, "Terminal", "sweep_interval", term.sweepIntervalSeconds);
  term.subscriberCapacity = size_t(getInt(
      ini, "Terminal", "subscriber_capacity", int64_t(term.subscriberCapacity)));
  requirePositive(term.maxSessionsPerUser, "max_sessions_per_user");
  requirePositive(int64_t(term.bufferSize), "buffer_size");
  requirePositive(term.sessionTtlSeconds, "session_ttl");
  requirePositive(term.sweepIntervalSeconds, "sweep_interval");
  requirePositive(int64_t(term.subscriberCapacity), "subscriber_capacity");

  DebugConfig &debug = config.debug;
  debug.verbose = int(getInt(ini, "Debug", "verbose", debug.verbose));
  debug.silent = getInt(ini, "Debug", "silent", 0) != 0;
  int64_t logSize = getInt(ini, "Debug", "logsize", 0);
  if (logSize > 0) {
    debug.logSize = to_string(logSize);
  }
  debug.logDir = getString(ini, "Debug", "logdir", debug.logDir);

  return config;
}

void ServerConfig::loadIniFile(const string &path, CSimpleIniA *ini) {
  SI_Error rc = ini->LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }
}

string ServerConfig::defaultConfigPath() {
  return sago::getConfigHome() + "/rxserver/rxserver.cfg";
}
}  // namespace rx
