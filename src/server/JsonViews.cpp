#include "JsonViews.hpp"

namespace rx {
string statusName(ExecutionStatus status) {
  switch (status) {
    case PENDING:
      return "pending";
    case RUNNING:
      return "running";
    case SUCCESS:
      return "success";
    case FAILED:
      return "failed";
    case TIMEOUT:
      return "timeout";
  }
  return "unknown";
}

json commandToJson(const Command &command) {
  json j;
  j["id"] = command.id();
  j["name"] = command.name();
  j["description"] = command.description();
  j["command"] = command.command();
  j["working_dir"] = command.working_dir();
  j["timeout_seconds"] = command.timeout_seconds();
  j["sort_order"] = command.sort_order();
  return j;
}

json executionToJson(const Execution &execution, bool withOutput) {
  json j;
  j["id"] = execution.id();
  j["command_id"] = execution.command_id();
  j["user_id"] = execution.user_id();
  j["status"] = statusName(execution.status());
  if (execution.has_exit_code()) {
    j["exit_code"] = execution.exit_code();
  } else {
    j["exit_code"] = nullptr;
  }
  j["output_truncated"] = execution.output_truncated();
  if (withOutput) {
    j["output"] = execution.output();
  }
  j["created_at"] = formatTimestamp(execution.created_at_ms());
  if (execution.has_started_at_ms()) {
    j["started_at"] = formatTimestamp(execution.started_at_ms());
  } else {
    j["started_at"] = nullptr;
  }
  if (execution.has_finished_at_ms()) {
    j["finished_at"] = formatTimestamp(execution.finished_at_ms());
  } else {
    j["finished_at"] = nullptr;
  }
  return j;
}

json executionSummaryToJson(const ExecutionSummary &summary) {
  json j = executionToJson(summary.execution(), false);
  j["command_name"] = summary.command_name();
  return j;
}

json sessionInfoToJson(const TerminalSessionInfo &info) {
  json j;
  j["id"] = info.id();
  j["name"] = info.name();
  j["user_id"] = info.user_id();
  j["username"] = info.username();
  j["created_at"] = formatTimestamp(info.created_at_ms());
  j["last_activity"] = formatTimestamp(info.last_activity_ms());
  j["client_count"] = info.client_count();
  j["is_active"] = info.is_active();
  return j;
}

string dumpJson(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace rx
