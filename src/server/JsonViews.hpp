#ifndef __RX_JSON_VIEWS__
#define __RX_JSON_VIEWS__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace rx {
/**
 * @brief JSON projections of the records served over HTTP.
 *
 * Absent optional fields become null; timestamps are RFC 3339 strings.
 */
json commandToJson(const Command &command);

json executionToJson(const Execution &execution, bool withOutput);

json executionSummaryToJson(const ExecutionSummary &summary);

json sessionInfoToJson(const TerminalSessionInfo &info);

string statusName(ExecutionStatus status);

/** @brief Dumps @p j, replacing invalid UTF-8 from command output. */
string dumpJson(const json &j);
}  // namespace rx

#endif  // __RX_JSON_VIEWS__
