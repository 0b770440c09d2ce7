#include "EventStream.hpp"

#include "JsonViews.hpp"

namespace rx {
string EventFrame::format() const {
  string out;
  vector<string> lines = split(data, '\n');
  if (lines.empty()) {
    lines.push_back("");
  }
  if (isComment()) {
    for (const auto &line : lines) {
      out += ": " + line + "\n";
    }
    return out + "\n";
  }
  out += "event: " + event + "\n";
  for (const auto &line : lines) {
    out += "data: " + line + "\n";
  }
  return out + "\n";
}

ExecutionEventStream::ExecutionEventStream(shared_ptr<ExecutionEngine> _engine,
                                           const string &_executionId)
    : engine(_engine),
      executionId(_executionId),
      attachment(_engine->attach(_executionId)),
      started(false),
      ended(false),
      closed(false) {}

EventFrame ExecutionEventStream::completeFrame() {
  Execution execution = engine->getExecutionById(executionId);
  json j;
  j["status"] = statusName(execution.status());
  if (execution.has_exit_code()) {
    j["exit_code"] = execution.exit_code();
  } else {
    j["exit_code"] = nullptr;
  }
  j["truncated"] = execution.output_truncated();
  return EventFrame::named("complete", dumpJson(j));
}

bool ExecutionEventStream::next(vector<EventFrame> *frames,
                                std::chrono::milliseconds wait) {
  if (ended) {
    return false;
  }
  if (!started) {
    started = true;
    if (!attachment.replay.empty()) {
      frames->push_back(
          EventFrame::named("output", encodeBase64(attachment.replay)));
      attachment.replay.clear();
    }
    if (attachment.finished || !attachment.channel) {
      frames->push_back(completeFrame());
      ended = true;
      return false;
    }
    return true;
  }

  string chunk;
  switch (attachment.channel->receive(&chunk, wait)) {
    case Channel::VALUE:
      frames->push_back(EventFrame::named("output", encodeBase64(chunk)));
      return true;
    case Channel::TIMEOUT:
      frames->push_back(EventFrame::comment("keepalive"));
      return true;
    case Channel::CLOSED:
      break;
  }
  frames->push_back(completeFrame());
  ended = true;
  return false;
}

void ExecutionEventStream::close() {
  if (closed) {
    return;
  }
  closed = true;
  if (attachment.channel) {
    engine->detach(executionId, attachment.channel);
  }
}

TerminalEventStream::TerminalEventStream(shared_ptr<TerminalSession> _session,
                                         const string &_clientId)
    : session(_session),
      clientId(_clientId),
      subscription(_session->subscribe(_clientId)),
      started(false),
      ended(false),
      closed(false) {}

bool TerminalEventStream::next(vector<EventFrame> *frames,
                               std::chrono::milliseconds wait) {
  if (ended) {
    return false;
  }
  if (!started) {
    started = true;
    json info = sessionInfoToJson(session->info());
    info["client_id"] = clientId;
    frames->push_back(EventFrame::named("session_info", dumpJson(info)));
    if (!subscription.replay.empty()) {
      frames->push_back(
          EventFrame::named("replay", encodeBase64(subscription.replay)));
      subscription.replay.clear();
    }
    return true;
  }

  string chunk;
  switch (subscription.channel->receive(&chunk, wait)) {
    case Channel::VALUE:
      frames->push_back(EventFrame::named("output", encodeBase64(chunk)));
      return true;
    case Channel::TIMEOUT:
      frames->push_back(EventFrame::comment("keepalive"));
      return true;
    case Channel::CLOSED:
      break;
  }
  json j;
  j["session_id"] = session->getId();
  frames->push_back(EventFrame::named("closed", dumpJson(j)));
  ended = true;
  return false;
}

void TerminalEventStream::close() {
  if (closed) {
    return;
  }
  closed = true;
  session->unsubscribe(clientId, subscription.channel);
}
}  // namespace rx
