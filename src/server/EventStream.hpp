#ifndef __RX_EVENT_STREAM__
#define __RX_EVENT_STREAM__

#include "Channel.hpp"
#include "ExecutionEngine.hpp"
#include "Headers.hpp"
#include "TerminalSession.hpp"

namespace rx {
/**
 * @brief One Server-Sent Events frame. A frame without an event name is
 * written as a comment.
 */
struct EventFrame {
  string event;
  string data;

  static EventFrame comment(const string &text) {
    EventFrame frame;
    frame.data = text;
    return frame;
  }

  static EventFrame named(const string &event, const string &data) {
    EventFrame frame;
    frame.event = event;
    frame.data = data;
    return frame;
  }

  bool isComment() const { return event.empty(); }

  /** @brief Wire form; multi-line data becomes several `data:` lines. */
  string format() const;
};

/**
 * @brief Turns a live output source into a sequence of SSE frames.
 *
 * Independent of the HTTP library so the framing can be tested directly.
 */
class EventStream {
 public:
  virtual ~EventStream() {}

  /**
   * @brief Appends the next frames to @p frames, waiting up to @p wait for
   * new output. A keepalive comment is produced when nothing arrived.
   * @return false once the final frame has been produced.
   */
  virtual bool next(vector<EventFrame> *frames,
                    std::chrono::milliseconds wait) = 0;

  /** @brief Releases the underlying subscription. Idempotent. */
  virtual void close() = 0;
};

/**
 * @brief `output` frames (replay first), then one `complete` frame.
 */
class ExecutionEventStream : public EventStream {
 public:
  /** @throws NotFoundError */
  ExecutionEventStream(shared_ptr<ExecutionEngine> _engine,
                       const string &_executionId);

  virtual ~ExecutionEventStream() { close(); }

  virtual bool next(vector<EventFrame> *frames,
                    std::chrono::milliseconds wait);

  virtual void close();

 protected:
  EventFrame completeFrame();

  shared_ptr<ExecutionEngine> engine;
  string executionId;
  OutputAttachment attachment;
  bool started;
  bool ended;
  bool closed;
};

/**
 * @brief `session_info`, `replay`, then `output` frames until `closed`.
 */
class TerminalEventStream : public EventStream {
 public:
  /** @throws SessionClosedError */
  TerminalEventStream(shared_ptr<TerminalSession> _session,
                      const string &_clientId);

  virtual ~TerminalEventStream() { close(); }

  virtual bool next(vector<EventFrame> *frames,
                    std::chrono::milliseconds wait);

  virtual void close();

  const string &getClientId() const { return clientId; }

 protected:
  shared_ptr<TerminalSession> session;
  string clientId;
  TerminalSubscription subscription;
  bool started;
  bool ended;
  bool closed;
};
}  // namespace rx

#endif  // __RX_EVENT_STREAM__
