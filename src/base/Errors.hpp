#ifndef __RX_ERRORS__
#define __RX_ERRORS__

#include "Headers.hpp"

namespace rx {
/**
 * @brief Thrown when a session, execution or command id is unknown.
 */
class NotFoundError : public std::runtime_error {
 public:
  NotFoundError(const string &kind, const string &id)
      : std::runtime_error(kind + " not found: " + id), kind(kind), id(id) {}

  const string &getKind() const { return kind; }
  const string &getId() const { return id; }

 protected:
  string kind;
  string id;
};

/** @brief A user already holds the maximum number of live sessions. */
class QuotaExceededError : public std::runtime_error {
 public:
  explicit QuotaExceededError(const string &what)
      : std::runtime_error(what) {}
};

/** @brief A shell or command process could not be started. */
class SpawnFailedError : public std::runtime_error {
 public:
  explicit SpawnFailedError(const string &what) : std::runtime_error(what) {}
};

/** @brief Input was sent to a session after it closed. */
class SessionClosedError : public std::runtime_error {
 public:
  explicit SessionClosedError(const string &sessionId)
      : std::runtime_error("Session is closed: " + sessionId) {}
};
}  // namespace rx

#endif  // __RX_ERRORS__
