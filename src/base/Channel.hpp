#ifndef __RX_CHANNEL__
#define __RX_CHANNEL__

#include "Headers.hpp"

namespace rx {
/**
 * @brief Bounded queue of output chunks delivered to one viewer.
 *
 * Producers never block: trySend() drops the chunk when the queue is full
 * and counts the loss. The single consumer waits in receive() with a
 * timeout so it can notice disconnects.
 */
class Channel {
 public:
  enum ReceiveResult { VALUE = 0, TIMEOUT = 1, CLOSED = 2 };

  explicit Channel(size_t capacity)
      : capacity(capacity), closed(false), droppedCount(0) {}

  bool trySend(const string &chunk) {
    lock_guard<std::mutex> guard(mutex);
    if (closed) {
      return false;
    }
    if (queue.size() >= capacity) {
      droppedCount++;
      return false;
    }
    queue.push_back(chunk);
    cv.notify_one();
    return true;
  }

  /**
   * @brief Pops the next chunk into @p out.
   *
   * Chunks queued before close() are still handed out; CLOSED is only
   * returned once the queue is drained.
   */
  ReceiveResult receive(string *out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, timeout, [this] { return closed || !queue.empty(); });
    if (!queue.empty()) {
      *out = std::move(queue.front());
      queue.pop_front();
      return VALUE;
    }
    return closed ? CLOSED : TIMEOUT;
  }

  void close() {
    lock_guard<std::mutex> guard(mutex);
    closed = true;
    cv.notify_all();
  }

  bool isClosed() const {
    lock_guard<std::mutex> guard(mutex);
    return closed;
  }

  int64_t dropped() const {
    lock_guard<std::mutex> guard(mutex);
    return droppedCount;
  }

  size_t pending() const {
    lock_guard<std::mutex> guard(mutex);
    return queue.size();
  }

 protected:
  mutable std::mutex mutex;
  std::condition_variable cv;
  std::deque<string> queue;
  size_t capacity;
  bool closed;
  int64_t droppedCount;
};
}  // namespace rx

#endif  // __RX_CHANNEL__
