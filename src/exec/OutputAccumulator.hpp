#ifndef __RX_OUTPUT_ACCUMULATOR__
#define __RX_OUTPUT_ACCUMULATOR__

#include "Channel.hpp"
#include "Headers.hpp"

namespace rx {
/**
 * @brief Live view of an execution: what was captured so far and a feed
 * of what comes next.
 */
struct OutputAttachment {
  string replay;
  // Null when the output was already complete at attach time
  shared_ptr<Channel> channel;
  bool finished = false;
};

/**
 * @brief Capped output of one execution, shared with live viewers.
 *
 * One engine thread appends. Viewers attach under the same lock, so the
 * snapshot they get and the chunks later pushed to their channel neither
 * overlap nor leave a hole.
 */
class OutputAccumulator {
 public:
  explicit OutputAccumulator(size_t _maxSize);

  /**
   * @brief Keeps at most the configured maximum; anything past it is
   * discarded and marks the output truncated.
   */
  void append(const char *data, size_t length);

  void append(const string &data) { append(data.data(), data.length()); }

  OutputAttachment attach();

  void detach(const shared_ptr<Channel> &channel);

  /** @brief Ends every live feed. Later attaches get a finished snapshot. */
  void finish();

  string output() const;

  bool isTruncated() const;

  bool isFinished() const;

  size_t viewerCount() const;

 protected:
  mutable std::mutex mutex;
  size_t maxSize;
  string data;
  bool truncated;
  bool finished;
  vector<shared_ptr<Channel>> viewers;
};
}  // namespace rx

#endif  // __RX_OUTPUT_ACCUMULATOR__
