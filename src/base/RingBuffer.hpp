#ifndef __RX_RING_BUFFER__
#define __RX_RING_BUFFER__

#include "Headers.hpp"

namespace rx {
/**
 * @brief Fixed-capacity circular byte store used for output replay.
 *
 * Once full, every new byte evicts the single oldest byte. All methods are
 * safe to call from multiple threads.
 */
class RingBuffer {
 public:
  explicit RingBuffer(size_t capacity);

  /** @brief Appends @p data, evicting the oldest bytes if needed. */
  void write(const char *data, size_t length);

  void write(const string &data) { write(data.data(), data.length()); }

  /** @brief Copy of the retained bytes, oldest first. */
  string readAll() const;

  /** @brief Number of bytes currently retained. */
  size_t size() const;

  size_t capacity() const { return buffer.size(); }

 protected:
  mutable std::mutex mutex;
  vector<char> buffer;
  size_t writePos;
  size_t start;
  bool full;
};
}  // namespace rx

#endif  // __RX_RING_BUFFER__
