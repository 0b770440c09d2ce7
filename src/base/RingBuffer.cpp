#include "RingBuffer.hpp"

namespace rx {
RingBuffer::RingBuffer(size_t capacity)
    : buffer(capacity), writePos(0), start(0), full(false) {
  if (capacity == 0) {
    throw std::runtime_error("RingBuffer capacity must be positive");
  }
}

void RingBuffer::write(const char *data, size_t length) {
  lock_guard<std::mutex> guard(mutex);
  const size_t cap = buffer.size();
  if (length >= cap) {
    // Only the tail survives, so the buffer restarts aligned at zero
    memcpy(&buffer[0], data + (length - cap), cap);
    writePos = 0;
    start = 0;
    full = true;
    return;
  }

  size_t firstPart = std::min(length, cap - writePos);
  memcpy(&buffer[writePos], data, firstPart);
  if (firstPart < length) {
    memcpy(&buffer[0], data + firstPart, length - firstPart);
  }

  size_t used = full ? cap : (writePos + cap - start) % cap;
  writePos = (writePos + length) % cap;
  if (used + length >= cap) {
    full = true;
    start = writePos;
  }
}

string RingBuffer::readAll() const {
  lock_guard<std::mutex> guard(mutex);
  const size_t cap = buffer.size();
  if (!full) {
    return string(&buffer[start], writePos - start);
  }
  string out;
  out.reserve(cap);
  out.append(&buffer[start], cap - start);
  out.append(&buffer[0], start);
  return out;
}

size_t RingBuffer::size() const {
  lock_guard<std::mutex> guard(mutex);
  if (full) {
    return buffer.size();
  }
  return writePos - start;
}
}  // namespace rx
