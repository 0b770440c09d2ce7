#include "OutputAccumulator.hpp"

namespace rx {
OutputAccumulator::OutputAccumulator(size_t _maxSize)
    : maxSize(_maxSize), truncated(false), finished(false) {}

void OutputAccumulator::append(const char *chunk, size_t length) {
  lock_guard<std::mutex> guard(mutex);
  if (finished || length == 0) {
    return;
  }
  size_t room = maxSize - data.length();
  size_t accepted = std::min(room, length);
  if (accepted < length) {
    if (!truncated) {
      VLOG(1) << "Output reached " << maxSize << " bytes, discarding the rest";
    }
    truncated = true;
  }
  if (accepted == 0) {
    return;
  }
  data.append(chunk, accepted);
  string live(chunk, accepted);
  for (auto &viewer : viewers) {
    viewer->trySend(live);
  }
}

OutputAttachment OutputAccumulator::attach() {
  lock_guard<std::mutex> guard(mutex);
  OutputAttachment attachment;
  attachment.replay = data;
  attachment.finished = finished;
  if (!finished) {
    // Viewers never miss a chunk; total queued bytes stay under maxSize
    attachment.channel.reset(
        new Channel(std::numeric_limits<size_t>::max()));
    viewers.push_back(attachment.channel);
  }
  return attachment;
}

void OutputAccumulator::detach(const shared_ptr<Channel> &channel) {
  if (!channel) {
    return;
  }
  lock_guard<std::mutex> guard(mutex);
  viewers.erase(std::remove(viewers.begin(), viewers.end(), channel),
                viewers.end());
  channel->close();
}

void OutputAccumulator::finish() {
  lock_guard<std::mutex> guard(mutex);
  finished = true;
  for (auto &viewer : viewers) {
    viewer->close();
  }
  viewers.clear();
}

string OutputAccumulator::output() const {
  lock_guard<std::mutex> guard(mutex);
  return data;
}

bool OutputAccumulator::isTruncated() const {
  lock_guard<std::mutex> guard(mutex);
  return truncated;
}

bool OutputAccumulator::isFinished() const {
  lock_guard<std::mutex> guard(mutex);
  return finished;
}

size_t OutputAccumulator::viewerCount() const {
  lock_guard<std::mutex> guard(mutex);
  return viewers.size();
}
}  // namespace rx
