#ifndef __RX_EXECUTION_STORE__
#define __RX_EXECUTION_STORE__

#include "Headers.hpp"

namespace rx {
/**
 * @brief Persistence for execution records. Always hands out copies.
 */
class ExecutionStore {
 public:
  virtual ~ExecutionStore() {}

  /** @throws std::runtime_error if the id is already present. */
  virtual void insert(const Execution &execution) = 0;

  virtual optional<Execution> get(const string &id) = 0;

  /** @throws NotFoundError */
  virtual void update(const Execution &execution) = 0;

  /** @brief Newest first. */
  virtual vector<Execution> list(int limit, int offset) = 0;
};

/**
 * @brief Process-local store. Past @p historyLimit records the oldest
 * finished ones are evicted; 0 keeps everything.
 */
class InMemoryExecutionStore : public ExecutionStore {
 public:
  explicit InMemoryExecutionStore(size_t _historyLimit = 0)
      : historyLimit(_historyLimit) {}

  virtual void insert(const Execution &execution);

  virtual optional<Execution> get(const string &id);

  virtual void update(const Execution &execution);

  virtual vector<Execution> list(int limit, int offset);

  size_t size();

 protected:
  // Caller holds storeMutex
  void evictLocked();

  size_t historyLimit;
  std::mutex storeMutex;
  unordered_map<string, Execution> executions;
  // Insertion order, oldest first
  vector<string> order;
};
}  // namespace rx

#endif  // __RX_EXECUTION_STORE__
