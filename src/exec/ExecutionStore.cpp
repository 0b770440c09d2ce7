#include "ExecutionStore.hpp"

#include "Errors.hpp"

namespace rx {
void InMemoryExecutionStore::insert(const Execution &execution) {
  lock_guard<std::mutex> guard(storeMutex);
  if (executions.find(execution.id()) != executions.end()) {
    throw std::runtime_error("Duplicate execution id: " + execution.id());
  }
  executions[execution.id()] = execution;
  order.push_back(execution.id());
  evictLocked();
}

void InMemoryExecutionStore::evictLocked() {
  if (historyLimit == 0) {
    return;
  }
  // Pending and running records are never evicted
  auto it = order.begin();
  while (it != order.end() && executions.size() > historyLimit) {
    auto record = executions.find(*it);
    if (record != executions.end() && !record->second.has_finished_at_ms()) {
      ++it;
      continue;
    }
    VLOG(1) << "Evicting execution " << *it << " from history";
    if (record != executions.end()) {
      executions.erase(record);
    }
    it = order.erase(it);
  }
}

optional<Execution> InMemoryExecutionStore::get(const string &id) {
  lock_guard<std::mutex> guard(storeMutex);
  auto it = executions.find(id);
  if (it == executions.end()) {
    return nullopt;
  }
  return it->second;
}

void InMemoryExecutionStore::update(const Execution &execution) {
  lock_guard<std::mutex> guard(storeMutex);
  auto it = executions.find(execution.id());
  if (it == executions.end()) {
    throw NotFoundError("execution", execution.id());
  }
  it->second = execution;
}

vector<Execution> InMemoryExecutionStore::list(int limit, int offset) {
  lock_guard<std::mutex> guard(storeMutex);
  vector<Execution> result;
  if (limit <= 0 || offset < 0) {
    return result;
  }
  int skipped = 0;
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    if (skipped < offset) {
      skipped++;
      continue;
    }
    result.push_back(executions[*it]);
    if (int(result.size()) >= limit) {
      break;
    }
  }
  return result;
}

size_t InMemoryExecutionStore::size() {
  lock_guard<std::mutex> guard(storeMutex);
  return executions.size();
}
}  // namespace rx
