#include "internal/runtime/work_queue.hpp"

#include <utility>

namespace resolver::runtime {

void WorkQueue::Enqueue(WorkItem item) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(item));
  }
  cv_.notify_one();
}

std::optional<WorkItem> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  WorkItem item = std::move(queue_.front());
  queue_.pop();
  return item;
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void WorkQueue::Reopen() {
  std::lock_guard lock(mutex_);
  shutdown_ = false;
}

} // namespace resolver::runtime
