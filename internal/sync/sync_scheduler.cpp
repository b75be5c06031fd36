#include "sync_scheduler.hpp"

#include <algorithm>

namespace purchase::sync {

bool SyncScheduler::Enqueue(const SyncTask& task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;

    auto same = std::find_if(queue_.begin(), queue_.end(),
                             [&](const SyncTask& queued) { return queued.kind == task.kind && queued.force == task.force; });
    if (same != queue_.end()) return false;

    queue_.push_back(task);
  }
  cv_.notify_one();
  return true;
}

std::optional<SyncTask> SyncScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  SyncTask task = queue_.front();
  queue_.pop_front();
  return task;
}

void SyncScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t SyncScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace purchase::sync
