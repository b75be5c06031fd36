#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "sync_task.hpp"

namespace purchase::sync {

/*
  Thread-safe blocking queue for the sync worker. A task equal to one
  already waiting is dropped.
*/
class SyncScheduler {
 public:
  // false when coalesced into a pending task or after Shutdown
  bool Enqueue(const SyncTask& task);

  // blocking wait
  std::optional<SyncTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<SyncTask>    queue_;
  bool                    shutdown_ = false;
};

} // namespace purchase::sync
