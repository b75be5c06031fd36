#include "header_locks.hpp"

#include <utility>

namespace purchase::sync {

HeaderLock::HeaderLock(HeaderLocks* owner, std::int64_t local_id, std::shared_ptr<std::mutex> mutex)
    : owner_(owner), local_id_(local_id), mutex_(std::move(mutex)), lock_(*mutex_) {}

HeaderLock::HeaderLock(HeaderLock&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)),
      local_id_(other.local_id_),
      mutex_(std::move(other.mutex_)),
      lock_(std::move(other.lock_)) {}

HeaderLock::~HeaderLock() {
  if (!owner_) return;
  lock_.unlock();
  owner_->Release(local_id_, std::move(mutex_));
}

std::shared_ptr<std::mutex> HeaderLocks::Acquire(std::int64_t local_id) {
  std::lock_guard<std::mutex> lock(guard_);
  auto&                       entry = mutexes_[local_id];
  if (!entry) entry = std::make_shared<std::mutex>();
  return entry;
}

void HeaderLocks::Release(std::int64_t local_id, std::shared_ptr<std::mutex> mutex) {
  std::lock_guard<std::mutex> lock(guard_);
  auto                        it = mutexes_.find(local_id);
  // map + this hold; any other count is a waiter that still needs the entry
  if (it != mutexes_.end() && it->second == mutex && mutex.use_count() == 2) mutexes_.erase(it);
}

HeaderLock HeaderLocks::Lock(std::int64_t local_id) {
  return HeaderLock(this, local_id, Acquire(local_id));
}

std::size_t HeaderLocks::Size() const {
  std::lock_guard<std::mutex> lock(guard_);
  return mutexes_.size();
}

} // namespace purchase::sync
