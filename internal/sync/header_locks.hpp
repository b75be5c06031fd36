#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace purchase::sync {

class HeaderLocks;

/*
  Exclusive hold on one header. Releasing the last hold on an id drops
  its map entry.
*/
class HeaderLock {
 public:
  HeaderLock(HeaderLock&& other) noexcept;
  HeaderLock& operator=(HeaderLock&&) = delete;
  HeaderLock(const HeaderLock&)       = delete;
  ~HeaderLock();

 private:
  friend class HeaderLocks;
  HeaderLock(HeaderLocks* owner, std::int64_t local_id, std::shared_ptr<std::mutex> mutex);

  HeaderLocks*                 owner_;
  std::int64_t                 local_id_;
  std::shared_ptr<std::mutex>  mutex_;
  std::unique_lock<std::mutex> lock_;
};

/*
  One mutex per local purchase id, shared by the sync engine and the
  purchase service so a push and a local edit of the same header never
  interleave. Entries exist only while someone holds or waits on them.
*/
class HeaderLocks {
 public:
  HeaderLock Lock(std::int64_t local_id);

  std::size_t Size() const;

 private:
  friend class HeaderLock;

  std::shared_ptr<std::mutex> Acquire(std::int64_t local_id);
  void                        Release(std::int64_t local_id, std::shared_ptr<std::mutex> mutex);

  mutable std::mutex                                             guard_;
  std::unordered_map<std::int64_t, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace purchase::sync
