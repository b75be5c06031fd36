#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "sync_engine.hpp"
#include "sync_scheduler.hpp"

namespace purchase::cache {
class ReferenceCacheManager;
}

namespace purchase::sync {

/*
  Background worker draining the SyncScheduler.

  Executes:
      kPushPurchases        -> SyncEngine::Run
      kRefreshReferenceData -> ReferenceCacheManager::RefreshAllIfStale
  Stop() raises the engine's cancel flag, so a running sync ends after
  the header in flight.
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<SyncScheduler> scheduler, std::shared_ptr<SyncEngine> engine,
             std::shared_ptr<cache::ReferenceCacheManager> cache);
  ~SyncWorker();

  void Start();
  void Stop();

  std::optional<SyncReport> LastReport() const;

 private:
  void Run();
  void Execute(const SyncTask& task);

  std::shared_ptr<SyncScheduler>                scheduler_;
  std::shared_ptr<SyncEngine>                   engine_;
  std::shared_ptr<cache::ReferenceCacheManager> cache_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> cancel_{false};

  mutable std::mutex        report_mutex_;
  std::optional<SyncReport> last_report_;
};

} // namespace purchase::sync
