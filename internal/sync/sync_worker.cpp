#include "sync_worker.hpp"

#include "internal/cache/reference_cache_manager.hpp"
#include "internal/observability/logging.hpp"

namespace purchase::sync {

SyncWorker::SyncWorker(std::shared_ptr<SyncScheduler> scheduler, std::shared_ptr<SyncEngine> engine,
                       std::shared_ptr<cache::ReferenceCacheManager> cache)
    : scheduler_(std::move(scheduler)), engine_(std::move(engine)), cache_(std::move(cache)) {
}

SyncWorker::~SyncWorker() {
  Stop();
}

void SyncWorker::Start() {
  if (running_.exchange(true)) return;
  cancel_ = false;
  thread_ = std::thread(&SyncWorker::Run, this);
}

void SyncWorker::Stop() {
  cancel_ = true;
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

std::optional<SyncReport> SyncWorker::LastReport() const {
  std::lock_guard<std::mutex> lock(report_mutex_);
  return last_report_;
}

void SyncWorker::Run() {
  while (running_) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      Execute(*task);
    } catch (const std::exception& e) {
      PURCHASE_LOG_ERROR("sync worker task failed", {observability::StringField("error", e.what())});
    }
  }
}

void SyncWorker::Execute(const SyncTask& task) {
  switch (task.kind) {
    case SyncTask::Kind::kPushPurchases: {
      auto report = engine_->Run(&cancel_);
      if (report.auth_required) {
        PURCHASE_LOG_WARN("sync needs a fresh login; pending purchases stay queued locally");
      }
      std::lock_guard<std::mutex> lock(report_mutex_);
      last_report_ = std::move(report);
      break;
    }
    case SyncTask::Kind::kRefreshReferenceData: {
      if (!cache_) break;
      auto results = task.force ? cache_->RefreshAllIfStale(std::chrono::milliseconds(0)) : cache_->RefreshAllIfStale();
      for (const auto& r : results) {
        PURCHASE_LOG_DEBUG("reference refresh", {observability::StringField("kind", db::model::ToString(r.kind)),
                                                 observability::StringField("outcome", cache::ToString(r.outcome))});
      }
      break;
    }
  }
}

} // namespace purchase::sync
