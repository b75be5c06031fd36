#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

using purchase::sync::SyncTask;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: purchase-syncd <config.yaml> OR purchase-syncd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = purchase::config::ConfigLoader::LoadFromYaml(config_path);

    purchase::observability::InitializeTracing(config);
    purchase::observability::InitializeMetrics(config);
    purchase::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = purchase::factory::Build(config);

    const auto interval         = purchase::util::FromProto(config.sync().interval());
    const bool refresh_caches   = config.sync().refresh_reference_data();

    // Register signal handlers before starting the worker to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.sync_worker->Start();
    PURCHASE_LOG_INFO("purchase sync daemon started",
                      {purchase::observability::StringField("base_url", config.remote().base_url()),
                       purchase::observability::IntField("interval_s", std::chrono::duration_cast<std::chrono::seconds>(interval).count())});

    auto next_run = std::chrono::steady_clock::now();
    while (g_running) {
      if (std::chrono::steady_clock::now() >= next_run) {
        if (refresh_caches) app.sync_scheduler->Enqueue(SyncTask{SyncTask::Kind::kRefreshReferenceData, false});
        app.sync_scheduler->Enqueue(SyncTask{SyncTask::Kind::kPushPurchases, false});
        next_run = std::chrono::steady_clock::now() + interval;
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    PURCHASE_LOG_INFO("Shutting down purchase sync daemon");

    app.sync_worker->Stop();
    purchase::observability::ShutdownLogging();
    purchase::observability::ShutdownMetrics();
    purchase::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    PURCHASE_LOG_ERROR("Fatal error", {purchase::observability::StringField("error", e.what())});
    purchase::observability::ShutdownLogging();
    purchase::observability::ShutdownMetrics();
    purchase::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
