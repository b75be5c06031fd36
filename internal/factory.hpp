#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/last_sync_store.hpp"
#include "internal/cache/reference_cache_manager.hpp"
#include "internal/core/purchase_service.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/net/probes.hpp"
#include "internal/remote/http_transport.hpp"
#include "internal/remote/purchase_api.hpp"
#include "internal/sync/header_locks.hpp"
#include "internal/sync/sync_engine.hpp"
#include "internal/sync/sync_scheduler.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/view/purchase_view_builder.hpp"

namespace purchase::factory {

/*
  Application

  Owns all long-lived components. Everything here lives for the
  lifetime of the process. The sync worker is built but not started.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<remote::HttpTransport>  transport;
  std::shared_ptr<net::ConnectivityProbe> connectivity;
  std::shared_ptr<net::AuthProvider>      auth;
  std::shared_ptr<remote::PurchaseApi>    api;

  std::shared_ptr<sync::HeaderLocks>            header_locks;
  std::shared_ptr<cache::LastSyncStore>         last_sync;
  std::shared_ptr<cache::ReferenceCacheManager> reference_cache;
  std::shared_ptr<sync::SyncEngine>             sync_engine;
  std::shared_ptr<view::PurchaseViewBuilder>    view_builder;
  std::shared_ptr<core::PurchaseService>        purchases;

  std::shared_ptr<sync::SyncScheduler> sync_scheduler;
  std::shared_ptr<sync::SyncWorker>    sync_worker;
};

/*
  Build

  Composition root: the only place that knows the concrete store,
  transport and probe types. Opens the database and brings its schema to
  the current version before anything else touches it.
*/
Application Build(const purchase::runtime::config::RuntimeConfig& config);

remote::ApiSettings        ApiSettingsFromConfig(const purchase::runtime::config::RuntimeConfig& config);
cache::CacheMaxAges        CacheMaxAgesFromConfig(const purchase::runtime::config::RuntimeConfig& config);

} // namespace purchase::factory
