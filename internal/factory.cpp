#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/curl_transport.hpp"
#include "internal/util/time.hpp"

namespace purchase::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const purchase::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (!database.has_sqlite() || database.sqlite().path().empty()) {
    throw std::runtime_error("database.sqlite.path is required");
  }

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
  const int applied = db::sqlite::MigrateSchema(*sqlite_db);
  PURCHASE_LOG_INFO("local store ready", {observability::StringField("path", sqlite_db->Path()),
                                          observability::IntField("migrations_applied", applied)});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

std::shared_ptr<net::ConnectivityProbe> BuildConnectivityProbe(const purchase::runtime::config::RuntimeConfig& config) {
  const auto& connectivity = config.connectivity();
  if (connectivity.force_offline()) {
    PURCHASE_LOG_WARN("connectivity forced offline by configuration");
    return std::make_shared<net::StaticConnectivityProbe>(false);
  }

  const std::string url = connectivity.probe_url().empty() ? config.remote().base_url() : connectivity.probe_url();
  auto              timeout = util::FromProto(connectivity.probe_timeout());
  if (timeout.count() <= 0) timeout = std::chrono::seconds(5);
  return std::make_shared<net::CurlConnectivityProbe>(url, timeout);
}

} // namespace

remote::ApiSettings ApiSettingsFromConfig(const purchase::runtime::config::RuntimeConfig& config) {
  const auto& r = config.remote();

  remote::ApiSettings settings;
  settings.base_url = r.base_url();
  if (!r.api_prefix().empty()) settings.api_prefix = r.api_prefix();
  if (r.has_connect_timeout()) settings.connect_timeout = util::FromProto(r.connect_timeout());
  if (r.has_request_timeout()) settings.request_timeout = util::FromProto(r.request_timeout());
  if (r.per_page() > 0) settings.per_page = r.per_page();
  return settings;
}

cache::CacheMaxAges CacheMaxAgesFromConfig(const purchase::runtime::config::RuntimeConfig& config) {
  const auto& c = config.cache();

  cache::CacheMaxAges ages;
  if (c.has_supplier_max_age()) ages.suppliers = util::FromProto(c.supplier_max_age());
  if (c.has_product_max_age()) ages.products = util::FromProto(c.product_max_age());
  if (c.has_location_max_age()) ages.locations = util::FromProto(c.location_max_age());
  return ages;
}

/*
    Build full application dependency graph
*/
Application Build(const purchase::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Local store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Remote access
  // ------------------------------------------------------------------
  app.transport    = std::make_shared<remote::CurlTransport>();
  app.connectivity = BuildConnectivityProbe(config);
  app.auth         = std::make_shared<net::StaticTokenAuthProvider>(config.auth().bearer_token(), config.auth().bearer_token_env());
  app.api          = std::make_shared<remote::PurchaseApi>(ApiSettingsFromConfig(config), app.transport, app.auth);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.header_locks    = std::make_shared<sync::HeaderLocks>();
  app.last_sync       = std::make_shared<cache::LastSyncStore>(app.repository);
  app.reference_cache = std::make_shared<cache::ReferenceCacheManager>(app.repository, app.last_sync, app.api, app.connectivity,
                                                                       app.auth, CacheMaxAgesFromConfig(config));
  app.sync_engine =
      std::make_shared<sync::SyncEngine>(app.repository, app.api, app.connectivity, app.auth, app.header_locks);
  app.view_builder = std::make_shared<view::PurchaseViewBuilder>(app.repository, app.api, app.reference_cache, app.connectivity,
                                                                 app.auth, app.header_locks);
  app.purchases =
      std::make_shared<core::PurchaseService>(app.repository, app.api, app.connectivity, app.auth, app.header_locks);

  // ------------------------------------------------------------------
  // Background sync
  // ------------------------------------------------------------------
  app.sync_scheduler = std::make_shared<sync::SyncScheduler>();
  app.sync_worker    = std::make_shared<sync::SyncWorker>(app.sync_scheduler, app.sync_engine, app.reference_cache);

  return app;
}

} // namespace purchase::factory
