#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/draft_json.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/remote/remote_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using purchase::db::model::ReferenceKind;

static void Usage() {
  std::cout << "Usage:\n"
            << "  purchasectl <config.yaml> sync\n"
            << "  purchasectl <config.yaml> refresh [--force]\n"
            << "  purchasectl <config.yaml> list [status|all] [supplier_id] [page]\n"
            << "  purchasectl <config.yaml> search <suppliers|products|locations> [term]\n"
            << "  purchasectl <config.yaml> show <local_id>\n"
            << "  purchasectl <config.yaml> create <json|@file>\n"
            << "  purchasectl <config.yaml> delete <local_id>\n"
            << "  purchasectl <config.yaml> status <local_id> <ordered|pending|partial|received|cancelled>\n"
            << "  purchasectl <config.yaml> check-ref <supplier_id> <ref_no>\n"
            << "  purchasectl <config.yaml> reconcile <remote_id>...\n"
            << "  purchasectl <config.yaml> cache-stats\n"
            << "  purchasectl <config.yaml> clear-cache\n";
}

static void PrintLoginPrompt() {
  std::cerr << "Authentication failed. Please login again.\n";
}

static std::int64_t ParseId(const std::string& text) {
  std::size_t used = 0;
  long long   id   = 0;
  try {
    id = std::stoll(text, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used != text.size() || id <= 0) throw purchase::util::InvalidArgument("invalid id: " + text);
  return id;
}

static std::string ReadDraftArgument(const std::string& arg) {
  if (arg.empty() || arg[0] != '@') return arg;

  std::ifstream in(arg.substr(1));
  if (!in) throw purchase::util::InvalidArgument("cannot open " + arg.substr(1));
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static void PrintReport(const purchase::sync::SyncReport& report) {
  if (report.offline) {
    std::cout << "offline: nothing pushed\n";
    return;
  }
  std::cout << "attempted=" << report.attempted << " synced=" << report.synced << " failed=" << report.failed
            << (report.cancelled ? " cancelled" : "") << "\n";
  for (const auto& f : report.failures) {
    std::cout << "  purchase " << f.local_id << ": "
              << (f.kind ? purchase::remote::ToString(*f.kind) : "local") << ": " << f.message << "\n";
    for (const auto& [field, messages] : f.field_errors) {
      for (const auto& m : messages) std::cout << "    " << field << ": " << m << "\n";
    }
  }
}

static const char* KindArg(ReferenceKind kind) {
  return purchase::db::model::ToString(kind);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string              config_path = argv[1];
  std::string              cmd         = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  try {
    auto config = purchase::config::ConfigLoader::LoadFromYaml(config_path);
    purchase::observability::InitializeLogging(config, purchase::observability::LogSink::kStderr);

    auto app = purchase::factory::Build(config);

    // ------------------------------------------------------------

    if (cmd == "sync") {
      auto report = app.sync_engine->Run();
      PrintReport(report);
      if (report.auth_required) {
        PrintLoginPrompt();
        return 2;
      }
      return report.failed == 0 ? 0 : 2;
    }

    // ------------------------------------------------------------

    if (cmd == "refresh") {
      const bool force   = !args.empty() && args[0] == "--force";
      auto       results = force ? app.reference_cache->RefreshAllIfStale(std::chrono::milliseconds(0))
                                 : app.reference_cache->RefreshAllIfStale();
      for (const auto& r : results) {
        std::cout << KindArg(r.kind) << ": " << purchase::cache::ToString(r.outcome);
        if (r.outcome == purchase::cache::RefreshOutcome::kRefreshed) std::cout << " (" << r.rows << " rows)";
        if (!r.detail.empty()) std::cout << " (" << r.detail << ")";
        std::cout << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      purchase::remote::PurchaseListFilter filter;
      if (args.size() >= 1 && args[0] != "all") filter.status = args[0];
      if (args.size() >= 2) filter.supplier_id = ParseId(args[1]);
      if (args.size() >= 3) filter.page = ParseId(args[2]);

      auto listing = app.view_builder->List(filter);
      std::cout << (listing.from_remote ? "remote+local" : "local only") << " page " << listing.current_page << "/"
                << listing.last_page << "\n";
      for (const auto& e : listing.entries) {
        std::cout << purchase::view::ToString(e.origin) << "\tlocal=" << (e.local_id ? std::to_string(*e.local_id) : "-")
                  << "\tremote=" << (e.remote_id ? std::to_string(*e.remote_id) : "-") << "\tref=" << e.ref_no.value_or("-")
                  << "\t" << e.status << "\t" << e.final_total << "\t" << e.supplier_name << (e.synced ? "" : "\t(unsynced)")
                  << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "search") {
      if (args.empty()) {
        Usage();
        return 1;
      }
      const std::string term = args.size() >= 2 ? args[1] : "";
      if (args[0] == "suppliers") {
        for (const auto& s : app.reference_cache->SearchSuppliers(term)) {
          std::cout << s.id << "\t" << s.name << "\t" << s.business_name << "\t" << s.contact_code << "\n";
        }
      } else if (args[0] == "products") {
        for (const auto& p : app.reference_cache->SearchProducts(term)) {
          std::cout << p.product_id << "/" << p.variation_id << "\t" << p.product_name << "\t" << p.sub_sku << "\t"
                    << p.default_purchase_price << "\n";
        }
      } else if (args[0] == "locations") {
        for (const auto& l : app.reference_cache->SearchLocations(term)) {
          std::cout << l.id << "\t" << l.name << "\t" << l.location_code << "\n";
        }
      } else {
        std::cerr << "unknown reference type: " << args[0] << "\n";
        return 1;
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "show") {
      if (args.size() < 1) return 1;
      std::cout << purchase::core::DetailToJson(app.purchases->GetPurchase(ParseId(args[0]))) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "create") {
      if (args.size() < 1) return 1;
      auto local_id = app.purchases->CreatePurchase(purchase::core::DraftFromJson(ReadDraftArgument(args[0])));
      std::cout << "created local_id=" << local_id << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "delete") {
      if (args.size() < 1) return 1;
      app.purchases->DeletePurchase(ParseId(args[0]));
      std::cout << "deleted\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "status") {
      if (args.size() < 2) return 1;
      auto status = purchase::db::model::ParsePurchaseStatus(args[1]);
      if (!status) {
        std::cerr << "unsupported status: " << args[1] << "\n";
        return 1;
      }
      app.purchases->UpdateStatus(ParseId(args[0]), *status);
      std::cout << "status=" << args[1] << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "check-ref") {
      if (args.size() < 2) return 1;
      const bool exists = app.purchases->CheckReferenceNumber(ParseId(args[0]), args[1]);
      std::cout << (exists ? "taken" : "available") << "\n";
      return exists ? 3 : 0;
    }

    // ------------------------------------------------------------

    if (cmd == "reconcile") {
      std::vector<std::int64_t> ids;
      for (const auto& a : args) ids.push_back(ParseId(a));
      auto result = app.view_builder->ReconcileSpecified(ids);
      if (!result.online) {
        std::cout << "offline: nothing reconciled\n";
        return 2;
      }
      std::cout << "found=" << result.found.size() << " pruned=" << result.pruned_local_ids.size() << "\n";
      for (auto id : result.pruned_local_ids) std::cout << "  pruned local_id=" << id << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "cache-stats") {
      for (const auto& s : app.reference_cache->Stats()) {
        std::cout << KindArg(s.kind) << "\tcount=" << s.count
                  << "\tlast_sync=" << (s.last_sync ? purchase::util::FormatIso8601(*s.last_sync) : "never") << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "clear-cache") {
      app.reference_cache->Clear();
      std::cout << "cleared\n";
      return 0;
    }

    Usage();
    return 1;
  } catch (const purchase::remote::RemoteError& e) {
    if (e.Kind() == purchase::remote::FailureKind::kAuthentication) {
      PrintLoginPrompt();
    } else {
      std::cerr << purchase::remote::ToString(e.Kind()) << ": " << e.what() << "\n";
      for (const auto& [field, messages] : e.Fields()) {
        for (const auto& m : messages) std::cerr << "  " << field << ": " << m << "\n";
      }
    }
    purchase::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    PURCHASE_LOG_ERROR("Fatal error", {purchase::observability::StringField("error", e.what())});
    purchase::observability::ShutdownLogging();
    return 2;
  }
}
