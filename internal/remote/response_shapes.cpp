#include "response_shapes.hpp"

#include "internal/remote/json.hpp"

namespace purchase::remote {

namespace {

std::vector<const Value*> Items(const Value& list) {
  std::vector<const Value*> out;
  out.reserve(static_cast<std::size_t>(list.list_value().values_size()));
  for (const auto& item : list.list_value().values()) out.push_back(&item);
  return out;
}

} // namespace

const std::vector<std::string_view>& RemoteIdPaths() {
  static const std::vector<std::string_view> kPaths = {"id", "transaction_id", "data.id", "data.transaction_id"};
  return kPaths;
}

std::optional<std::int64_t> ExtractRemoteId(const Value& response) {
  for (auto path : RemoteIdPaths()) {
    if (auto id = json::AsInt64(json::Path(response, path)); id && *id > 0) return id;
  }
  return std::nullopt;
}

std::optional<std::vector<const Value*>> ExtractPaymentLines(const Value& response) {
  for (const Value* scope : {&response, json::Field(response, "data")}) {
    if (!json::IsObject(scope)) continue;
    for (const char* key : {"payment_lines", "payments"}) {
      const auto* list = json::Field(*scope, key);
      if (json::IsList(list)) return Items(*list);
    }
  }
  return std::nullopt;
}

std::optional<PageEnvelope> ExtractPage(const Value& response) {
  const Value* envelope = &response;
  const auto*  data     = json::Field(response, "data");

  // nested variant: the outer "data" is itself the page
  if (json::IsObject(data) && json::IsList(json::Field(*data, "data"))) {
    envelope = data;
    data     = json::Field(*data, "data");
  }
  if (!json::IsList(data)) {
    if (json::IsList(&response)) data = &response;
    else return std::nullopt;
  }

  PageEnvelope page;
  page.items = Items(*data);

  const auto count  = static_cast<std::int64_t>(page.items.size());
  page.current_page = json::AsInt64(json::Field(envelope, "current_page")).value_or(1);
  page.last_page    = json::AsInt64(json::Field(envelope, "last_page")).value_or(page.current_page);
  page.per_page     = json::AsInt64(json::Field(envelope, "per_page")).value_or(count);
  page.total        = json::AsInt64(json::Field(envelope, "total")).value_or(count);
  return page;
}

std::optional<std::vector<const Value*>> ExtractList(const Value& response) {
  if (json::IsList(&response)) return Items(response);

  for (const char* key : {"data", "results"}) {
    const auto* list = json::Field(response, key);
    if (json::IsList(list)) return Items(*list);
  }

  const auto* nested = json::Path(response, "data.data");
  if (json::IsList(nested)) return Items(*nested);
  return std::nullopt;
}

const Value* ExtractRecord(const Value& response) {
  const auto* data = json::Field(response, "data");
  if (json::IsObject(data)) return data;
  return json::IsObject(&response) ? &response : nullptr;
}

} // namespace purchase::remote
