#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace purchase::remote {

/*
  Response shape handling, kept in one place.

  The remote API is not consistent about where it puts things: the new
  record id may be top-level or nested under "data", lists may be bare
  arrays or wrapped, pages may be flat or doubly nested. Returned
  pointers borrow from the response passed in.
*/

using google::protobuf::Value;

// Tried in order; first present wins.
const std::vector<std::string_view>& RemoteIdPaths();

std::optional<std::int64_t> ExtractRemoteId(const Value& response);

// "payment_lines" or "payments", top-level or under "data". nullopt when neither key is present.
std::optional<std::vector<const Value*>> ExtractPaymentLines(const Value& response);

struct PageEnvelope {
  std::vector<const Value*> items;
  std::int64_t              current_page = 1;
  std::int64_t              last_page    = 1;
  std::int64_t              per_page     = 0;
  std::int64_t              total        = 0;
};

// {data: [...], current_page, ...} or {data: {data: [...], current_page, ...}}
std::optional<PageEnvelope> ExtractPage(const Value& response);

// [...], {data: [...]}, {results: [...]} or {data: {data: [...]}}
std::optional<std::vector<const Value*>> ExtractList(const Value& response);

// The record itself: "data" when it is an object, else the response.
const Value* ExtractRecord(const Value& response);

} // namespace purchase::remote
