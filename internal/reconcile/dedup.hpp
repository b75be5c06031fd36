#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace purchase::reconcile {

/*
  Collapses records sharing a remote identifier.

  The survivor sits where the identifier was first seen and carries the
  payload of the identifier's last occurrence. Records whose key is
  nullopt are kept as-is, in place. Pure; callers may run it on any
  thread.

  key: const T& -> std::optional<std::int64_t>
*/
template <typename T, typename KeyFn>
std::vector<T> DedupByRemoteId(std::vector<T> records, KeyFn key) {
  std::vector<T>                                 out;
  std::unordered_map<std::int64_t, std::size_t> slot;
  out.reserve(records.size());

  for (auto& record : records) {
    const std::optional<std::int64_t> id = key(record);
    if (!id) {
      out.push_back(std::move(record));
      continue;
    }
    auto it = slot.find(*id);
    if (it == slot.end()) {
      slot.emplace(*id, out.size());
      out.push_back(std::move(record));
    } else {
      out[it->second] = std::move(record);
    }
  }
  return out;
}

/*
  Rows whose identifier is present and absent from keep_ids. Rows
  without an identifier are never selected.
*/
template <typename T, typename KeyFn>
std::vector<T> SelectPrunable(const std::vector<T>& rows, const std::unordered_set<std::int64_t>& keep_ids, KeyFn key) {
  std::vector<T> out;
  for (const auto& row : rows) {
    const std::optional<std::int64_t> id = key(row);
    if (id && keep_ids.count(*id) == 0) out.push_back(row);
  }
  return out;
}

} // namespace purchase::reconcile
