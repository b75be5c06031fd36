#include "internal/reconcile/dedup.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using purchase::reconcile::DedupByRemoteId;
using purchase::reconcile::SelectPrunable;

struct Row {
  std::optional<std::int64_t> id;
  std::string                 payload;
};

std::optional<std::int64_t> KeyOf(const Row& r) {
  return r.id;
}

void TestDuplicatesCollapseToLastPayloadInFirstSeenOrder() {
  std::vector<Row> rows = {{1, "a"}, {2, "b"}, {1, "c"}, {3, "d"}, {2, "e"}};

  auto out = DedupByRemoteId(rows, &KeyOf);
  assert(out.size() == 3);
  assert(*out[0].id == 1 && out[0].payload == "c");
  assert(*out[1].id == 2 && out[1].payload == "e");
  assert(*out[2].id == 3 && out[2].payload == "d");
}

void TestRecordsWithoutIdPassThroughInPlace() {
  std::vector<Row> rows = {{std::nullopt, "local-1"}, {5, "x"}, {std::nullopt, "local-2"}, {5, "y"}};

  auto out = DedupByRemoteId(rows, &KeyOf);
  assert(out.size() == 3);
  assert(!out[0].id && out[0].payload == "local-1");
  assert(*out[1].id == 5 && out[1].payload == "y");
  assert(!out[2].id && out[2].payload == "local-2");
}

void TestDedupIsIdempotent() {
  std::vector<Row> rows = {{7, "a"}, {8, "b"}, {7, "c"}};

  auto once  = DedupByRemoteId(rows, &KeyOf);
  auto twice = DedupByRemoteId(once, &KeyOf);
  assert(once.size() == twice.size());
  for (std::size_t i = 0; i < once.size(); ++i) {
    assert(once[i].id == twice[i].id);
    assert(once[i].payload == twice[i].payload);
  }
}

void TestEmptyInput() {
  assert(DedupByRemoteId(std::vector<Row>{}, &KeyOf).empty());
}

void TestSelectPrunableSkipsRowsWithoutId() {
  std::vector<Row> rows = {{1, "keep"}, {2, "gone"}, {std::nullopt, "unsynced"}, {3, "gone-too"}};

  auto out = SelectPrunable(rows, {1}, &KeyOf);
  assert(out.size() == 2);
  assert(*out[0].id == 2);
  assert(*out[1].id == 3);
}

} // namespace

int main() {
  TestDuplicatesCollapseToLastPayloadInFirstSeenOrder();
  TestRecordsWithoutIdPassThroughInPlace();
  TestDedupIsIdempotent();
  TestEmptyInput();
  TestSelectPrunableSkipsRowsWithoutId();

  std::cout << "purchase_sync_unit_dedup: pass\n";
  return 0;
}
