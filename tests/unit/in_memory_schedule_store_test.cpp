#include "internal/scheduler/in_memory_schedule_store.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "sync_test_support.hpp"

namespace {

using rdsync::scheduler::InMemoryScheduleStore;
using rdsync::testing::In;
using rdsync::testing::MakeInfo;
using rdsync::testing::MakeSchedule;
using namespace std::chrono_literals;

void TestCreateIsIdempotent() {
  InMemoryScheduleStore store;

  assert(store.ScheduleMultiple({MakeSchedule("a"), MakeSchedule("b")}));
  assert(store.ScheduleMultiple({MakeSchedule("a", "again")}));

  assert(store.Size() == 2);
  assert(store.Get("a")->content() == "again");
  assert(store.Get("a")->has_created());

  auto all = store.GetSchedules();
  assert(all.size() == 2 && all[0].id() == "a" && all[1].id() == "b");
}

void TestBatchWithEmptyIdIsRejected() {
  InMemoryScheduleStore store;

  assert(!store.ScheduleMultiple({MakeSchedule("a"), MakeSchedule("")}));
  assert(store.Size() == 0);
}

void TestEditUnknownScheduleFails() {
  InMemoryScheduleStore store;
  assert(!store.EditSchedule("missing", rdsync::v1::ScheduleEdits{}));
}

void TestEditsApplyOnlySetFields() {
  InMemoryScheduleStore store;

  auto original = MakeSchedule("a", "before");
  original.set_priority(2);
  *original.mutable_start() = In(-1h);
  *original.mutable_end()   = In(1h);
  assert(store.ScheduleMultiple({original}));

  rdsync::v1::ScheduleEdits edits;
  edits.set_content("after");
  edits.set_clear_end(true);
  edits.mutable_frequency_constraint_ids()->add_ids("daily");
  *edits.mutable_remote_data_info() = MakeInfo("app", 10);
  assert(store.EditSchedule("a", edits));

  // applying the same edit twice converges
  assert(store.EditSchedule("a", edits));

  auto edited = store.Get("a");
  assert(edited->content() == "after");
  assert(edited->priority() == 2);
  assert(edited->has_start());
  assert(!edited->has_end());
  assert(edited->frequency_constraint_ids_size() == 1);
  assert(edited->remote_data_info().source() == "app");
}

void TestConstraintsAreStored() {
  InMemoryScheduleStore store;
  store.SetConstraints("[]");
  assert(store.Constraints() == "[]");
}

} // namespace

int main() {
  TestCreateIsIdempotent();
  TestBatchWithEmptyIdIsRejected();
  TestEditUnknownScheduleFails();
  TestEditsApplyOnlySetFields();
  TestConstraintsAreStored();

  std::cout << "rdsync_unit_in_memory_schedule_store: pass\n";
  return 0;
}
