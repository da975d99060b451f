#include "internal/sync/staleness_tracker.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_preference_store.hpp"
#include "internal/sync/version_store.hpp"
#include "sync_test_support.hpp"

namespace {

using rdsync::sync::StalenessTracker;
using rdsync::sync::VersionStore;
using rdsync::testing::MakeMetadata;
using rdsync::testing::MakeRemoteSchedule;
using rdsync::testing::MakeSchedule;

struct Fixture {
  std::shared_ptr<VersionStore> versions = std::make_shared<VersionStore>(std::make_shared<rdsync::db::memory::MemoryPreferenceStore>());
  StalenessTracker              tracker{versions};
};

void TestLocalSchedulesAreAlwaysCurrent() {
  Fixture f;
  auto    local = MakeSchedule("local");

  assert(f.tracker.IsUpToDate(local));
  assert(!f.tracker.RequiresRefresh(local));

  // unaffected by any stored version
  assert(f.versions->Commit("app", MakeMetadata("app", 100), {}));
  assert(f.tracker.IsUpToDate(local));
  assert(!f.tracker.RequiresRefresh(local));
}

void TestNeverProcessedSourceRequiresRefresh() {
  Fixture f;
  auto    schedule = MakeRemoteSchedule("s", "app", 100);

  assert(!f.tracker.IsUpToDate(schedule));
  assert(f.tracker.RequiresRefresh(schedule));
}

void TestMatchingMetadataIsCurrent() {
  Fixture f;
  assert(f.versions->Commit("app", MakeMetadata("app", 100), {"s"}));

  auto schedule = MakeRemoteSchedule("s", "app", 100);
  assert(f.tracker.IsUpToDate(schedule));
  assert(!f.tracker.RequiresRefresh(schedule));
}

void TestKnownNewerDataDoesNotForceFetch() {
  Fixture f;
  assert(f.versions->Commit("app", MakeMetadata("app", 200), {"s"}));

  auto schedule = MakeRemoteSchedule("s", "app", 100);
  assert(!f.tracker.IsUpToDate(schedule));
  assert(!f.tracker.RequiresRefresh(schedule));
}

void TestUnexplainedMetadataRequiresRefresh() {
  Fixture f;
  assert(f.versions->Commit("app", MakeMetadata("app", 100), {"s"}));

  // schedule claims data the store never processed
  auto ahead = MakeRemoteSchedule("s", "app", 300);
  assert(!f.tracker.IsUpToDate(ahead));
  assert(f.tracker.RequiresRefresh(ahead));

  // same timestamp, different attributes
  auto other = MakeRemoteSchedule("s", "app", 100);
  (*other.mutable_remote_data_info()->mutable_metadata()->mutable_attributes())["url"] = "https://elsewhere.test";
  assert(!f.tracker.IsUpToDate(other));
  assert(f.tracker.RequiresRefresh(other));
}

} // namespace

int main() {
  TestLocalSchedulesAreAlwaysCurrent();
  TestNeverProcessedSourceRequiresRefresh();
  TestMatchingMetadataIsCurrent();
  TestKnownNewerDataDoesNotForceFetch();
  TestUnexplainedMetadataRequiresRefresh();

  std::cout << "rdsync_unit_staleness_tracker: pass\n";
  return 0;
}
