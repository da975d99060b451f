#include "internal/sync/version_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_preference_store.hpp"
#include "internal/sync/metadata.hpp"
#include "sync_test_support.hpp"

namespace {

using rdsync::db::ErrorCode;
using rdsync::db::Result;
using rdsync::sync::SameMetadata;
using rdsync::sync::VersionStore;
using rdsync::testing::MakeMetadata;

// Preference store whose writes can be switched off.
class FailingPrefs final : public rdsync::db::PreferenceStore {
 public:
  std::optional<std::string> Get(const std::string& key) override {
    return inner.Get(key);
  }

  Result Put(const std::string& key, const std::string& value) override {
    if (fail_puts) return Result::Err(ErrorCode::IOError, "disk full");
    return inner.Put(key, value);
  }

  Result Remove(const std::string& key) override {
    return inner.Remove(key);
  }

  std::vector<std::string> Keys(const std::string& prefix) override {
    return inner.Keys(prefix);
  }

  rdsync::db::memory::MemoryPreferenceStore inner;
  bool                                      fail_puts = false;
};

void TestUnknownSourceIsAbsent() {
  VersionStore store(std::make_shared<rdsync::db::memory::MemoryPreferenceStore>());
  assert(!store.Get("app"));
  assert(!store.GetRecord("app"));
  assert(!store.HasAnyRecord());
}

void TestCommitThenGet() {
  VersionStore store(std::make_shared<rdsync::db::memory::MemoryPreferenceStore>());

  auto result = store.Commit("app", MakeMetadata("app", 100), {"b", "a", "b"}, "17.0.0", true);
  assert(result);

  auto record = store.GetRecord("app");
  assert(record);
  assert(SameMetadata(record->metadata(), MakeMetadata("app", 100)));
  assert(record->schedule_ids_size() == 2);
  assert(record->schedule_ids(0) == "a" && record->schedule_ids(1) == "b");
  assert(record->sdk_version() == "17.0.0");
  assert(record->complete());
  assert(store.HasAnyRecord());
}

void TestLateCommitIsRejected() {
  VersionStore store(std::make_shared<rdsync::db::memory::MemoryPreferenceStore>());

  assert(store.Commit("app", MakeMetadata("app", 200), {"x"}));

  auto late = store.Commit("app", MakeMetadata("app", 100), {"y"});
  assert(!late);
  assert(late.code == ErrorCode::StaleCommit);

  auto current = store.GetRecord("app");
  assert(current->metadata().last_modified().seconds() == 200);
  assert(current->schedule_ids(0) == "x");
}

void TestEqualMetadataRecommitIsAllowed() {
  VersionStore store(std::make_shared<rdsync::db::memory::MemoryPreferenceStore>());

  assert(store.Commit("app", MakeMetadata("app", 200), {"x"}, "17.0", false));
  assert(store.Commit("app", MakeMetadata("app", 200), {"x", "y"}, "17.0", true));

  auto record = store.GetRecord("app");
  assert(record->complete());
  assert(record->schedule_ids_size() == 2);
}

void TestSourcesAreIndependent() {
  VersionStore store(std::make_shared<rdsync::db::memory::MemoryPreferenceStore>());

  assert(store.Commit("app", MakeMetadata("app", 500), {}));
  assert(store.Commit("contact", MakeMetadata("contact", 100), {}));
  assert(store.Get("contact")->last_modified().seconds() == 100);
}

void TestRecordsSurviveReload() {
  auto prefs = std::make_shared<rdsync::db::memory::MemoryPreferenceStore>();
  {
    VersionStore store(prefs);
    assert(store.Commit("app", MakeMetadata("app", 300), {"x"}, "17.1"));
  }

  assert(prefs->Get(std::string(VersionStore::kKeyPrefix) + "app"));

  VersionStore reloaded(prefs);
  assert(reloaded.HasAnyRecord());
  auto record = reloaded.GetRecord("app");
  assert(record);
  assert(SameMetadata(record->metadata(), MakeMetadata("app", 300)));
  assert(record->sdk_version() == "17.1");

  // the persisted record still guards against older commits
  assert(reloaded.Commit("app", MakeMetadata("app", 299), {}).code == ErrorCode::StaleCommit);
}

void TestUnreadableRecordIsTreatedAsAbsent() {
  auto prefs = std::make_shared<rdsync::db::memory::MemoryPreferenceStore>();
  assert(prefs->Put(std::string(VersionStore::kKeyPrefix) + "app", "{not json"));

  VersionStore store(prefs);
  assert(!store.Get("app"));
  assert(store.Commit("app", MakeMetadata("app", 1), {}));
  assert(store.Get("app"));
}

void TestFailedPutLeavesStateUnchanged() {
  auto prefs = std::make_shared<FailingPrefs>();

  VersionStore store(prefs);
  assert(store.Commit("app", MakeMetadata("app", 100), {"x"}));

  prefs->fail_puts = true;
  auto result      = store.Commit("app", MakeMetadata("app", 200), {"y"});
  assert(!result);
  assert(result.code == ErrorCode::IOError);
  assert(store.Get("app")->last_modified().seconds() == 100);
}

} // namespace

int main() {
  TestUnknownSourceIsAbsent();
  TestCommitThenGet();
  TestLateCommitIsRejected();
  TestEqualMetadataRecommitIsAllowed();
  TestSourcesAreIndependent();
  TestRecordsSurviveReload();
  TestUnreadableRecordIsTreatedAsAbsent();
  TestFailedPutLeavesStateUnchanged();

  std::cout << "rdsync_unit_version_store: pass\n";
  return 0;
}
