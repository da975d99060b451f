#include "factory.hpp"

#include <filesystem>
#include <stdexcept>

#include "internal/db/memory/memory_preference_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_preference_store.hpp"
#include "internal/observability/logging.hpp"

namespace rdsync::factory {

using rdsync::observability::IntField;
using rdsync::observability::StringField;

std::shared_ptr<db::PreferenceStore> BuildPreferenceStore(const rdsync::runtime::config::RuntimeConfig& config) {
  const auto& preferences = config.preferences();

  if (preferences.in_memory()) {
    if (preferences.has_sqlite()) throw std::runtime_error("preferences: sqlite and in_memory are mutually exclusive");
    return std::make_shared<db::memory::MemoryPreferenceStore>();
  }

  if (!preferences.has_sqlite() || preferences.sqlite().path().empty()) {
    throw std::runtime_error("preferences: sqlite.path is required unless in_memory is set");
  }

  const std::filesystem::path path(preferences.sqlite().path());
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path.string());
  RDSYNC_LOG_INFO("Preference store opened", {StringField("path", sqlite_db->Path())});
  return std::make_shared<db::sqlite::SqlitePreferenceStore>(std::move(sqlite_db));
}

RuntimeDependencies BuildRuntime(const rdsync::runtime::config::RuntimeConfig& config, std::shared_ptr<sync::RemoteDataProvider> provider,
                                 std::shared_ptr<sync::ScheduleDelegate> delegate) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  deps.preferences = BuildPreferenceStore(config);

  // ------------------------------------------------------------------
  // Continuations
  // ------------------------------------------------------------------
  const auto threads = config.dispatcher().threads();
  deps.dispatcher    = std::make_shared<dispatch::WorkerPoolDispatcher>(threads);
  deps.dispatcher->Start();

  // ------------------------------------------------------------------
  // Sync engine
  // ------------------------------------------------------------------
  deps.engine = sync::RemoteDataSyncEngine::Create(std::move(provider), std::move(delegate), deps.preferences, deps.dispatcher,
                                                   config.sync().sdk_version());

  RDSYNC_LOG_INFO("Sync runtime built", {StringField("sdk_version", config.sync().sdk_version()),
                                         IntField("dispatcher_threads", static_cast<int64_t>(threads == 0 ? 1 : threads))});
  return deps;
}

void RuntimeDependencies::Shutdown() {
  if (engine) engine->Unsubscribe();
  if (dispatcher) dispatcher->Stop();
}

} // namespace rdsync::factory
