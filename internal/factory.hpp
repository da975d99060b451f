#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/preference_store.hpp"
#include "internal/dispatch/worker_pool_dispatcher.hpp"
#include "internal/sync/remote_data_provider.hpp"
#include "internal/sync/remote_data_sync_engine.hpp"
#include "internal/sync/schedule_delegate.hpp"

namespace rdsync::factory {

/*
  RuntimeDependencies

  Owns the long-lived objects of one sync runtime.
  The dispatcher is started; call Shutdown() before dropping the struct.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::PreferenceStore>            preferences;
  std::shared_ptr<dispatch::WorkerPoolDispatcher> dispatcher;
  std::shared_ptr<sync::RemoteDataSyncEngine>     engine;

  // Unsubscribes the engine and drains the dispatcher.
  void Shutdown();
};

/*
  BuildRuntime

  Composition root: the only place that knows concrete preference store
  types. Transport and scheduler are supplied by the host.
*/
RuntimeDependencies BuildRuntime(const rdsync::runtime::config::RuntimeConfig& config, std::shared_ptr<sync::RemoteDataProvider> provider,
                                 std::shared_ptr<sync::ScheduleDelegate> delegate);

std::shared_ptr<db::PreferenceStore> BuildPreferenceStore(const rdsync::runtime::config::RuntimeConfig& config);

} // namespace rdsync::factory
