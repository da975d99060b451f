#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduler/in_memory_schedule_store.hpp"
#include "internal/transport/file_remote_data_provider.hpp"

using rdsync::observability::IntField;
using rdsync::observability::StringField;
using rdsync::sync::RefreshCoordinator;

namespace {

constexpr auto kSettleTimeout = std::chrono::seconds(30);

void PrintUsage() {
  std::cerr << "Usage: rdsync-replay --config <config.yaml> --payloads <dir>" << std::endl;
}

// Waits until no source has a fetch in flight. Returns the number of sources
// that did not settle.
int WaitForSources(const rdsync::sync::RemoteDataSyncEngine& engine, const std::vector<std::string>& sources) {
  const auto deadline = std::chrono::steady_clock::now() + kSettleTimeout;

  while (true) {
    int in_flight = 0;
    int unsettled = 0;
    for (const auto& source : sources) {
      const auto phase = engine.SourcePhase(source);
      if (phase == RefreshCoordinator::Phase::kFetchInFlight) ++in_flight;
      if (phase != RefreshCoordinator::Phase::kSettled) ++unsettled;
    }

    if (in_flight == 0) return unsettled;
    if (std::chrono::steady_clock::now() > deadline) {
      RDSYNC_LOG_WARN("Timed out waiting for sources", {IntField("in_flight", in_flight)});
      return unsettled;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string payload_dir;
  for (int i = 1; i + 1 < argc; i += 2) {
    const std::string flag = argv[i];
    if (flag == "--config") {
      config_path = argv[i + 1];
    } else if (flag == "--payloads") {
      payload_dir = argv[i + 1];
    } else {
      PrintUsage();
      return 1;
    }
  }
  if (argc % 2 == 0 || config_path.empty() || payload_dir.empty()) {
    PrintUsage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = rdsync::config::ConfigLoader::LoadFromYaml(config_path);
    rdsync::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Collaborators and runtime
    // ------------------------------------------------------------
    const std::vector<std::string> configured(config.sync().sources().begin(), config.sync().sources().end());

    auto provider = std::make_shared<rdsync::transport::FileRemoteDataProvider>(payload_dir, configured);
    auto store    = std::make_shared<rdsync::scheduler::InMemoryScheduleStore>();
    auto runtime  = rdsync::factory::BuildRuntime(config, provider, store);

    const auto sources = provider->Sources();
    RDSYNC_LOG_INFO("Replaying remote data", {StringField("payloads", payload_dir), IntField("sources", static_cast<int64_t>(sources.size()))});

    runtime.engine->Subscribe();
    const int unsettled = WaitForSources(*runtime.engine, sources);

    // ------------------------------------------------------------
    // Report
    // ------------------------------------------------------------
    for (const auto& schedule : store->GetSchedules()) {
      std::string json;
      auto        status = google::protobuf::util::MessageToJsonString(schedule, &json);
      if (!status.ok()) throw std::runtime_error("failed to render schedule " + schedule.id() + ": " + std::string(status.message()));
      std::cout << json << "\n";
    }

    RDSYNC_LOG_INFO("Replay finished", {IntField("schedules", static_cast<int64_t>(store->Size())), IntField("unsettled_sources", unsettled)});

    runtime.Shutdown();
    rdsync::observability::ShutdownLogging();
    return unsettled == 0 ? 0 : 3;
  } catch (const std::exception& e) {
    RDSYNC_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    rdsync::observability::ShutdownLogging();
    return 2;
  }
}
