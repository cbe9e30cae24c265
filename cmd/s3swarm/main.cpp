#include <iostream>
#include <string>

#include "internal/cli/options.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/manifest/bucket_list.hpp"
#include "internal/manifest/manifest_builder.hpp"
#include "internal/model/task_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/storage/object/s3_object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/units.hpp"

using swarm::observability::StringField;

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;

void PrintStats(const swarm::manifest::ManifestStats& stats) {
  std::cout << "Manifest: " << stats.total() << " tasks, " << swarm::util::FormatSize(stats.total_bytes) << "\n"
            << "  pending:     " << stats.pending << "\n"
            << "  in_progress: " << stats.in_progress << "\n"
            << "  completed:   " << stats.completed << " (" << swarm::util::FormatSize(stats.completed_bytes) << ")\n"
            << "  failed:      " << stats.failed << "\n";
}

void PrintSummary(const swarm::scheduler::RunSummary& summary) {
  std::cout << "Summary:\n"
            << "  completed: " << summary.completed << "\n"
            << "  failed:    " << summary.failed << "\n"
            << "  skipped:   " << summary.skipped << "\n"
            << "  abandoned: " << summary.abandoned << "\n"
            << "  blocked:   " << summary.blocked << "\n"
            << "  downloaded " << swarm::util::FormatSize(summary.bytes) << " in " << summary.transfers << " transfers\n";
}

int ManageLeases(const swarm::cli::Options& options, const swarm::runtime::config::RuntimeConfig& config) {
  swarm::lease::LeaseManager leases(config.leases().directory());

  if (options.mode == swarm::cli::Mode::kClearLeases) {
    const auto removed = leases.ClearMarkers();
    std::cout << "Removed " << removed << " lease marker(s) from " << config.leases().directory() << "\n";
    return kExitOk;
  }

  const auto markers = leases.ListMarkers();
  for (const auto& marker : markers) {
    std::cout << swarm::model::KeyString(marker.key()) << "  owner=" << marker.owner_id() << " pid=" << marker.pid()
              << " host=" << marker.host() << " since=" << swarm::util::ToUnixMillis(swarm::util::FromProto(marker.acquired_at())) << "\n";
  }
  std::cout << markers.size() << " lease marker(s)\n";
  return kExitOk;
}

int Execute(const swarm::cli::Options& options, const swarm::runtime::config::RuntimeConfig& config) {
  using swarm::cli::Mode;

  if (options.mode == Mode::kListLeases || options.mode == Mode::kClearLeases) {
    return ManageLeases(options, config);
  }

  auto app = swarm::factory::Build(config);
  app.shutdown->InstallHandlers();

  const auto& transfer = config.transfer();

  if (options.mode == Mode::kGenerateManifest || app.manifest->Size() == 0) {
    if (options.mode == Mode::kDryRun) {
      SWARM_LOG_WARN("No manifest to inspect; run with --generate-manifest first", {StringField("manifest", transfer.manifest())});
      return kExitOk;
    }

    const auto buckets = swarm::manifest::LoadBucketList(transfer.buckets_file());
    if (buckets.empty()) {
      throw swarm::util::UsageError("bucket list is empty: " + transfer.buckets_file());
    }

    (void)app.credentials->Acquire();

    swarm::manifest::ManifestBuilder builder(app.manifest, app.credentials, app.store, transfer.destination());
    const auto generated = builder.Generate(buckets);
    std::cout << "Added " << generated.added << " task(s), " << swarm::util::FormatSize(generated.bytes) << "\n";
    for (const auto& bucket : generated.inaccessible_buckets) {
      std::cout << "  skipped inaccessible bucket: " << bucket << "\n";
    }

    if (options.mode == Mode::kGenerateManifest) {
      PrintStats(app.manifest->Stats());
      return kExitOk;
    }
  }

  PrintStats(app.manifest->Stats());

  swarm::scheduler::RunOptions run;
  run.max_workers       = transfer.max_workers();
  run.include_failed    = options.retry_failed;
  run.dry_run           = options.mode == Mode::kDryRun;
  run.requeue_policy    = transfer.requeue_policy();
  run.progress_interval = swarm::util::ToMillis(transfer.progress_interval());

  if (!run.dry_run) {
    // Fail fast on authentication before any task is touched.
    (void)app.credentials->Acquire();
  }

  swarm::scheduler::Scheduler scheduler(app.WorkerDeps(), swarm::transfer::RetryPolicy::FromConfig(transfer), transfer.destination());
  const auto summary = scheduler.Run(run);

  if (run.dry_run) {
    std::cout << "Dry run: " << summary.eligible << " task(s) would be transferred, " << summary.blocked
              << " blocked by lease markers\n";
    return kExitOk;
  }

  PrintSummary(summary);
  return kExitOk;
}

void Shutdown() {
  swarm::storage::S3ObjectStore::Finalize();
  swarm::observability::ShutdownMetrics();
  swarm::observability::ShutdownLogging();
}

} // namespace

int main(int argc, char** argv) {
  swarm::cli::Options options;
  try {
    options = swarm::cli::ParseOptions(argc, argv);
  } catch (const swarm::util::UsageError& e) {
    std::cerr << "s3swarm: " << e.what() << "\n\n" << swarm::cli::UsageText();
    return kExitUsage;
  }

  if (options.mode == swarm::cli::Mode::kHelp) {
    std::cout << swarm::cli::UsageText();
    return kExitOk;
  }

  int code = kExitOk;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = options.config_path ? swarm::config::ConfigLoader::ParseYaml(*options.config_path)
                                      : swarm::runtime::config::RuntimeConfig{};
    swarm::cli::ApplyOverrides(options, config);
    swarm::config::ApplyDefaults(config);

    swarm::observability::InitializeLogging(config);
    swarm::observability::InitializeMetrics(config);

    code = Execute(options, config);
  } catch (const swarm::util::UsageError& e) {
    std::cerr << "s3swarm: " << e.what() << "\n";
    code = kExitUsage;
  } catch (const std::exception& e) {
    SWARM_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    code = kExitFatal;
  }

  Shutdown();
  return code;
}
