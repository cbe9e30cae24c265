#include "options.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace swarm::cli {

namespace {

uint32_t ParseCount(const std::string& flag, const std::string& value, uint32_t min) {
  size_t        consumed = 0;
  unsigned long parsed   = 0;
  try {
    parsed = std::stoul(value, &consumed);
  } catch (const std::logic_error&) {
    throw util::UsageError(flag + " expects a number, got '" + value + "'");
  }
  if (consumed != value.size() || value.front() == '-' || parsed > std::numeric_limits<uint32_t>::max()) {
    throw util::UsageError(flag + " expects a number, got '" + value + "'");
  }
  if (parsed < min) {
    throw util::UsageError(flag + " must be at least " + std::to_string(min));
  }
  return static_cast<uint32_t>(parsed);
}

void SetMode(Options& options, Mode mode, const std::string& flag) {
  if (options.mode != Mode::kRun && options.mode != mode) {
    throw util::UsageError(flag + " cannot be combined with another mode flag");
  }
  options.mode = mode;
}

} // namespace

std::string UsageText() {
  std::ostringstream out;
  out << "Usage: s3swarm [options]\n"
      << "\n"
      << "  --config <file>          YAML configuration\n"
      << "  --destination <dir>      download root (default ./s3_downloads)\n"
      << "  --buckets-file <file>    bucket list, one per line (default buckets.txt)\n"
      << "  --manifest <file>        manifest path (default download_manifest.json)\n"
      << "  --max-workers <n>        concurrent transfers (default 4)\n"
      << "  --max-retries <n>        retries per task (default 3)\n"
      << "  --profile <name>         credential profile (default \"default\")\n"
      << "  --generate-manifest      enumerate buckets and write the manifest only\n"
      << "  --dry-run                report what would be transferred\n"
      << "  --retry-failed           requeue failed tasks before running\n"
      << "  --reset-attempts         requeued tasks start from zero attempts\n"
      << "  --preserve-attempts      requeued tasks keep their attempt count\n"
      << "  --list-leases            print lease markers and exit\n"
      << "  --clear-leases           remove all lease markers and exit\n"
      << "  --help                   show this message\n";
  return out.str();
}

Options ParseOptions(int argc, const char* const* argv) {
  Options options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];

    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw util::UsageError(flag + " requires a value");
      }
      return argv[++i];
    };

    if (flag == "--help" || flag == "-h") {
      options.mode = Mode::kHelp;
      return options;
    } else if (flag == "--config") {
      options.config_path = value();
    } else if (flag == "--destination") {
      options.destination = value();
    } else if (flag == "--buckets-file") {
      options.buckets_file = value();
    } else if (flag == "--manifest") {
      options.manifest = value();
    } else if (flag == "--profile") {
      options.profile = value();
    } else if (flag == "--max-workers") {
      options.max_workers = ParseCount(flag, value(), 1);
    } else if (flag == "--max-retries") {
      options.max_retries = ParseCount(flag, value(), 0);
    } else if (flag == "--generate-manifest") {
      SetMode(options, Mode::kGenerateManifest, flag);
    } else if (flag == "--dry-run") {
      SetMode(options, Mode::kDryRun, flag);
    } else if (flag == "--list-leases") {
      SetMode(options, Mode::kListLeases, flag);
    } else if (flag == "--clear-leases") {
      SetMode(options, Mode::kClearLeases, flag);
    } else if (flag == "--retry-failed") {
      options.retry_failed = true;
    } else if (flag == "--reset-attempts" || flag == "--preserve-attempts") {
      const auto policy = flag == "--reset-attempts" ? swarm::runtime::config::REQUEUE_POLICY_RESET_ATTEMPTS
                                                     : swarm::runtime::config::REQUEUE_POLICY_PRESERVE_ATTEMPTS;
      if (options.requeue_policy && *options.requeue_policy != policy) {
        throw util::UsageError("--reset-attempts and --preserve-attempts are mutually exclusive");
      }
      options.requeue_policy = policy;
    } else {
      throw util::UsageError("unknown option: " + flag);
    }
  }

  return options;
}

void ApplyOverrides(const Options& options, swarm::runtime::config::RuntimeConfig& config) {
  auto* transfer = config.mutable_transfer();

  if (options.destination) transfer->set_destination(*options.destination);
  if (options.buckets_file) transfer->set_buckets_file(*options.buckets_file);
  if (options.manifest) transfer->set_manifest(*options.manifest);
  if (options.max_workers) transfer->set_max_workers(*options.max_workers);
  if (options.max_retries) transfer->set_max_retries(*options.max_retries);
  if (options.requeue_policy) transfer->set_requeue_policy(*options.requeue_policy);
  if (options.profile) config.mutable_credentials()->set_profile(*options.profile);
}

} // namespace swarm::cli
