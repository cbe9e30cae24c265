#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace swarm::cli {

enum class Mode {
  kRun,
  kGenerateManifest,
  kDryRun,
  kListLeases,
  kClearLeases,
  kHelp,
};

struct Options {
  Mode mode = Mode::kRun;

  std::optional<std::string> config_path;
  std::optional<std::string> destination;
  std::optional<std::string> buckets_file;
  std::optional<std::string> manifest;
  std::optional<std::string> profile;
  std::optional<uint32_t>    max_workers;
  std::optional<uint32_t>    max_retries;

  bool retry_failed = false;

  std::optional<swarm::runtime::config::RequeuePolicy> requeue_policy;
};

// Throws util::UsageError.
Options ParseOptions(int argc, const char* const* argv);

// Command-line values win over the YAML config.
void ApplyOverrides(const Options& options, swarm::runtime::config::RuntimeConfig& config);

std::string UsageText();

} // namespace swarm::cli
