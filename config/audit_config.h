#pragma once

// ============================================================================
// audit_config.h - Run configuration
// ============================================================================
//
// Built once by the CLI from defaults, the config file and flags (in that
// order of precedence, lowest first) and passed by const reference.

#include <cstdint>
#include <string>
#include <vector>

namespace Config {

struct ProviderSettings {
  std::string profile;
  std::string region;                  // empty: environment, then us-east-1
  std::vector<std::string> regions;    // explicit list wins over all_regions
  bool all_regions{true};
  std::string endpoint;                // S3-compatible store, path-style
  int32_t concurrency{10};
  int32_t timeout_seconds{0};          // whole run; 0 means no deadline
  int32_t request_timeout_seconds{30};
};

struct ScanSettings {
  std::string repo_path{"."};
  int32_t stale_days{90};
  int32_t unused_threshold_days{180};
  bool check_unused{false};
  int32_t unused_score_threshold{150};
  bool include_references{false};
};

struct DiscoverySettings {
  int32_t age_threshold_days{365};
  int32_t inactive_days{180};
  int32_t risk_score_threshold{100};
  bool check_encryption{false};
  bool check_public{false};
};

struct OutputSettings {
  std::string format{"text"};
  std::string path;                    // empty: stdout
  std::string baseline_path;
  bool update_baseline{false};
  bool progress{true};
};

struct GateSettings {
  bool fail_on_missing{false};
  bool fail_on_stale{false};
  bool fail_on_version_sprawl{false};
  bool fail_on_unused{false};
  bool fail_on_risky{false};
};

struct FilterSettings {
  std::vector<std::string> exclude_containers;
  std::vector<std::string> exclude_prefixes;   // matched as leading text of a prefix
};

struct LoggingSettings {
  std::string level{"INFO"};
  std::string logs_dir{"logs"};
  bool verbose{false};
};

struct AuditConfig {
  ProviderSettings provider;
  ScanSettings scan;
  DiscoverySettings discovery;
  OutputSettings output;
  GateSettings gates;
  FilterSettings filters;
  LoggingSettings logging;

  // Rejects negative thresholds and timeouts, unknown formats and log levels,
  // and --update-baseline without a baseline path.
  [[nodiscard]] auto validate(std::string& error) const -> bool;

  [[nodiscard]] auto isExcludedContainer(const std::string& name) const -> bool;
  [[nodiscard]] auto isExcludedPrefix(const std::string& prefix) const -> bool;
};

} // namespace Config
