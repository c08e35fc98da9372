#pragma once

// ============================================================================
// report.h - Report documents and output
// ============================================================================

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/time_utils.h"
#include "drift/analysis/discovery_analyzer.h"
#include "drift/analysis/scan_analyzer.h"
#include "drift/baseline/baseline.h"
#include "drift/scanner/reference.h"
#include "drift/version.h"

namespace Drift::Report {

enum class Format : uint8_t { TEXT = 0, JSON = 1 };

[[nodiscard]] auto parseFormat(const std::string& text, Format& out) noexcept -> bool;

struct ScanReportConfig {
  std::string repo_path;
  std::string aws_profile;
  std::string aws_region;
  std::vector<std::string> regions;
  int32_t stale_threshold_days{0};
  int32_t unused_threshold_days{0};
  bool check_unused{false};
  int32_t unused_score_threshold{0};
};

struct DiscoveryReportConfig {
  std::string aws_profile;
  bool all_regions{false};
  std::vector<std::string> regions;
  int32_t age_threshold_days{0};
  int32_t inactivity_threshold_days{0};
  int32_t risk_score_threshold{0};
  bool check_encryption{false};
  bool check_public_access{false};
};

struct ScanReport {
  std::string tool{TOOL_NAME};
  std::string version{TOOL_VERSION};
  Common::EpochSeconds timestamp{0};
  ScanReportConfig config;
  Analysis::ScanResult result;
  std::optional<Scanner::ReferenceList> references;   // only with --include-references
  std::optional<Baseline::DiffResult> baseline;
};

struct DiscoveryReport {
  std::string tool{TOOL_NAME};
  std::string version{TOOL_VERSION};
  Common::EpochSeconds timestamp{0};
  DiscoveryReportConfig config;
  Analysis::DiscoveryResult result;
  std::optional<Baseline::DiffResult> baseline;
};

// JSON documents; container maps are keyed "buckets" so that a report can be
// read back as a baseline.
[[nodiscard]] auto renderScanJson(const ScanReport& report) -> std::string;
[[nodiscard]] auto renderDiscoveryJson(const DiscoveryReport& report) -> std::string;

[[nodiscard]] auto renderScanText(const ScanReport& report) -> std::string;
[[nodiscard]] auto renderDiscoveryText(const DiscoveryReport& report) -> std::string;

// "1.50 KB" style; plain bytes below 1024.
[[nodiscard]] auto formatBytes(int64_t bytes) -> std::string;

// Writes to `path`, or stdout when path is empty or "-".
[[nodiscard]] auto writeOutput(const std::string& path, const std::string& content, std::string& error) -> bool;

} // namespace Drift::Report
