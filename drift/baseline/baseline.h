#pragma once

// ============================================================================
// baseline.h - Finding identity and baseline comparison
// ============================================================================
//
// A baseline is a JSON report written by an earlier run. Its findings are
// compared by identity (type, container, prefix) so that gates can fire on
// new findings only.

#include <string>
#include <vector>

#include "drift/analysis/discovery_analyzer.h"
#include "drift/analysis/scan_analyzer.h"

namespace Drift::Baseline {

struct Finding {
  std::string type;        // classification name, e.g. "MISSING_PREFIX"
  std::string container;
  std::string prefix;      // empty for container-level findings

  // "type|container|prefix", or "type|container" when there is no prefix
  [[nodiscard]] auto key() const -> std::string;

  auto operator==(const Finding& other) const -> bool {
    return type == other.type && container == other.container && prefix == other.prefix;
  }
};

using FindingList = std::vector<Finding>;

struct DiffResult {
  FindingList added;       // current, not in baseline
  FindingList resolved;    // baseline, not in current
  FindingList unchanged;   // present in both
};

// Every non-OK container and prefix, in container then prefix order.
[[nodiscard]] auto flattenScanFindings(const Analysis::ScanResult& result) -> FindingList;
[[nodiscard]] auto flattenDiscoveryFindings(const Analysis::DiscoveryResult& result) -> FindingList;

[[nodiscard]] auto diffFindings(const FindingList& current, const FindingList& baseline) -> DiffResult;

// Findings contained in a scan or discovery JSON report. Returns false and
// fills `error` if the file cannot be read or is not a report.
[[nodiscard]] auto loadScanBaseline(const std::string& path, FindingList& findings, std::string& error) -> bool;
[[nodiscard]] auto loadDiscoveryBaseline(const std::string& path, FindingList& findings, std::string& error) -> bool;

// Same as the loaders, from an in-memory document.
[[nodiscard]] auto parseScanBaseline(const std::string& json, FindingList& findings, std::string& error) -> bool;
[[nodiscard]] auto parseDiscoveryBaseline(const std::string& json, FindingList& findings, std::string& error) -> bool;

} // namespace Drift::Baseline
