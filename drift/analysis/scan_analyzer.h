#pragma once

// ============================================================================
// scan_analyzer.h - Reference-driven drift classification
// ============================================================================
//
// Pure functions of (references, metadata, config). Per container, first
// match wins:
//   1. !exists                                   -> RESOURCE_MISSING
//   2. unused check on and score >= threshold    -> RESOURCE_UNUSED
//   3. versioning on and 0 lifecycle rules       -> VERSION_SPRAWL
//   4. 0 lifecycle rules and a prefix > 100 objs -> LIFECYCLE_MISCONFIGURED
//   else                                         -> OK
// Prefixes are classified independently for every existing, non-unused
// container.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "drift/analysis/classification.h"
#include "drift/inspect/metadata.h"
#include "drift/scanner/reference.h"

namespace Drift::Analysis {

struct ScanConfig {
  static constexpr int32_t DEFAULT_UNUSED_SCORE_THRESHOLD = 150;
  static constexpr uint32_t LARGE_PREFIX_OBJECTS = 100;

  int32_t stale_threshold_days{90};
  bool check_unused{false};
  int32_t unused_score_threshold{DEFAULT_UNUSED_SCORE_THRESHOLD};

  [[nodiscard]] auto effectiveUnusedThreshold() const noexcept -> int32_t {
    return unused_score_threshold > 0 ? unused_score_threshold : DEFAULT_UNUSED_SCORE_THRESHOLD;
  }
};

struct UnusedScore {
  static constexpr int32_t NOT_IN_CODE_POINTS = 100;
  static constexpr int32_t EMPTY_POINTS = 50;
  static constexpr int32_t DEPRECATED_TAG_POINTS = 20;

  int32_t total{0};
  int32_t not_in_code{0};
  int32_t empty{0};
  int32_t deprecated_tag{0};
  bool is_unused{false};
  std::vector<std::string> reasons;
};

struct PrefixAnalysis {
  std::string prefix;
  Classification status{Classification::OK};
  std::string message;
  uint32_t object_count{0};
  int32_t days_since_modified{0};
  std::string error;
};

struct ContainerAnalysis {
  std::string name;
  Classification status{Classification::OK};
  std::string message;
  bool referenced_in_code{false};
  bool exists{false};
  std::string region;
  bool versioning_enabled{false};
  uint32_t lifecycle_rules{0};
  std::optional<UnusedScore> unused_score;
  std::vector<PrefixAnalysis> prefixes;
  std::string error;
};

struct ScanSummary {
  uint32_t total_containers{0};
  uint32_t ok_containers{0};
  std::vector<std::string> missing_containers;
  std::vector<std::string> unused_containers;
  std::vector<std::string> version_sprawl;
  std::vector<std::string> lifecycle_misconfigured;
  std::vector<std::string> missing_prefixes;   // "container/prefix"
  std::vector<std::string> stale_prefixes;
};

struct ScanResult {
  ScanSummary summary;
  std::map<std::string, ContainerAnalysis> containers;
};

[[nodiscard]] auto computeUnusedScore(const Inspect::ResourceMetadata& meta, bool referenced,
                                      int32_t threshold) -> UnusedScore;

[[nodiscard]] auto classifyPrefix(const Inspect::PrefixMetadata& prefix, int32_t stale_threshold_days) -> PrefixAnalysis;

[[nodiscard]] auto classifyContainer(const Inspect::ResourceMetadata& meta, bool referenced,
                                     const ScanConfig& config) -> ContainerAnalysis;

[[nodiscard]] auto analyzeScan(const Scanner::ReferenceList& references, const Inspect::MetadataMap& metadata,
                               const ScanConfig& config) -> ScanResult;

} // namespace Drift::Analysis
