#pragma once

// ============================================================================
// discovery_analyzer.h - Risk scoring for full-account discovery
// ============================================================================
//
//   Factor            Points  Trigger
//   age                 20    age_in_days > age threshold (threshold > 0)
//   inactivity          50    days_since_activity > inactivity threshold (> 0)
//   empty               30    no objects
//   deprecated tag      20    tag key/value is a deprecated marker
//   version sprawl      30    versioning on, no lifecycle rules
//   no encryption       40    encryption check on, encryption disabled
//   public access       60    public check on, publicly accessible
//
// Score >= threshold picks, in order: UNUSED, VERSION_SPRAWL, INACTIVE, RISKY.
// Below the threshold the container is OK.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "drift/analysis/classification.h"
#include "drift/inspect/metadata.h"

namespace Drift::Analysis {

struct DiscoveryConfig {
  static constexpr int32_t DEFAULT_RISK_SCORE_THRESHOLD = 100;

  int32_t age_threshold_days{365};
  int32_t inactivity_threshold_days{180};
  bool check_encryption{false};
  bool check_public_access{false};
  int32_t risk_score_threshold{DEFAULT_RISK_SCORE_THRESHOLD};

  [[nodiscard]] auto effectiveRiskThreshold() const noexcept -> int32_t {
    return risk_score_threshold > 0 ? risk_score_threshold : DEFAULT_RISK_SCORE_THRESHOLD;
  }
};

struct RiskPoints {
  static constexpr int32_t AGE = 20;
  static constexpr int32_t INACTIVITY = 50;
  static constexpr int32_t EMPTY = 30;
  static constexpr int32_t DEPRECATED_TAG = 20;
  static constexpr int32_t VERSION_SPRAWL = 30;
  static constexpr int32_t NO_ENCRYPTION = 40;
  static constexpr int32_t PUBLIC_ACCESS = 60;
};

struct ContainerRisk {
  std::string name;
  std::string region;
  Classification status{Classification::OK};
  int32_t risk_score{0};
  std::vector<std::string> risk_factors;
  std::vector<std::string> recommendations;
  Inspect::ResourceMetadata metadata;
};

struct DiscoverySummary {
  uint32_t total_containers{0};
  uint32_t healthy{0};
  uint32_t total_regions{0};
  std::vector<std::string> unused_containers;
  std::vector<std::string> risky_containers;
  std::vector<std::string> inactive_containers;
  std::vector<std::string> version_sprawl;
};

struct DiscoveryResult {
  DiscoverySummary summary;
  std::map<std::string, ContainerRisk> containers;
};

[[nodiscard]] auto scoreContainer(const Inspect::ResourceMetadata& meta, const DiscoveryConfig& config) -> ContainerRisk;

// total_regions counts the distinct regions of the scored containers.
[[nodiscard]] auto analyzeDiscovery(const Inspect::MetadataMap& metadata, const DiscoveryConfig& config) -> DiscoveryResult;

} // namespace Drift::Analysis
