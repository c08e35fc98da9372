#include "drift/analysis/discovery_analyzer.h"

#include <cstdio>
#include <set>

namespace Drift::Analysis {

using Inspect::MetadataMap;
using Inspect::ResourceMetadata;

auto scoreContainer(const ResourceMetadata& meta, const DiscoveryConfig& config) -> ContainerRisk {
  ContainerRisk risk;
  risk.name = meta.name;
  risk.region = meta.region;
  risk.metadata = meta;

  char buf[128];

  if (config.age_threshold_days > 0 && meta.age_in_days > config.age_threshold_days) {
    risk.risk_score += RiskPoints::AGE;
    std::snprintf(buf, sizeof(buf), "Old bucket (%d days)", meta.age_in_days);
    risk.risk_factors.emplace_back(buf);
  }

  if (config.inactivity_threshold_days > 0 && meta.days_since_activity > config.inactivity_threshold_days) {
    risk.risk_score += RiskPoints::INACTIVITY;
    std::snprintf(buf, sizeof(buf), "No activity for %d days", meta.days_since_activity);
    risk.risk_factors.emplace_back(buf);
    risk.recommendations.emplace_back("Consider archiving or deleting if not needed");
  }

  if (meta.is_empty) {
    risk.risk_score += RiskPoints::EMPTY;
    risk.risk_factors.emplace_back("Empty bucket");
    risk.recommendations.emplace_back("Delete if not needed");
  }

  if (hasDeprecatedTag(meta.tags)) {
    risk.risk_score += RiskPoints::DEPRECATED_TAG;
    risk.risk_factors.emplace_back("Has deprecated tags");
    risk.recommendations.emplace_back("Verify if bucket is still needed");
  }

  const bool sprawl = meta.versioning_enabled && meta.lifecycle_rules == 0;
  if (sprawl) {
    risk.risk_score += RiskPoints::VERSION_SPRAWL;
    risk.risk_factors.emplace_back("Versioning enabled without lifecycle rules");
    risk.recommendations.emplace_back("Add lifecycle policy to expire old versions");
  }

  if (config.check_encryption && meta.encryption && !meta.encryption->enabled) {
    risk.risk_score += RiskPoints::NO_ENCRYPTION;
    risk.risk_factors.emplace_back("No encryption enabled");
    risk.recommendations.emplace_back("Enable default encryption (AES256 or KMS)");
  }

  if (config.check_public_access && meta.public_access && meta.public_access->is_public) {
    risk.risk_score += RiskPoints::PUBLIC_ACCESS;
    risk.risk_factors.emplace_back("Public access enabled");
    risk.recommendations.emplace_back("Review and restrict public access if not required");
  }

  if (risk.risk_score < config.effectiveRiskThreshold()) {
    risk.status = Classification::OK;
    return risk;
  }

  const bool inactive = meta.days_since_activity > config.inactivity_threshold_days;
  if (meta.is_empty && (inactive || meta.days_since_activity == 0)) {
    risk.status = Classification::RESOURCE_UNUSED;
  } else if (sprawl) {
    risk.status = Classification::VERSION_SPRAWL;
  } else if (inactive) {
    risk.status = Classification::INACTIVE;
  } else {
    risk.status = Classification::RISKY;
  }
  return risk;
}

auto analyzeDiscovery(const MetadataMap& metadata, const DiscoveryConfig& config) -> DiscoveryResult {
  DiscoveryResult result;
  std::set<std::string> regions;

  for (const auto& [name, meta] : metadata) {
    ContainerRisk risk = scoreContainer(meta, config);
    DiscoverySummary& summary = result.summary;
    ++summary.total_containers;
    if (!meta.region.empty()) {
      regions.insert(meta.region);
    }

    switch (risk.status) {
      case Classification::OK:
        ++summary.healthy;
        break;
      case Classification::RESOURCE_UNUSED:
        summary.unused_containers.push_back(name);
        break;
      case Classification::VERSION_SPRAWL:
        summary.version_sprawl.push_back(name);
        break;
      case Classification::INACTIVE:
        summary.inactive_containers.push_back(name);
        break;
      case Classification::RISKY:
        summary.risky_containers.push_back(name);
        break;
      default:
        break;
    }

    result.containers.emplace(name, std::move(risk));
  }

  result.summary.total_regions = static_cast<uint32_t>(regions.size());
  return result;
}

} // namespace Drift::Analysis
