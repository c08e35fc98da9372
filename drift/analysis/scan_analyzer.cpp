#include "drift/analysis/scan_analyzer.h"

#include <cstdio>
#include <set>

namespace Drift::Analysis {

using Inspect::MetadataMap;
using Inspect::PrefixMetadata;
using Inspect::ResourceMetadata;

namespace {

template<typename... Args>
auto format(const char* fmt, Args... args) -> std::string {
  char buf[256];
  std::snprintf(buf, sizeof(buf), fmt, args...);
  return buf;
}

} // namespace

auto computeUnusedScore(const ResourceMetadata& meta, bool referenced, int32_t threshold) -> UnusedScore {
  UnusedScore score;
  if (threshold <= 0) {
    threshold = ScanConfig::DEFAULT_UNUSED_SCORE_THRESHOLD;
  }

  if (!referenced) {
    score.not_in_code = UnusedScore::NOT_IN_CODE_POINTS;
    score.reasons.emplace_back("Not referenced in code");
  }
  if (meta.is_empty) {
    score.empty = UnusedScore::EMPTY_POINTS;
    score.reasons.emplace_back("Bucket is empty");
  }
  std::string matched;
  if (hasDeprecatedTag(meta.tags, &matched)) {
    score.deprecated_tag = UnusedScore::DEPRECATED_TAG_POINTS;
    score.reasons.push_back("Has deprecated tag: " + matched);
  }

  score.total = score.not_in_code + score.empty + score.deprecated_tag;
  score.is_unused = score.total >= threshold;
  return score;
}

auto classifyPrefix(const PrefixMetadata& prefix, int32_t stale_threshold_days) -> PrefixAnalysis {
  PrefixAnalysis out;
  out.prefix = prefix.prefix;
  out.object_count = prefix.object_count;
  out.days_since_modified = prefix.days_since_modified;
  out.error = prefix.error;

  if (!prefix.exists) {
    out.status = Classification::PREFIX_MISSING;
    out.message = "Prefix referenced in code but no objects found";
  } else if (prefix.days_since_modified > stale_threshold_days) {
    out.status = Classification::PREFIX_STALE;
    out.message = format("No modifications for %d days (threshold: %d)",
                         prefix.days_since_modified, stale_threshold_days);
  } else {
    out.status = Classification::OK;
  }
  return out;
}

auto classifyContainer(const ResourceMetadata& meta, bool referenced, const ScanConfig& config) -> ContainerAnalysis {
  ContainerAnalysis out;
  out.name = meta.name;
  out.referenced_in_code = referenced;
  out.exists = meta.exists;
  out.region = meta.region;
  out.versioning_enabled = meta.versioning_enabled;
  out.lifecycle_rules = meta.lifecycle_rules;
  out.error = meta.error;

  if (!meta.exists) {
    out.status = Classification::RESOURCE_MISSING;
    out.message = "Bucket referenced in code but does not exist in AWS";
    return out;
  }

  if (config.check_unused) {
    const int32_t threshold = config.effectiveUnusedThreshold();
    UnusedScore score = computeUnusedScore(meta, referenced, threshold);
    const bool unused = score.is_unused;
    const int32_t total = score.total;
    out.unused_score = std::move(score);
    if (unused) {
      out.status = Classification::RESOURCE_UNUSED;
      out.message = format("Bucket appears unused (score: %d/%d)", total, threshold);
      return out;
    }
  }

  bool decided = false;
  if (meta.versioning_enabled && meta.lifecycle_rules == 0) {
    out.status = Classification::VERSION_SPRAWL;
    out.message = "Versioning enabled but no lifecycle rules to clean up old versions";
    decided = true;
  }

  out.prefixes.reserve(meta.prefixes.size());
  for (const auto& prefix : meta.prefixes) {
    out.prefixes.push_back(classifyPrefix(prefix, config.stale_threshold_days));
  }

  if (!decided && meta.lifecycle_rules == 0) {
    for (const auto& prefix : meta.prefixes) {
      if (prefix.object_count > ScanConfig::LARGE_PREFIX_OBJECTS) {
        out.status = Classification::LIFECYCLE_MISCONFIGURED;
        out.message = "Bucket has no lifecycle rules but contains many objects";
        decided = true;
        break;
      }
    }
  }

  if (!decided) {
    out.status = Classification::OK;
    out.message = "Bucket exists and matches expected usage";
  }
  return out;
}

auto analyzeScan(const Scanner::ReferenceList& references, const MetadataMap& metadata,
                 const ScanConfig& config) -> ScanResult {
  std::set<std::string> referenced;
  for (const auto& ref : references) {
    referenced.insert(ref.container);
  }

  ScanResult result;
  for (const auto& [name, meta] : metadata) {
    ContainerAnalysis analysis = classifyContainer(meta, referenced.count(name) > 0, config);
    ScanSummary& summary = result.summary;
    ++summary.total_containers;

    switch (analysis.status) {
      case Classification::OK:
        ++summary.ok_containers;
        break;
      case Classification::RESOURCE_MISSING:
        summary.missing_containers.push_back(name);
        break;
      case Classification::RESOURCE_UNUSED:
        summary.unused_containers.push_back(name);
        break;
      case Classification::VERSION_SPRAWL:
        summary.version_sprawl.push_back(name);
        break;
      case Classification::LIFECYCLE_MISCONFIGURED:
        summary.lifecycle_misconfigured.push_back(name);
        break;
      default:
        break;
    }

    for (const auto& prefix : analysis.prefixes) {
      if (prefix.status == Classification::PREFIX_MISSING) {
        summary.missing_prefixes.push_back(name + "/" + prefix.prefix);
      } else if (prefix.status == Classification::PREFIX_STALE) {
        summary.stale_prefixes.push_back(name + "/" + prefix.prefix);
      }
    }

    result.containers.emplace(name, std::move(analysis));
  }
  return result;
}

} // namespace Drift::Analysis
