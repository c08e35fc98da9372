// ============================================================================
// text_report.cpp - Human-readable report rendering
// ============================================================================

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <iterator>

#include "common/macros.h"
#include "drift/report/report.h"

namespace Drift::Report {

using Analysis::Classification;

namespace {

constexpr size_t SCAN_RULE_WIDTH = 50;
constexpr size_t DISCOVERY_RULE_WIDTH = 70;
constexpr size_t MAX_HEALTHY_LISTED = 10;

void appendf(std::string& out, const char* format, ...) PRINTF_FORMAT(2, 3);

void appendf(std::string& out, const char* format, ...) {
  char buf[1024];
  va_list args;
  va_start(args, format);
  int n = std::vsnprintf(buf, sizeof(buf), format, args);
  va_end(args);
  if (n < 0) {
    return;
  }
  if (static_cast<size_t>(n) < sizeof(buf)) {
    out.append(buf, static_cast<size_t>(n));
    return;
  }
  std::string big(static_cast<size_t>(n) + 1, '\0');
  va_start(args, format);
  std::vsnprintf(big.data(), big.size(), format, args);
  va_end(args);
  big.resize(static_cast<size_t>(n));
  out += big;
}

auto section(std::string& out, const char* title, size_t width) -> void {
  appendf(out, "%s\n%s\n", title, std::string(width, '-').c_str());
}

auto sorted(std::vector<std::string> values) -> std::vector<std::string> {
  std::sort(values.begin(), values.end());
  return values;
}

auto joined(const std::vector<std::string>& values) -> std::string {
  std::string out;
  for (const auto& v : values) {
    if (!out.empty()) {
      out += ", ";
    }
    out += v;
  }
  return out;
}

auto displayTime(Common::EpochSeconds ts) -> std::string {
  std::string iso = Common::formatIso8601(ts);   // YYYY-MM-DDTHH:MM:SSZ
  if (iso.size() >= 19) {
    iso[10] = ' ';
    iso.resize(19);
  }
  return iso;
}

auto baselineSection(std::string& out, const std::optional<Baseline::DiffResult>& diff) -> void {
  if (!diff) {
    return;
  }
  section(out, "Baseline Comparison", SCAN_RULE_WIDTH);
  appendf(out, "New: %zu  Resolved: %zu  Unchanged: %zu\n",
          diff->added.size(), diff->resolved.size(), diff->unchanged.size());
  for (const auto& f : diff->added) {
    appendf(out, "  [NEW] %s: %s%s%s\n", f.type.c_str(), f.container.c_str(),
            f.prefix.empty() ? "" : "/", f.prefix.c_str());
  }
  for (const auto& f : diff->resolved) {
    appendf(out, "  [RESOLVED] %s: %s%s%s\n", f.type.c_str(), f.container.c_str(),
            f.prefix.empty() ? "" : "/", f.prefix.c_str());
  }
  out += "\n";
}

auto containerList(std::string& out, const char* title, const char* tag,
                   const std::vector<std::string>& names, const Analysis::ScanResult& result) -> void {
  if (names.empty()) {
    return;
  }
  section(out, title, SCAN_RULE_WIDTH);
  for (const auto& name : sorted(names)) {
    appendf(out, "  [%s]: %s\n", tag, name.c_str());
    auto it = result.containers.find(name);
    if (it == result.containers.end()) {
      continue;
    }
    if (!it->second.message.empty()) {
      appendf(out, "    %s\n", it->second.message.c_str());
    }
    if (it->second.status == Classification::RESOURCE_UNUSED && it->second.unused_score) {
      out += "    Reasons:\n";
      for (const auto& reason : it->second.unused_score->reasons) {
        appendf(out, "      - %s\n", reason.c_str());
      }
    }
  }
  out += "\n";
}

auto prefixList(std::string& out, const char* title, const char* tag, const std::vector<std::string>& paths) -> void {
  if (paths.empty()) {
    return;
  }
  section(out, title, SCAN_RULE_WIDTH);
  for (const auto& path : sorted(paths)) {
    appendf(out, "  [%s]: %s\n", tag, path.c_str());
  }
  out += "\n";
}

auto riskEntry(std::string& out, const char* tag, const Analysis::ContainerRisk& risk,
               bool show_recommendations) -> void {
  appendf(out, "  [%s]: %s (%s)\n", tag, risk.name.c_str(), risk.region.c_str());
  appendf(out, "    Risk Score: %d\n", risk.risk_score);

  const Inspect::ResourceMetadata& m = risk.metadata;
  if (risk.status == Classification::VERSION_SPRAWL && m.total_version_size > 0) {
    appendf(out, "    Total Size (all versions): %s (%llu versions)\n",
            formatBytes(m.total_version_size).c_str(), static_cast<unsigned long long>(m.version_count));
    if (m.total_size > 0 && m.total_version_size > m.total_size) {
      const int64_t overhead = m.total_version_size - m.total_size;
      appendf(out, "    Version Overhead: %s (%.1f%% of total)\n", formatBytes(overhead).c_str(),
              static_cast<double>(overhead) / static_cast<double>(m.total_version_size) * 100.0);
    }
  }
  if (!risk.risk_factors.empty()) {
    out += "    Factors:\n";
    for (const auto& factor : risk.risk_factors) {
      appendf(out, "      - %s\n", factor.c_str());
    }
  }
  if (show_recommendations && !risk.recommendations.empty()) {
    out += "    Recommendations:\n";
    for (const auto& rec : risk.recommendations) {
      appendf(out, "      - %s\n", rec.c_str());
    }
  }
  if (!m.error.empty()) {
    appendf(out, "    Errors: %s\n", m.error.c_str());
  }
  out += "\n";
}

auto riskList(std::string& out, const char* title, const char* tag, const std::vector<std::string>& names,
              const Analysis::DiscoveryResult& result, bool show_recommendations) -> void {
  if (names.empty()) {
    return;
  }
  section(out, title, DISCOVERY_RULE_WIDTH);
  for (const auto& name : sorted(names)) {
    auto it = result.containers.find(name);
    if (it != result.containers.end()) {
      riskEntry(out, tag, it->second, show_recommendations);
    }
  }
}

} // namespace

auto formatBytes(int64_t bytes) -> std::string {
  constexpr int64_t UNIT = 1024;
  char buf[32];
  if (bytes < UNIT) {
    std::snprintf(buf, sizeof(buf), "%lld B", static_cast<long long>(bytes));
    return buf;
  }
  static constexpr const char* SIZES[] = {"KB", "MB", "GB", "TB", "PB", "EB"};
  int64_t div = UNIT;
  size_t exp = 0;
  for (int64_t n = bytes / UNIT; n >= UNIT && exp + 1 < std::size(SIZES); n /= UNIT) {
    div *= UNIT;
    ++exp;
  }
  std::snprintf(buf, sizeof(buf), "%.2f %s", static_cast<double>(bytes) / static_cast<double>(div), SIZES[exp]);
  return buf;
}

auto renderScanText(const ScanReport& report) -> std::string {
  std::string out;
  const ScanReportConfig& cfg = report.config;
  const Analysis::ScanSummary& s = report.result.summary;

  out += "S3 Drift Report\n===============\n\n";
  appendf(out, "Scan Time: %s\n", displayTime(report.timestamp).c_str());
  appendf(out, "Repository: %s\n", cfg.repo_path.c_str());
  if (!cfg.aws_profile.empty()) {
    appendf(out, "AWS Profile: %s\n", cfg.aws_profile.c_str());
  }
  if (!cfg.aws_region.empty()) {
    appendf(out, "AWS Region: %s\n", cfg.aws_region.c_str());
  }
  out += "\n";

  out += "Summary\n-------\n";
  appendf(out, "Total Buckets Scanned: %u\n", s.total_containers);
  appendf(out, "OK: %u\n", s.ok_containers);
  if (!s.missing_containers.empty()) appendf(out, "Missing Buckets: %zu\n", s.missing_containers.size());
  if (!s.unused_containers.empty()) appendf(out, "Unused Buckets: %zu\n", s.unused_containers.size());
  if (!s.missing_prefixes.empty()) appendf(out, "Missing Prefixes: %zu\n", s.missing_prefixes.size());
  if (!s.stale_prefixes.empty()) appendf(out, "Stale Prefixes: %zu\n", s.stale_prefixes.size());
  if (!s.version_sprawl.empty()) appendf(out, "Version Sprawl: %zu\n", s.version_sprawl.size());
  if (!s.lifecycle_misconfigured.empty()) {
    appendf(out, "Lifecycle Misconfig: %zu\n", s.lifecycle_misconfigured.size());
  }
  out += "\n";

  containerList(out, "Missing Buckets", "MISSING_BUCKET", s.missing_containers, report.result);
  containerList(out, "Unused Buckets", "UNUSED_BUCKET", s.unused_containers, report.result);
  prefixList(out, "Stale Prefixes", "STALE_PREFIX", s.stale_prefixes);
  prefixList(out, "Missing Prefixes", "MISSING_PREFIX", s.missing_prefixes);
  containerList(out, "Version Sprawl", "VERSION_SPRAWL", s.version_sprawl, report.result);
  containerList(out, "Lifecycle Misconfigurations", "LIFECYCLE_MISCONFIG", s.lifecycle_misconfigured, report.result);

  if (s.ok_containers > 0) {
    appendf(out, "OK Buckets: %u\n%s\n", s.ok_containers, std::string(SCAN_RULE_WIDTH, '-').c_str());
    for (const auto& [name, analysis] : report.result.containers) {
      if (analysis.status == Classification::OK) {
        appendf(out, "  [OK]: %s\n", name.c_str());
      }
    }
    out += "\n";
  }

  bool header_done = false;
  for (const auto& [name, analysis] : report.result.containers) {
    if (analysis.error.empty()) {
      continue;
    }
    if (!header_done) {
      section(out, "Collection Errors", SCAN_RULE_WIDTH);
      header_done = true;
    }
    appendf(out, "  %s: %s\n", name.c_str(), analysis.error.c_str());
  }
  if (header_done) {
    out += "\n";
  }

  baselineSection(out, report.baseline);
  return out;
}

auto renderDiscoveryText(const DiscoveryReport& report) -> std::string {
  std::string out;
  const DiscoveryReportConfig& cfg = report.config;
  const Analysis::DiscoverySummary& s = report.result.summary;

  out += "S3 Drift Discovery Report\n=========================\n\n";
  appendf(out, "Scan Time: %s\n", displayTime(report.timestamp).c_str());
  if (!cfg.aws_profile.empty()) {
    appendf(out, "AWS Profile: %s\n", cfg.aws_profile.c_str());
  }
  if (cfg.all_regions) {
    out += "Scanning: All enabled AWS regions\n";
  } else if (!cfg.regions.empty()) {
    appendf(out, "Regions: %s\n", joined(cfg.regions).c_str());
  }
  appendf(out, "Total Regions Scanned: %u\n\n", s.total_regions);

  out += "Summary\n-------\n";
  appendf(out, "Total Buckets: %u\n", s.total_containers);
  appendf(out, "Healthy: %u\n", s.healthy);
  if (!s.unused_containers.empty()) appendf(out, "Unused: %zu\n", s.unused_containers.size());
  if (!s.risky_containers.empty()) appendf(out, "Risky: %zu\n", s.risky_containers.size());
  if (!s.inactive_containers.empty()) appendf(out, "Inactive: %zu\n", s.inactive_containers.size());
  if (!s.version_sprawl.empty()) appendf(out, "Version Sprawl: %zu\n", s.version_sprawl.size());
  out += "\n";

  riskList(out, "Unused Buckets", "UNUSED", s.unused_containers, report.result, true);
  riskList(out, "Risky Buckets", "RISKY", s.risky_containers, report.result, true);
  riskList(out, "Inactive Buckets", "INACTIVE", s.inactive_containers, report.result, false);
  riskList(out, "Version Sprawl", "VERSION_SPRAWL", s.version_sprawl, report.result, false);

  if (s.healthy > 0) {
    appendf(out, "Healthy Buckets: %u\n%s\n", s.healthy, std::string(DISCOVERY_RULE_WIDTH, '-').c_str());
    size_t shown = 0;
    for (const auto& [name, risk] : report.result.containers) {
      if (risk.status != Classification::OK) {
        continue;
      }
      if (shown == MAX_HEALTHY_LISTED) {
        appendf(out, "  ... and %zu more\n", static_cast<size_t>(s.healthy) - shown);
        break;
      }
      appendf(out, "  [OK]: %s (%s)\n", name.c_str(), risk.region.c_str());
      ++shown;
    }
    out += "\n";
  }

  baselineSection(out, report.baseline);
  return out;
}

} // namespace Drift::Report
