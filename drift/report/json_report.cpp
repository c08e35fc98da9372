// ============================================================================
// json_report.cpp - JSON report rendering
// ============================================================================

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "drift/report/report.h"

namespace Drift::Report {

using Analysis::classificationName;

namespace {

using Writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

auto key(Writer& w, const char* name) -> void {
  w.Key(name);
}

auto str(Writer& w, const char* name, const std::string& value) -> void {
  w.Key(name);
  w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

auto optStr(Writer& w, const char* name, const std::string& value) -> void {
  if (!value.empty()) {
    str(w, name, value);
  }
}

auto stringArray(Writer& w, const char* name, const std::vector<std::string>& values) -> void {
  w.Key(name);
  w.StartArray();
  for (const auto& v : values) {
    w.String(v.c_str(), static_cast<rapidjson::SizeType>(v.size()));
  }
  w.EndArray();
}

auto optStringArray(Writer& w, const char* name, const std::vector<std::string>& values) -> void {
  if (!values.empty()) {
    stringArray(w, name, values);
  }
}

auto header(Writer& w, const std::string& tool, const std::string& version, Common::EpochSeconds ts) -> void {
  str(w, "tool", tool);
  str(w, "version", version);
  str(w, "timestamp", Common::formatIso8601(ts));
}

auto findingArray(Writer& w, const char* name, const Baseline::FindingList& findings) -> void {
  w.Key(name);
  w.StartArray();
  for (const auto& f : findings) {
    w.StartObject();
    str(w, "type", f.type);
    str(w, "bucket", f.container);
    optStr(w, "prefix", f.prefix);
    w.EndObject();
  }
  w.EndArray();
}

auto baselineBlock(Writer& w, const std::optional<Baseline::DiffResult>& diff) -> void {
  if (!diff) {
    return;
  }
  key(w, "baseline");
  w.StartObject();
  findingArray(w, "new", diff->added);
  findingArray(w, "resolved", diff->resolved);
  key(w, "unchanged_count");
  w.Uint(static_cast<unsigned>(diff->unchanged.size()));
  w.EndObject();
}

auto unusedScore(Writer& w, const Analysis::UnusedScore& score) -> void {
  key(w, "unused_score");
  w.StartObject();
  key(w, "total");
  w.Int(score.total);
  stringArray(w, "reasons", score.reasons);
  key(w, "is_unused");
  w.Bool(score.is_unused);
  key(w, "not_in_code");
  w.Int(score.not_in_code);
  key(w, "empty");
  w.Int(score.empty);
  key(w, "deprecated_tag");
  w.Int(score.deprecated_tag);
  w.EndObject();
}

auto containerAnalysis(Writer& w, const Analysis::ContainerAnalysis& c) -> void {
  w.StartObject();
  str(w, "name", c.name);
  str(w, "status", classificationName(c.status));
  optStr(w, "message", c.message);
  key(w, "referenced_in_code");
  w.Bool(c.referenced_in_code);
  key(w, "exists_in_aws");
  w.Bool(c.exists);
  optStr(w, "region", c.region);
  key(w, "versioning_enabled");
  w.Bool(c.versioning_enabled);
  key(w, "lifecycle_rules");
  w.Uint(c.lifecycle_rules);
  if (!c.prefixes.empty()) {
    key(w, "prefixes");
    w.StartArray();
    for (const auto& p : c.prefixes) {
      w.StartObject();
      str(w, "prefix", p.prefix);
      str(w, "status", classificationName(p.status));
      optStr(w, "message", p.message);
      key(w, "object_count");
      w.Uint(p.object_count);
      if (p.days_since_modified != 0) {
        key(w, "days_since_modified");
        w.Int(p.days_since_modified);
      }
      optStr(w, "error", p.error);
      w.EndObject();
    }
    w.EndArray();
  }
  if (c.unused_score) {
    unusedScore(w, *c.unused_score);
  }
  optStr(w, "error", c.error);
  w.EndObject();
}

auto bucketInfo(Writer& w, const Inspect::ResourceMetadata& m) -> void {
  key(w, "bucket_info");
  w.StartObject();
  str(w, "name", m.name);
  optStr(w, "region", m.region);
  if (m.creation_time > 0) {
    str(w, "creation_date", Common::formatIso8601(m.creation_time));
  }
  if (m.last_activity > 0) {
    str(w, "last_modified", Common::formatIso8601(m.last_activity));
  }
  key(w, "age_in_days");
  w.Int(m.age_in_days);
  key(w, "days_since_activity");
  w.Int(m.days_since_activity);
  key(w, "object_count");
  w.Uint(m.object_count);
  key(w, "total_size");
  w.Int64(m.total_size);
  key(w, "is_empty");
  w.Bool(m.is_empty);
  key(w, "versioning_enabled");
  w.Bool(m.versioning_enabled);
  key(w, "lifecycle_rules");
  w.Uint(m.lifecycle_rules);
  if (m.versioning_enabled) {
    key(w, "version_count");
    w.Uint64(m.version_count);
    key(w, "total_version_size");
    w.Int64(m.total_version_size);
  }
  if (!m.tags.empty()) {
    key(w, "tags");
    w.StartObject();
    for (const auto& [k, v] : m.tags) {
      str(w, k.c_str(), v);
    }
    w.EndObject();
  }
  if (m.encryption) {
    key(w, "encryption");
    w.StartObject();
    key(w, "enabled");
    w.Bool(m.encryption->enabled);
    optStr(w, "algorithm", m.encryption->algorithm);
    optStr(w, "kms_key_id", m.encryption->kms_key_id);
    w.EndObject();
  }
  if (m.public_access) {
    key(w, "public_access");
    w.StartObject();
    key(w, "is_public");
    w.Bool(m.public_access->is_public);
    key(w, "block_public_acls");
    w.Bool(m.public_access->block_public_acls);
    key(w, "ignore_public_acls");
    w.Bool(m.public_access->ignore_public_acls);
    key(w, "block_public_policy");
    w.Bool(m.public_access->block_public_policy);
    key(w, "restrict_public_buckets");
    w.Bool(m.public_access->restrict_public_buckets);
    w.EndObject();
  }
  optStr(w, "error", m.error);
  w.EndObject();
}

} // namespace

auto renderScanJson(const ScanReport& report) -> std::string {
  rapidjson::StringBuffer buffer;
  Writer w(buffer);
  w.SetIndent(' ', 2);

  w.StartObject();
  header(w, report.tool, report.version, report.timestamp);

  const ScanReportConfig& cfg = report.config;
  key(w, "config");
  w.StartObject();
  str(w, "repo_path", cfg.repo_path);
  optStr(w, "aws_profile", cfg.aws_profile);
  optStr(w, "aws_region", cfg.aws_region);
  optStringArray(w, "regions", cfg.regions);
  key(w, "stale_threshold_days");
  w.Int(cfg.stale_threshold_days);
  key(w, "unused_threshold_days");
  w.Int(cfg.unused_threshold_days);
  key(w, "check_unused");
  w.Bool(cfg.check_unused);
  key(w, "unused_score_threshold");
  w.Int(cfg.unused_score_threshold);
  w.EndObject();

  const Analysis::ScanSummary& s = report.result.summary;
  key(w, "summary");
  w.StartObject();
  key(w, "total_buckets");
  w.Uint(s.total_containers);
  key(w, "ok_buckets");
  w.Uint(s.ok_containers);
  optStringArray(w, "missing_buckets", s.missing_containers);
  optStringArray(w, "unused_buckets", s.unused_containers);
  optStringArray(w, "missing_prefixes", s.missing_prefixes);
  optStringArray(w, "stale_prefixes", s.stale_prefixes);
  optStringArray(w, "version_sprawl", s.version_sprawl);
  optStringArray(w, "lifecycle_misconfig", s.lifecycle_misconfigured);
  w.EndObject();

  key(w, "buckets");
  w.StartObject();
  for (const auto& [name, analysis] : report.result.containers) {
    w.Key(name.c_str(), static_cast<rapidjson::SizeType>(name.size()));
    containerAnalysis(w, analysis);
  }
  w.EndObject();

  if (report.references) {
    key(w, "references");
    w.StartArray();
    for (const auto& ref : *report.references) {
      w.StartObject();
      str(w, "bucket", ref.container);
      optStr(w, "prefix", ref.prefix);
      optStr(w, "version_id", ref.version_id);
      str(w, "file", ref.source_file);
      key(w, "line");
      w.Uint(ref.source_line);
      str(w, "access", Scanner::accessModeName(ref.access));
      w.EndObject();
    }
    w.EndArray();
  }

  baselineBlock(w, report.baseline);
  w.EndObject();

  return std::string(buffer.GetString(), buffer.GetSize()) + "\n";
}

auto renderDiscoveryJson(const DiscoveryReport& report) -> std::string {
  rapidjson::StringBuffer buffer;
  Writer w(buffer);
  w.SetIndent(' ', 2);

  w.StartObject();
  header(w, report.tool, report.version, report.timestamp);

  const DiscoveryReportConfig& cfg = report.config;
  key(w, "config");
  w.StartObject();
  optStr(w, "aws_profile", cfg.aws_profile);
  key(w, "all_regions");
  w.Bool(cfg.all_regions);
  optStringArray(w, "regions", cfg.regions);
  key(w, "age_threshold_days");
  w.Int(cfg.age_threshold_days);
  key(w, "inactivity_threshold_days");
  w.Int(cfg.inactivity_threshold_days);
  key(w, "risk_score_threshold");
  w.Int(cfg.risk_score_threshold);
  key(w, "check_encryption");
  w.Bool(cfg.check_encryption);
  key(w, "check_public_access");
  w.Bool(cfg.check_public_access);
  w.EndObject();

  const Analysis::DiscoverySummary& s = report.result.summary;
  key(w, "summary");
  w.StartObject();
  key(w, "total_buckets");
  w.Uint(s.total_containers);
  key(w, "healthy_buckets");
  w.Uint(s.healthy);
  optStringArray(w, "unused_buckets", s.unused_containers);
  optStringArray(w, "risky_buckets", s.risky_containers);
  optStringArray(w, "inactive_buckets", s.inactive_containers);
  optStringArray(w, "version_sprawl", s.version_sprawl);
  key(w, "total_regions");
  w.Uint(s.total_regions);
  w.EndObject();

  key(w, "buckets");
  w.StartObject();
  for (const auto& [name, risk] : report.result.containers) {
    w.Key(name.c_str(), static_cast<rapidjson::SizeType>(name.size()));
    w.StartObject();
    str(w, "name", risk.name);
    optStr(w, "region", risk.region);
    str(w, "status", classificationName(risk.status));
    key(w, "risk_score");
    w.Int(risk.risk_score);
    optStringArray(w, "risk_factors", risk.risk_factors);
    optStringArray(w, "recommendations", risk.recommendations);
    bucketInfo(w, risk.metadata);
    w.EndObject();
  }
  w.EndObject();

  baselineBlock(w, report.baseline);
  w.EndObject();

  return std::string(buffer.GetString(), buffer.GetSize()) + "\n";
}

} // namespace Drift::Report
