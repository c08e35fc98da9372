// ============================================================================
// baseline.cpp - Finding identity and baseline comparison Implementation
// ============================================================================

#include "drift/baseline/baseline.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unordered_set>

#include "common/logging.h"

namespace Drift::Baseline {

using Analysis::Classification;
using Analysis::classificationName;

namespace {

auto readFile(const std::string& path, std::string& content, std::string& error) -> bool {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    error = "read baseline: " + path + ": " + std::strerror(errno);
    return false;
  }
  char buf[8192];
  size_t n = 0;
  while ((n = std::fread(buf, 1, sizeof(buf), file)) > 0) {
    content.append(buf, n);
  }
  const bool failed = std::ferror(file) != 0;
  std::fclose(file);
  if (failed) {
    error = "read baseline: " + path + ": I/O error";
    return false;
  }
  return true;
}

auto stringMember(const rapidjson::Value& obj, const char* name) -> std::string {
  auto it = obj.FindMember(name);
  if (it == obj.MemberEnd() || !it->value.IsString()) {
    return "";
  }
  return std::string(it->value.GetString(), it->value.GetStringLength());
}

// Parses the document and returns the "buckets" object, or nullptr.
auto containerSection(rapidjson::Document& doc, const std::string& json, std::string& error)
    -> const rapidjson::Value* {
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError()) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "parse baseline: %s (offset %zu)",
                  rapidjson::GetParseError_En(doc.GetParseError()), doc.GetErrorOffset());
    error = buf;
    return nullptr;
  }
  if (!doc.IsObject()) {
    error = "parse baseline: document is not an object";
    return nullptr;
  }
  auto it = doc.FindMember("buckets");
  if (it == doc.MemberEnd() || it->value.IsNull()) {
    static const rapidjson::Value empty(rapidjson::kObjectType);
    return &empty;
  }
  if (!it->value.IsObject()) {
    error = "parse baseline: \"buckets\" is not an object";
    return nullptr;
  }
  return &it->value;
}

auto isFinding(const std::string& status) -> bool {
  return !status.empty() && status != classificationName(Classification::OK);
}

} // namespace

auto Finding::key() const -> std::string {
  std::string out = type + "|" + container;
  if (!prefix.empty()) {
    out += "|" + prefix;
  }
  return out;
}

// ============================================================================
// Flattening
// ============================================================================

auto flattenScanFindings(const Analysis::ScanResult& result) -> FindingList {
  FindingList findings;
  for (const auto& [name, analysis] : result.containers) {
    if (analysis.status != Classification::OK) {
      findings.push_back({classificationName(analysis.status), name, ""});
    }
    for (const auto& prefix : analysis.prefixes) {
      if (prefix.status != Classification::OK) {
        findings.push_back({classificationName(prefix.status), name, prefix.prefix});
      }
    }
  }
  return findings;
}

auto flattenDiscoveryFindings(const Analysis::DiscoveryResult& result) -> FindingList {
  FindingList findings;
  for (const auto& [name, risk] : result.containers) {
    if (risk.status != Classification::OK) {
      findings.push_back({classificationName(risk.status), name, ""});
    }
  }
  return findings;
}

auto diffFindings(const FindingList& current, const FindingList& baseline) -> DiffResult {
  std::unordered_set<std::string> base_keys;
  for (const auto& f : baseline) {
    base_keys.insert(f.key());
  }
  std::unordered_set<std::string> current_keys;
  for (const auto& f : current) {
    current_keys.insert(f.key());
  }

  DiffResult diff;
  for (const auto& f : current) {
    if (base_keys.count(f.key())) {
      diff.unchanged.push_back(f);
    } else {
      diff.added.push_back(f);
    }
  }
  for (const auto& f : baseline) {
    if (!current_keys.count(f.key())) {
      diff.resolved.push_back(f);
    }
  }
  return diff;
}

// ============================================================================
// Loading
// ============================================================================

auto parseScanBaseline(const std::string& json, FindingList& findings, std::string& error) -> bool {
  rapidjson::Document doc;
  const rapidjson::Value* buckets = containerSection(doc, json, error);
  if (!buckets) {
    return false;
  }

  findings.clear();
  for (auto it = buckets->MemberBegin(); it != buckets->MemberEnd(); ++it) {
    if (!it->value.IsObject()) {
      continue;
    }
    const std::string name(it->name.GetString(), it->name.GetStringLength());
    const std::string status = stringMember(it->value, "status");
    if (isFinding(status)) {
      findings.push_back({status, name, ""});
    }

    auto prefixes = it->value.FindMember("prefixes");
    if (prefixes == it->value.MemberEnd() || !prefixes->value.IsArray()) {
      continue;
    }
    for (const auto& prefix : prefixes->value.GetArray()) {
      if (!prefix.IsObject()) {
        continue;
      }
      const std::string prefix_status = stringMember(prefix, "status");
      if (isFinding(prefix_status)) {
        findings.push_back({prefix_status, name, stringMember(prefix, "prefix")});
      }
    }
  }
  return true;
}

auto parseDiscoveryBaseline(const std::string& json, FindingList& findings, std::string& error) -> bool {
  rapidjson::Document doc;
  const rapidjson::Value* buckets = containerSection(doc, json, error);
  if (!buckets) {
    return false;
  }

  findings.clear();
  for (auto it = buckets->MemberBegin(); it != buckets->MemberEnd(); ++it) {
    if (!it->value.IsObject()) {
      continue;
    }
    const std::string status = stringMember(it->value, "status");
    if (isFinding(status)) {
      findings.push_back({status, std::string(it->name.GetString(), it->name.GetStringLength()), ""});
    }
  }
  return true;
}

auto loadScanBaseline(const std::string& path, FindingList& findings, std::string& error) -> bool {
  std::string content;
  if (!readFile(path, content, error) || !parseScanBaseline(content, findings, error)) {
    LOG_ERROR("Failed to load scan baseline: %s", error.c_str());
    return false;
  }
  LOG_INFO("Loaded %zu baseline finding(s) from %s", findings.size(), path.c_str());
  return true;
}

auto loadDiscoveryBaseline(const std::string& path, FindingList& findings, std::string& error) -> bool {
  std::string content;
  if (!readFile(path, content, error) || !parseDiscoveryBaseline(content, findings, error)) {
    LOG_ERROR("Failed to load discovery baseline: %s", error.c_str());
    return false;
  }
  LOG_INFO("Loaded %zu baseline finding(s) from %s", findings.size(), path.c_str());
  return true;
}

} // namespace Drift::Baseline
