#include "drift/analysis/classification.h"

#include <strings.h>

namespace Drift::Analysis {

namespace {

struct NameEntry {
  Classification value;
  const char* name;
};

constexpr NameEntry NAMES[] = {
  {Classification::OK, "OK"},
  {Classification::RESOURCE_MISSING, "MISSING_BUCKET"},
  {Classification::RESOURCE_UNUSED, "UNUSED_BUCKET"},
  {Classification::PREFIX_MISSING, "MISSING_PREFIX"},
  {Classification::PREFIX_STALE, "STALE_PREFIX"},
  {Classification::VERSION_SPRAWL, "VERSION_SPRAWL"},
  {Classification::LIFECYCLE_MISCONFIGURED, "LIFECYCLE_MISCONFIG"},
  {Classification::RISKY, "RISKY"},
  {Classification::INACTIVE, "INACTIVE"},
};

constexpr const char* DEPRECATED_TERMS[] = {
  "deprecated", "old", "unused", "delete", "obsolete", "legacy", "retired"
};

auto isDeprecatedTerm(const std::string& text) noexcept -> bool {
  for (const char* term : DEPRECATED_TERMS) {
    if (strcasecmp(text.c_str(), term) == 0) {
      return true;
    }
  }
  return false;
}

} // namespace

auto classificationName(Classification c) noexcept -> const char* {
  for (const auto& entry : NAMES) {
    if (entry.value == c) {
      return entry.name;
    }
  }
  return "UNKNOWN";
}

auto parseClassification(const std::string& text, Classification& out) noexcept -> bool {
  for (const auto& entry : NAMES) {
    if (text == entry.name) {
      out = entry.value;
      return true;
    }
  }
  return false;
}

auto hasDeprecatedTag(const Provider::TagMap& tags, std::string* matched) -> bool {
  for (const auto& [key, value] : tags) {
    if (isDeprecatedTerm(key) || isDeprecatedTerm(value)) {
      if (matched) {
        *matched = key + "=" + value;
      }
      return true;
    }
  }
  return false;
}

} // namespace Drift::Analysis
