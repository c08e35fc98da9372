#pragma once

#include <cstdint>
#include <string>

#include "drift/provider/storage_provider.h"

namespace Drift::Analysis {

enum class Classification : uint8_t {
  OK = 0,
  RESOURCE_MISSING = 1,
  RESOURCE_UNUSED = 2,
  PREFIX_MISSING = 3,
  PREFIX_STALE = 4,
  VERSION_SPRAWL = 5,
  LIFECYCLE_MISCONFIGURED = 6,
  RISKY = 7,
  INACTIVE = 8
};

// Stable report/baseline spelling, e.g. "MISSING_BUCKET".
[[nodiscard]] auto classificationName(Classification c) noexcept -> const char*;
[[nodiscard]] auto parseClassification(const std::string& text, Classification& out) noexcept -> bool;

// Case-insensitive whole-value match of any tag key or value against the
// deprecated-marker terms. `matched` receives "key=value" of the first hit.
[[nodiscard]] auto hasDeprecatedTag(const Provider::TagMap& tags, std::string* matched = nullptr) -> bool;

} // namespace Drift::Analysis
