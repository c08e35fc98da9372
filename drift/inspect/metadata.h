#pragma once

// ============================================================================
// metadata.h - Collected per-container state
// ============================================================================
//
// Written by exactly one inspector worker, then handed to the analyzers as
// read-only data.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/time_utils.h"
#include "drift/provider/storage_provider.h"

namespace Drift::Inspect {

using Provider::EncryptionState;
using Provider::PublicAccessState;
using Provider::TagMap;

struct PrefixMetadata {
  std::string prefix;
  bool exists{false};
  uint32_t object_count{0};
  Common::EpochSeconds latest_modified{0};
  int32_t days_since_modified{0};
  std::string error;
};

struct ResourceMetadata {
  std::string name;
  bool exists{false};
  std::string region;

  Common::EpochSeconds creation_time{0};
  Common::EpochSeconds last_activity{0};
  int32_t age_in_days{0};
  int32_t days_since_activity{0};

  int64_t total_size{0};
  uint32_t object_count{0};
  bool is_empty{false};

  bool versioning_enabled{false};
  uint32_t lifecycle_rules{0};
  TagMap tags;

  // Only collected when the matching discovery check is enabled.
  std::optional<EncryptionState> encryption;
  std::optional<PublicAccessState> public_access;

  uint64_t version_count{0};
  int64_t total_version_size{0};

  std::vector<PrefixMetadata> prefixes;

  // Soft failures, "; "-joined. Non-empty with exists=false means the
  // location lookup itself failed.
  std::string error;

  auto addError(const std::string& diagnostic) -> void {
    if (diagnostic.empty()) {
      return;
    }
    if (!error.empty()) {
      error += "; ";
    }
    error += diagnostic;
  }
};

using MetadataMap = std::map<std::string, ResourceMetadata>;

} // namespace Drift::Inspect
