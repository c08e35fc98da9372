#pragma once

// ============================================================================
// storage_provider.h - Abstract object-storage metadata API
// ============================================================================
//
// One implementation per provider. Every call is a single remote round trip
// (no retry); callers wrap calls in executeWithRetry(). Implementations must
// be safe to call from several threads at once.

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/cancel_token.h"
#include "common/time_utils.h"
#include "drift/provider/api_error.h"

namespace Drift::Provider {

using TagMap = std::map<std::string, std::string>;

struct ContainerEntry {
  std::string name;
  Common::EpochSeconds creation_time{0};
};

struct ObjectEntry {
  std::string key;
  int64_t size{0};
  Common::EpochSeconds last_modified{0};
};

struct ObjectPage {
  std::vector<ObjectEntry> objects;
  uint32_t key_count{0};
  bool truncated{false};
};

struct VersionPage {
  uint64_t version_count{0};       // versions plus delete markers
  int64_t total_size{0};
  bool truncated{false};
  std::string next_key_marker;
  std::string next_version_id_marker;
};

struct EncryptionState {
  bool enabled{false};
  std::string algorithm;
  std::string kms_key_id;
};

struct PublicAccessState {
  bool is_public{false};
  bool block_public_acls{false};
  bool ignore_public_acls{false};
  bool block_public_policy{false};
  bool restrict_public_buckets{false};
};

class IStorageProvider {
public:
  IStorageProvider() = default;
  virtual ~IStorageProvider() = default;

  IStorageProvider(const IStorageProvider&) = delete;
  IStorageProvider& operator=(const IStorageProvider&) = delete;
  IStorageProvider(IStorageProvider&&) = delete;
  IStorageProvider& operator=(IStorageProvider&&) = delete;

  [[nodiscard]] virtual auto region() const noexcept -> const std::string& = 0;

  // Client bound to `region`; shares credentials with this one.
  virtual auto forRegion(const std::string& region) -> std::shared_ptr<IStorageProvider> = 0;

  // Account-wide, region-agnostic.
  virtual auto listContainers(const Common::CancelToken& cancel,
                              std::vector<ContainerEntry>& out) -> ApiError = 0;

  virtual auto getContainerLocation(const std::string& container, const Common::CancelToken& cancel,
                                    std::string& region_out) -> ApiError = 0;

  virtual auto getVersioning(const std::string& container, const Common::CancelToken& cancel,
                             bool& enabled) -> ApiError = 0;

  // A container without lifecycle configuration reports 0 rules, not an error.
  virtual auto getLifecycleRuleCount(const std::string& container, const Common::CancelToken& cancel,
                                     uint32_t& rule_count) -> ApiError = 0;

  // A container without tags reports an empty map, not an error.
  virtual auto getTags(const std::string& container, const Common::CancelToken& cancel,
                       TagMap& tags) -> ApiError = 0;

  virtual auto listObjects(const std::string& container, const std::string& prefix, uint32_t max_keys,
                           const Common::CancelToken& cancel, ObjectPage& page) -> ApiError = 0;

  virtual auto listObjectVersions(const std::string& container, const std::string& key_marker,
                                  const std::string& version_id_marker, uint32_t max_keys,
                                  const Common::CancelToken& cancel, VersionPage& page) -> ApiError = 0;

  virtual auto listRegions(const Common::CancelToken& cancel,
                           std::vector<std::string>& regions) -> ApiError = 0;

  virtual auto getEncryption(const std::string& container, const Common::CancelToken& cancel,
                             EncryptionState& state) -> ApiError = 0;

  virtual auto getPublicAccess(const std::string& container, const Common::CancelToken& cancel,
                               PublicAccessState& state) -> ApiError = 0;
};

using StorageProviderPtr = std::shared_ptr<IStorageProvider>;

} // namespace Drift::Provider
