#pragma once

// ============================================================================
// inspector.h - Concurrent metadata collection
// ============================================================================
//
// Two modes:
//   inspect(refs)   - only the containers named by references, with their
//                     prefixes
//   discoverAll()   - every container in the account, each inspected through
//                     a client bound to its own region
//
// Only region resolution and the account-wide listing fail the batch. A failed
// location lookup marks that one container exists=false; any other failed
// call leaves the field at its zero value and appends a diagnostic to the
// container's error string.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/cancel_token.h"
#include "common/time_utils.h"
#include "drift/inspect/metadata.h"
#include "drift/inspect/region_resolver.h"
#include "drift/provider/provider_client.h"
#include "drift/scanner/reference.h"

namespace Drift::Inspect {

enum class CollectionStatus : uint8_t {
  OK = 0,
  SYSTEMIC_FAILURE = 1,
  CANCELLED = 2
};

struct CollectionResult {
  CollectionStatus status{CollectionStatus::OK};
  std::string error;                  // "<operation>: <cause>" on failure
  std::vector<std::string> regions;   // resolved region scope
  MetadataMap containers;

  [[nodiscard]] auto ok() const noexcept -> bool { return status == CollectionStatus::OK; }
};

struct InspectorConfig {
  static constexpr int32_t DEFAULT_CONCURRENCY = 10;

  int32_t concurrency{DEFAULT_CONCURRENCY};   // <= 0 means DEFAULT_CONCURRENCY
  RegionSelection regions;
  bool check_encryption{false};
  bool check_public_access{false};
  bool include_unreferenced{false};   // inspect(): also collect listed but unreferenced containers

  uint32_t reference_sample_keys{1};
  uint32_t discovery_sample_keys{100};
  uint32_t prefix_page_keys{1000};
  uint32_t version_page_keys{1000};
  uint32_t max_version_pages{100};

  std::function<Common::EpochSeconds()> clock{Common::getWallClockSeconds};
};

// (completed, total, description); called once per finished container.
using ProgressCallback = std::function<void(size_t, size_t, const std::string&)>;

class Inspector {
public:
  Inspector(Provider::ProviderClient client, InspectorConfig config);

  auto setProgressCallback(ProgressCallback callback) -> void { progress_ = std::move(callback); }

  [[nodiscard]] auto inspect(const Scanner::ReferenceList& references,
                             const Common::CancelToken& cancel) -> CollectionResult;

  [[nodiscard]] auto discoverAll(const Common::CancelToken& cancel) -> CollectionResult;

  [[nodiscard]] auto concurrency() const noexcept -> size_t { return width_; }

  // Value plus diagnostic; a missing value always carries a diagnostic.
  template<typename T>
  struct FieldResult {
    std::optional<T> value;
    std::string diagnostic;
    bool cancelled{false};
  };

private:
  struct Job {
    std::string name;
    Common::EpochSeconds creation_time{0};
    std::optional<std::string> region;   // already resolved in discovery mode
    std::string location_error;          // lookup failed during discovery
    std::vector<std::string> prefixes;
  };

  enum class Mode : uint8_t { REFERENCE, DISCOVERY };

  auto resolveScope(const Common::CancelToken& cancel, CollectionResult& result) -> bool;
  auto listAccount(const Common::CancelToken& cancel, CollectionResult& result,
                   std::vector<Provider::ContainerEntry>& entries) -> bool;

  auto runJobs(std::vector<Job>& jobs, Mode mode, const Common::CancelToken& cancel,
               CollectionResult& result) -> void;
  auto collectContainer(const Job& job, Mode mode, const Common::CancelToken& cancel) -> ResourceMetadata;

  auto lookupRegion(const std::string& name, const Common::CancelToken& cancel) -> FieldResult<std::string>;
  auto collectVersioning(const Provider::ProviderClient& client, const std::string& name,
                         const Common::CancelToken& cancel) -> FieldResult<bool>;
  auto collectLifecycle(const Provider::ProviderClient& client, const std::string& name,
                        const Common::CancelToken& cancel) -> FieldResult<uint32_t>;
  auto collectTags(const Provider::ProviderClient& client, const std::string& name,
                   const Common::CancelToken& cancel) -> FieldResult<TagMap>;
  auto collectSample(const Provider::ProviderClient& client, const std::string& name, uint32_t max_keys,
                     const Common::CancelToken& cancel) -> FieldResult<Provider::ObjectPage>;
  auto collectVersions(const Provider::ProviderClient& client, const std::string& name,
                       const Common::CancelToken& cancel, ResourceMetadata& meta) -> std::string;
  auto collectEncryption(const Provider::ProviderClient& client, const std::string& name,
                         const Common::CancelToken& cancel) -> FieldResult<EncryptionState>;
  auto collectPublicAccess(const Provider::ProviderClient& client, const std::string& name,
                           const Common::CancelToken& cancel) -> FieldResult<PublicAccessState>;
  auto collectPrefixes(const Provider::ProviderClient& client, const std::string& name,
                       const std::vector<std::string>& prefixes, const Common::CancelToken& cancel,
                       ResourceMetadata& meta) -> void;
  auto inspectPrefix(const Provider::ProviderClient& client, const std::string& name,
                     const std::string& prefix, const Common::CancelToken& cancel) -> PrefixMetadata;

  auto reportProgress(size_t completed, size_t total, const std::string& description) -> void;

  Provider::ProviderClient client_;
  InspectorConfig config_;
  size_t width_;
  std::vector<std::string> scope_;
  ProgressCallback progress_;
};

} // namespace Drift::Inspect
