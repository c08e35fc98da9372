#pragma once

// ============================================================================
// s3_provider.h - S3 metadata API over HTTPS (libcurl + SigV4)
// ============================================================================

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "drift/provider/aws_signer.h"
#include "drift/provider/storage_provider.h"

namespace Drift::Provider::S3 {

struct S3ProviderConfig {
  std::string region{"us-east-1"};
  std::string endpoint;                      // custom S3-compatible endpoint; forces path style
  std::chrono::seconds request_timeout{30};  // per HTTP call, capped by the cancel token
};

struct HttpRequest {
  std::string method{"GET"};
  std::string host;
  std::string path{"/"};     // encoded
  QueryParams query;
  std::string region;        // signing region
  std::string service{"s3"};
  bool use_tls{true};
};

struct HttpResponse {
  long status{0};
  std::string body;
};

class S3Provider final : public IStorageProvider {
public:
  S3Provider(AwsCredentials credentials, S3ProviderConfig config);
  ~S3Provider() override = default;

  // Loads credentials for `profile` and builds a provider; nullptr on failure.
  [[nodiscard]] static auto create(const std::string& profile, S3ProviderConfig config) -> std::shared_ptr<S3Provider>;

  // curl_global_init; call once from main before any worker threads start.
  static auto globalInit() noexcept -> bool;
  static auto globalCleanup() noexcept -> void;

  [[nodiscard]] auto region() const noexcept -> const std::string& override { return config_.region; }
  auto forRegion(const std::string& region) -> StorageProviderPtr override;

  auto listContainers(const Common::CancelToken& cancel, std::vector<ContainerEntry>& out) -> ApiError override;
  auto getContainerLocation(const std::string& container, const Common::CancelToken& cancel,
                            std::string& region_out) -> ApiError override;
  auto getVersioning(const std::string& container, const Common::CancelToken& cancel,
                     bool& enabled) -> ApiError override;
  auto getLifecycleRuleCount(const std::string& container, const Common::CancelToken& cancel,
                             uint32_t& rule_count) -> ApiError override;
  auto getTags(const std::string& container, const Common::CancelToken& cancel, TagMap& tags) -> ApiError override;
  auto listObjects(const std::string& container, const std::string& prefix, uint32_t max_keys,
                   const Common::CancelToken& cancel, ObjectPage& page) -> ApiError override;
  auto listObjectVersions(const std::string& container, const std::string& key_marker,
                          const std::string& version_id_marker, uint32_t max_keys,
                          const Common::CancelToken& cancel, VersionPage& page) -> ApiError override;
  auto listRegions(const Common::CancelToken& cancel, std::vector<std::string>& regions) -> ApiError override;
  auto getEncryption(const std::string& container, const Common::CancelToken& cancel,
                     EncryptionState& state) -> ApiError override;
  auto getPublicAccess(const std::string& container, const Common::CancelToken& cancel,
                       PublicAccessState& state) -> ApiError override;

  // Request addressing for a bucket sub-resource.
  [[nodiscard]] auto bucketRequest(const std::string& container, QueryParams query) const -> HttpRequest;
  [[nodiscard]] auto serviceHost(const std::string& service) const -> std::string;

private:
  // One signed round trip. Non-2xx responses become ApiError with the
  // provider's error code; transport failures become transient errors.
  auto perform(const HttpRequest& request, const Common::CancelToken& cancel, HttpResponse& response) -> ApiError;

  auto bucketGet(const std::string& container, QueryParams query, const Common::CancelToken& cancel,
                 HttpResponse& response) -> ApiError;

  AwsCredentials credentials_;
  S3ProviderConfig config_;
};

} // namespace Drift::Provider::S3
