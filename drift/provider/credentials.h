#pragma once

#include <string>

#include "drift/provider/aws_signer.h"

namespace Drift::Provider {

class CredentialLoader {
public:
  // With no profile named, the environment (AWS_ACCESS_KEY_ID,
  // AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN) is tried first. Otherwise the
  // profile is read from the shared credentials file; an empty profile means
  // $AWS_PROFILE, falling back to "default".
  [[nodiscard]] static auto load(const std::string& profile, AwsCredentials& out) noexcept -> bool;

  [[nodiscard]] static auto fromEnvironment(AwsCredentials& out) noexcept -> bool;

  // INI-style file: [profile] sections with key = value lines.
  [[nodiscard]] static auto fromSharedFile(const char* path, const std::string& profile,
                                           AwsCredentials& out) noexcept -> bool;

  // $AWS_SHARED_CREDENTIALS_FILE or ~/.aws/credentials.
  [[nodiscard]] static auto sharedFilePath() -> std::string;

  // --aws-region, $AWS_REGION, $AWS_DEFAULT_REGION, then us-east-1.
  [[nodiscard]] static auto resolveDefaultRegion(const std::string& explicit_region) -> std::string;
};

} // namespace Drift::Provider
