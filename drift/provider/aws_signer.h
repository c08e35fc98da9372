#pragma once

// ============================================================================
// aws_signer.h - AWS Signature Version 4
// ============================================================================

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace Drift::Provider {

struct AwsCredentials {
  std::string access_key_id;
  std::string secret_access_key;
  std::string session_token;

  [[nodiscard]] auto valid() const noexcept -> bool {
    return !access_key_id.empty() && !secret_access_key.empty();
  }
};

// Query parameters; an empty value still emits "key=" in the canonical form.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct SignedRequestInput {
  std::string method{"GET"};
  std::string host;
  std::string canonical_uri{"/"};   // already URI-encoded
  QueryParams query;
  std::map<std::string, std::string> headers;   // lower-case names; host is added
  std::string payload_hash;                      // hex SHA-256 of the body
  std::string amz_date;                          // 20150830T123600Z
  std::string region;
  std::string service;
};

// RFC 3986 encoding; '/' is kept when encode_slash is false.
[[nodiscard]] auto uriEncode(std::string_view input, bool encode_slash) -> std::string;

[[nodiscard]] auto sha256Hex(std::string_view data) -> std::string;
[[nodiscard]] auto hmacSha256(std::string_view key, std::string_view data) -> std::string;
[[nodiscard]] auto toHex(std::string_view bytes) -> std::string;

[[nodiscard]] auto canonicalQueryString(const QueryParams& query) -> std::string;
[[nodiscard]] auto canonicalRequest(const SignedRequestInput& req, std::string* signed_headers) -> std::string;
[[nodiscard]] auto deriveSigningKey(const std::string& secret, const std::string& date_stamp,
                                    const std::string& region, const std::string& service) -> std::string;

// Value for the Authorization header.
[[nodiscard]] auto buildAuthorization(const SignedRequestInput& req, const AwsCredentials& creds) -> std::string;

} // namespace Drift::Provider
