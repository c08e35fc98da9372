// ============================================================================
// aws_signer.cpp - AWS Signature Version 4 Implementation
// ============================================================================

#include "drift/provider/aws_signer.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cstdio>

namespace Drift::Provider {

namespace {

constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";

auto isUnreserved(unsigned char c) noexcept -> bool {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '_' || c == '.' || c == '~';
}

auto trimValue(const std::string& value) -> std::string {
  size_t start = value.find_first_not_of(" \t");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = value.find_last_not_of(" \t");
  return value.substr(start, end - start + 1);
}

} // namespace

// ============================================================================
// Encoding / hashing helpers
// ============================================================================

auto uriEncode(std::string_view input, bool encode_slash) -> std::string {
  std::string out;
  out.reserve(input.size() * 3);
  char buf[4];
  for (unsigned char c : input) {
    if (isUnreserved(c) || (c == '/' && !encode_slash)) {
      out.push_back(static_cast<char>(c));
    } else {
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out.append(buf, 3);
    }
  }
  return out;
}

auto toHex(std::string_view bytes) -> std::string {
  static constexpr char DIGITS[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(DIGITS[c >> 4]);
    out.push_back(DIGITS[c & 0x0F]);
  }
  return out;
}

auto sha256Hex(std::string_view data) -> std::string {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
    return "";
  }
  return toHex(std::string_view(reinterpret_cast<const char*>(digest), digest_len));
}

auto hmacSha256(std::string_view key, std::string_view data) -> std::string {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(),
       key.data(), static_cast<int>(key.size()),
       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
       digest, &digest_len);
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

// ============================================================================
// Canonical request
// ============================================================================

auto canonicalQueryString(const QueryParams& query) -> std::string {
  std::vector<std::pair<std::string, std::string>> encoded;
  encoded.reserve(query.size());
  for (const auto& [key, value] : query) {
    encoded.emplace_back(uriEncode(key, true), uriEncode(value, true));
  }
  std::sort(encoded.begin(), encoded.end());

  std::string out;
  for (const auto& [key, value] : encoded) {
    if (!out.empty()) {
      out.push_back('&');
    }
    out += key;
    out.push_back('=');
    out += value;
  }
  return out;
}

auto canonicalRequest(const SignedRequestInput& req, std::string* signed_headers) -> std::string {
  std::map<std::string, std::string> headers = req.headers;
  headers["host"] = req.host;

  std::string canonical_headers;
  std::string names;
  for (const auto& [name, value] : headers) {
    canonical_headers += name + ":" + trimValue(value) + "\n";
    if (!names.empty()) {
      names.push_back(';');
    }
    names += name;
  }
  if (signed_headers) {
    *signed_headers = names;
  }

  std::string out;
  out.reserve(256);
  out += req.method + "\n";
  out += req.canonical_uri + "\n";
  out += canonicalQueryString(req.query) + "\n";
  out += canonical_headers + "\n";
  out += names + "\n";
  out += req.payload_hash;
  return out;
}

auto deriveSigningKey(const std::string& secret, const std::string& date_stamp,
                      const std::string& region, const std::string& service) -> std::string {
  std::string k_date = hmacSha256("AWS4" + secret, date_stamp);
  std::string k_region = hmacSha256(k_date, region);
  std::string k_service = hmacSha256(k_region, service);
  return hmacSha256(k_service, "aws4_request");
}

auto buildAuthorization(const SignedRequestInput& req, const AwsCredentials& creds) -> std::string {
  std::string signed_headers;
  const std::string canonical = canonicalRequest(req, &signed_headers);

  const std::string date_stamp = req.amz_date.substr(0, 8);
  const std::string scope = date_stamp + "/" + req.region + "/" + req.service + "/aws4_request";
  const std::string string_to_sign =
      std::string(ALGORITHM) + "\n" + req.amz_date + "\n" + scope + "\n" + sha256Hex(canonical);

  const std::string key = deriveSigningKey(creds.secret_access_key, date_stamp, req.region, req.service);
  const std::string signature = toHex(hmacSha256(key, string_to_sign));

  return std::string(ALGORITHM) + " Credential=" + creds.access_key_id + "/" + scope +
         ", SignedHeaders=" + signed_headers + ", Signature=" + signature;
}

} // namespace Drift::Provider
