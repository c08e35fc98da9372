// ============================================================================
// s3_provider.cpp - S3 metadata API Implementation
// ============================================================================

#include "drift/provider/s3_provider.h"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>

#include "common/logging.h"
#include "common/time_utils.h"
#include "drift/provider/credentials.h"
#include "drift/provider/retry.h"
#include "drift/provider/s3_responses.h"

namespace Drift::Provider::S3 {

namespace {

constexpr size_t MAX_RESPONSE_BYTES = 16 * 1024 * 1024;
constexpr long CONNECT_TIMEOUT_SECONDS = 10;
constexpr const char* EC2_API_VERSION = "2016-11-15";

struct ResponseContext {
  std::string* body;
  bool truncated;
};

// CURL write callback; keeps at most MAX_RESPONSE_BYTES
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total_size = size * nmemb;
  auto* ctx = static_cast<ResponseContext*>(userp);

  size_t room = MAX_RESPONSE_BYTES - std::min(MAX_RESPONSE_BYTES, ctx->body->size());
  if (total_size > room) {
    ctx->truncated = true;
  }
  ctx->body->append(static_cast<const char*>(contents), std::min(total_size, room));
  return total_size;
}

// Aborts the transfer once the cancel token fires
int progressCallback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* cancel = static_cast<const Common::CancelToken*>(userp);
  return cancel->isCancelled() ? 1 : 0;
}

auto transportError(CURLcode res) -> ApiError {
  const char* text = curl_easy_strerror(res);
  switch (res) {
    case CURLE_OPERATION_TIMEDOUT:
      return ApiError::make(ErrorKind::TRANSIENT, 0, "RequestTimeout", text);
    case CURLE_COULDNT_CONNECT:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
      return ApiError::make(ErrorKind::TRANSIENT, 0, "ServiceUnavailable", text);
    default:
      return ApiError::make(ErrorKind::PERMANENT, 0, "TransportError", text);
  }
}

auto domainSuffix(const std::string& region) -> const char* {
  return region.rfind("cn-", 0) == 0 ? "amazonaws.com.cn" : "amazonaws.com";
}

// "https://minio.local:9000" -> host "minio.local:9000", tls true
auto splitEndpoint(const std::string& endpoint, std::string& host, bool& use_tls) -> void {
  use_tls = true;
  std::string rest = endpoint;
  if (rest.rfind("https://", 0) == 0) {
    rest = rest.substr(8);
  } else if (rest.rfind("http://", 0) == 0) {
    rest = rest.substr(7);
    use_tls = false;
  }
  while (!rest.empty() && rest.back() == '/') {
    rest.pop_back();
  }
  host = rest;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

S3Provider::S3Provider(AwsCredentials credentials, S3ProviderConfig config)
  : credentials_(std::move(credentials)),
    config_(std::move(config)) {}

auto S3Provider::create(const std::string& profile, S3ProviderConfig config) -> std::shared_ptr<S3Provider> {
  AwsCredentials creds;
  if (!CredentialLoader::load(profile, creds)) {
    return nullptr;
  }
  LOG_INFO("S3 provider ready: region=%s endpoint=%s", config.region.c_str(),
           config.endpoint.empty() ? "(aws)" : config.endpoint.c_str());
  return std::make_shared<S3Provider>(std::move(creds), std::move(config));
}

auto S3Provider::globalInit() noexcept -> bool {
  CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (res != CURLE_OK) {
    LOG_ERROR("curl_global_init failed: %s", curl_easy_strerror(res));
    return false;
  }
  return true;
}

auto S3Provider::globalCleanup() noexcept -> void {
  curl_global_cleanup();
}

auto S3Provider::forRegion(const std::string& region) -> StorageProviderPtr {
  S3ProviderConfig cfg = config_;
  cfg.region = region;
  return std::make_shared<S3Provider>(credentials_, std::move(cfg));
}

// ============================================================================
// Addressing
// ============================================================================

auto S3Provider::serviceHost(const std::string& service) const -> std::string {
  return service + "." + config_.region + "." + domainSuffix(config_.region);
}

auto S3Provider::bucketRequest(const std::string& container, QueryParams query) const -> HttpRequest {
  HttpRequest req;
  req.region = config_.region;
  req.query = std::move(query);

  if (!config_.endpoint.empty()) {
    splitEndpoint(config_.endpoint, req.host, req.use_tls);
    req.path = "/" + uriEncode(container, true);
    return req;
  }

  // Dotted names break the wildcard TLS certificate; use path style for them.
  if (container.find('.') != std::string::npos) {
    req.host = serviceHost("s3");
    req.path = "/" + uriEncode(container, true);
  } else {
    req.host = container + "." + serviceHost("s3");
    req.path = "/";
  }
  return req;
}

// ============================================================================
// HTTP
// ============================================================================

auto S3Provider::perform(const HttpRequest& request, const Common::CancelToken& cancel,
                         HttpResponse& response) -> ApiError {
  if (cancel.isCancelled()) {
    return cancelledError(cancel);
  }

  std::string amz_date;
  std::string date_stamp;
  Common::formatAmzDate(Common::getWallClockSeconds(), amz_date, date_stamp);

  SignedRequestInput sign;
  sign.method = request.method;
  sign.host = request.host;
  sign.canonical_uri = request.path;
  sign.query = request.query;
  sign.payload_hash = sha256Hex("");
  sign.amz_date = amz_date;
  sign.region = request.region;
  sign.service = request.service;
  sign.headers["x-amz-date"] = amz_date;
  if (request.service == "s3") {
    sign.headers["x-amz-content-sha256"] = sign.payload_hash;
  }
  if (!credentials_.session_token.empty()) {
    sign.headers["x-amz-security-token"] = credentials_.session_token;
  }
  const std::string authorization = buildAuthorization(sign, credentials_);

  std::string url = std::string(request.use_tls ? "https://" : "http://") + request.host + request.path;
  const std::string query = canonicalQueryString(request.query);
  if (!query.empty()) {
    url += "?" + query;
  }

  CURL* curl = curl_easy_init();
  if (!curl) {
    return ApiError::make(ErrorKind::PERMANENT, 0, "TransportError", "curl_easy_init failed");
  }

  struct curl_slist* headers = nullptr;
  const std::string auth_header = "Authorization: " + authorization;
  headers = curl_slist_append(headers, auth_header.c_str());
  for (const auto& [name, value] : sign.headers) {
    const std::string line = name + ": " + value;
    headers = curl_slist_append(headers, line.c_str());
  }

  long timeout_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(config_.request_timeout).count());
  if (cancel.hasDeadline()) {
    timeout_ms = std::min<long>(timeout_ms, std::max<long>(1, static_cast<long>(cancel.remaining().count())));
  }

  response.body.clear();
  ResponseContext ctx{&response.body, false};

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<Common::CancelToken*>(&cancel));
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_SECONDS);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);

  CURLcode res = curl_easy_perform(curl);
  response.status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res == CURLE_ABORTED_BY_CALLBACK || (res != CURLE_OK && cancel.isCancelled())) {
    return cancelledError(cancel);
  }
  if (res != CURLE_OK) {
    LOG_DEBUG("%s %s%s failed: %s", request.method.c_str(), request.host.c_str(), request.path.c_str(),
              curl_easy_strerror(res));
    return transportError(res);
  }
  if (ctx.truncated) {
    LOG_WARN("Response truncated at %zu bytes: %s", MAX_RESPONSE_BYTES, request.host.c_str());
  }

  if (response.status >= 200 && response.status < 300) {
    return ApiError::success();
  }

  std::string code;
  std::string message;
  if (!parseErrorBody(response.body, code, message)) {
    code = "HTTP" + std::to_string(response.status);
    message = "HTTP status " + std::to_string(response.status);
  }
  return ApiError::make(classifyError(code, message, response.status), response.status,
                        std::move(code), std::move(message));
}

auto S3Provider::bucketGet(const std::string& container, QueryParams query, const Common::CancelToken& cancel,
                           HttpResponse& response) -> ApiError {
  return perform(bucketRequest(container, std::move(query)), cancel, response);
}

static auto unexpectedBody(const char* operation) -> ApiError {
  return ApiError::make(ErrorKind::PERMANENT, 200, "MalformedResponse",
                        std::string("unexpected ") + operation + " response body");
}

// ============================================================================
// Operations
// ============================================================================

auto S3Provider::listContainers(const Common::CancelToken& cancel, std::vector<ContainerEntry>& out) -> ApiError {
  std::vector<ContainerEntry> all;
  std::string token;

  do {
    HttpRequest req;
    req.region = config_.region;
    if (!config_.endpoint.empty()) {
      splitEndpoint(config_.endpoint, req.host, req.use_tls);
    } else {
      req.host = serviceHost("s3");
    }
    req.query.emplace_back("max-buckets", "1000");
    if (!token.empty()) {
      req.query.emplace_back("continuation-token", token);
    }

    HttpResponse resp;
    ApiError err = perform(req, cancel, resp);
    if (!err.ok()) {
      return err;
    }
    if (!parseListBuckets(resp.body, all, token)) {
      return unexpectedBody("ListBuckets");
    }
  } while (!token.empty());

  out = std::move(all);
  return ApiError::success();
}

auto S3Provider::getContainerLocation(const std::string& container, const Common::CancelToken& cancel,
                                      std::string& region_out) -> ApiError {
  // Location lookups go to the global endpoint so any bucket answers.
  HttpRequest req;
  req.query.emplace_back("location", "");
  req.path = "/" + uriEncode(container, true);
  if (!config_.endpoint.empty()) {
    splitEndpoint(config_.endpoint, req.host, req.use_tls);
    req.region = config_.region;
  } else {
    req.region = config_.region.rfind("cn-", 0) == 0 ? config_.region : "us-east-1";
    req.host = req.region == "us-east-1" ? "s3.amazonaws.com" : serviceHost("s3");
  }

  HttpResponse resp;
  ApiError err = perform(req, cancel, resp);
  if (!err.ok()) {
    return err;
  }
  if (!parseLocation(resp.body, region_out)) {
    return unexpectedBody("GetBucketLocation");
  }
  return ApiError::success();
}

auto S3Provider::getVersioning(const std::string& container, const Common::CancelToken& cancel,
                               bool& enabled) -> ApiError {
  HttpResponse resp;
  ApiError err = bucketGet(container, {{"versioning", ""}}, cancel, resp);
  if (!err.ok()) {
    return err;
  }
  if (!parseVersioning(resp.body, enabled)) {
    return unexpectedBody("GetBucketVersioning");
  }
  return ApiError::success();
}

auto S3Provider::getLifecycleRuleCount(const std::string& container, const Common::CancelToken& cancel,
                                       uint32_t& rule_count) -> ApiError {
  HttpResponse resp;
  ApiError err = bucketGet(container, {{"lifecycle", ""}}, cancel, resp);
  if (err.code == "NoSuchLifecycleConfiguration") {
    rule_count = 0;
    return ApiError::success();
  }
  if (!err.ok()) {
    return err;
  }
  if (!parseLifecycleRuleCount(resp.body, rule_count)) {
    return unexpectedBody("GetBucketLifecycleConfiguration");
  }
  return ApiError::success();
}

auto S3Provider::getTags(const std::string& container, const Common::CancelToken& cancel, TagMap& tags) -> ApiError {
  HttpResponse resp;
  ApiError err = bucketGet(container, {{"tagging", ""}}, cancel, resp);
  if (err.code == "NoSuchTagSet") {
    tags.clear();
    return ApiError::success();
  }
  if (!err.ok()) {
    return err;
  }
  if (!parseTagging(resp.body, tags)) {
    return unexpectedBody("GetBucketTagging");
  }
  return ApiError::success();
}

auto S3Provider::listObjects(const std::string& container, const std::string& prefix, uint32_t max_keys,
                             const Common::CancelToken& cancel, ObjectPage& page) -> ApiError {
  QueryParams query{{"list-type", "2"}, {"max-keys", std::to_string(max_keys)}};
  if (!prefix.empty()) {
    query.emplace_back("prefix", prefix);
  }

  HttpResponse resp;
  ApiError err = bucketGet(container, std::move(query), cancel, resp);
  if (!err.ok()) {
    return err;
  }
  if (!parseListObjects(resp.body, page)) {
    return unexpectedBody("ListObjectsV2");
  }
  return ApiError::success();
}

auto S3Provider::listObjectVersions(const std::string& container, const std::string& key_marker,
                                    const std::string& version_id_marker, uint32_t max_keys,
                                    const Common::CancelToken& cancel, VersionPage& page) -> ApiError {
  QueryParams query{{"versions", ""}, {"max-keys", std::to_string(max_keys)}};
  if (!key_marker.empty()) {
    query.emplace_back("key-marker", key_marker);
  }
  if (!version_id_marker.empty()) {
    query.emplace_back("version-id-marker", version_id_marker);
  }

  HttpResponse resp;
  ApiError err = bucketGet(container, std::move(query), cancel, resp);
  if (!err.ok()) {
    return err;
  }
  if (!parseListVersions(resp.body, page)) {
    return unexpectedBody("ListObjectVersions");
  }
  return ApiError::success();
}

auto S3Provider::listRegions(const Common::CancelToken& cancel, std::vector<std::string>& regions) -> ApiError {
  HttpRequest req;
  req.host = serviceHost("ec2");
  req.region = config_.region;
  req.service = "ec2";
  req.query = {{"Action", "DescribeRegions"}, {"Version", EC2_API_VERSION}};

  HttpResponse resp;
  ApiError err = perform(req, cancel, resp);
  if (!err.ok()) {
    return err;
  }
  std::vector<std::string> found;
  if (!parseDescribeRegions(resp.body, found)) {
    return unexpectedBody("DescribeRegions");
  }
  std::sort(found.begin(), found.end());
  regions = std::move(found);
  return ApiError::success();
}

auto S3Provider::getEncryption(const std::string& container, const Common::CancelToken& cancel,
                               EncryptionState& state) -> ApiError {
  HttpResponse resp;
  ApiError err = bucketGet(container, {{"encryption", ""}}, cancel, resp);
  if (err.code == "ServerSideEncryptionConfigurationNotFoundError") {
    state = EncryptionState{};
    return ApiError::success();
  }
  if (!err.ok()) {
    return err;
  }
  if (!parseEncryption(resp.body, state)) {
    return unexpectedBody("GetBucketEncryption");
  }
  return ApiError::success();
}

auto S3Provider::getPublicAccess(const std::string& container, const Common::CancelToken& cancel,
                                 PublicAccessState& state) -> ApiError {
  PublicAccessState result;

  HttpResponse resp;
  ApiError err = bucketGet(container, {{"publicAccessBlock", ""}}, cancel, resp);
  if (err.ok()) {
    if (!parsePublicAccessBlock(resp.body, result)) {
      return unexpectedBody("GetPublicAccessBlock");
    }
  } else if (err.code != "NoSuchPublicAccessBlockConfiguration") {
    return err;
  }

  bool policy_public = false;
  err = bucketGet(container, {{"policyStatus", ""}}, cancel, resp);
  if (err.ok()) {
    if (!parsePolicyStatus(resp.body, policy_public)) {
      return unexpectedBody("GetBucketPolicyStatus");
    }
  } else if (err.code != "NoSuchBucketPolicy") {
    return err;
  }

  // RestrictPublicBuckets limits a public policy to in-account principals.
  result.is_public = policy_public && !result.restrict_public_buckets;
  state = result;
  return ApiError::success();
}

} // namespace Drift::Provider::S3
