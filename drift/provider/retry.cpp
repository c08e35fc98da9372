#include "drift/provider/retry.h"

namespace Drift::Provider {

namespace {

// Codes and message fragments that mark a rate-limit or availability failure.
constexpr const char* RETRYABLE_SIGNATURES[] = {
  "RequestLimitExceeded",
  "ServiceUnavailable",
  "SlowDown",
  "RequestTimeout",
  "TooManyRequests",
  "InternalError",
  "Throttling",
  "503",
  "429",
};

auto containsSignature(const std::string& text) noexcept -> bool {
  for (const char* sig : RETRYABLE_SIGNATURES) {
    if (!text.empty() && text.find(sig) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

auto isRetryableSignature(const std::string& code, const std::string& message, long http_status) noexcept -> bool {
  if (http_status == 429 || (http_status >= 500 && http_status <= 599)) {
    return true;
  }
  return containsSignature(code) || containsSignature(message);
}

auto classifyError(const std::string& code, const std::string& message, long http_status) noexcept -> ErrorKind {
  return isRetryableSignature(code, message, http_status) ? ErrorKind::TRANSIENT : ErrorKind::PERMANENT;
}

auto defaultRetryable(const ApiError& error) noexcept -> bool {
  if (error.kind == ErrorKind::CANCELLED) {
    return false;
  }
  return isRetryableSignature(error.code, error.message, error.http_status);
}

auto cancelledError(const Common::CancelToken& cancel) -> ApiError {
  return ApiError::make(ErrorKind::CANCELLED, 0, "Cancelled", cancel.reason());
}

auto formatOperationError(const char* operation, const std::string& container, const ApiError& error) -> std::string {
  const std::string head = std::string(operation) + " failed for " + container + ": ";

  if (error.code == "AccessDenied") {
    return head + "Access Denied - check IAM permissions";
  }
  if (error.code == "NoSuchBucket") {
    return head + "Bucket does not exist or is in a different region";
  }
  if (error.code == "RequestLimitExceeded" || error.code == "SlowDown") {
    return head + "Rate limit exceeded - consider reducing --concurrency";
  }
  return head + error.describe();
}

} // namespace Drift::Provider
