#pragma once

#include <cstdint>
#include <string>

namespace Drift::Provider {

enum class ErrorKind : uint8_t {
  NONE = 0,
  TRANSIENT = 1,   // rate limit / availability; retried
  PERMANENT = 2,   // everything else; returned immediately
  CANCELLED = 3    // caller timeout or cancel; never retried
};

// Result of a single remote call. Data travels through out-params.
struct ApiError {
  ErrorKind kind{ErrorKind::NONE};
  long http_status{0};
  std::string code;
  std::string message;

  [[nodiscard]] auto ok() const noexcept -> bool { return kind == ErrorKind::NONE; }
  [[nodiscard]] auto cancelled() const noexcept -> bool { return kind == ErrorKind::CANCELLED; }

  // "Code: message", or whichever half carries the information.
  [[nodiscard]] auto describe() const -> std::string {
    if (code.empty()) {
      return message;
    }
    if (message.empty()) {
      return code;
    }
    if (message.find(code) != std::string::npos) {
      return message;
    }
    return code + ": " + message;
  }

  static auto success() -> ApiError { return ApiError{}; }

  static auto make(ErrorKind kind, long status, std::string code, std::string message) -> ApiError {
    ApiError e;
    e.kind = kind;
    e.http_status = status;
    e.code = std::move(code);
    e.message = std::move(message);
    return e;
  }
};

// Kind for a provider error code / HTTP status pair.
[[nodiscard]] auto classifyError(const std::string& code, const std::string& message, long http_status) noexcept -> ErrorKind;

// Matches the retryable signature set.
[[nodiscard]] auto isRetryableSignature(const std::string& code, const std::string& message, long http_status) noexcept -> bool;

// "<operation> failed for <container>: <hint or message>"
[[nodiscard]] auto formatOperationError(const char* operation, const std::string& container, const ApiError& error) -> std::string;

} // namespace Drift::Provider
