#pragma once

#include <memory>
#include <string>
#include <utility>

#include "drift/provider/retry.h"
#include "drift/provider/storage_provider.h"

namespace Drift::Provider {

// Region-bound provider handle that runs every call through the retry envelope.
class ProviderClient {
public:
  ProviderClient(StorageProviderPtr provider, RetryPolicy policy)
    : provider_(std::move(provider)), policy_(std::move(policy)) {}

  [[nodiscard]] auto region() const noexcept -> const std::string& { return provider_->region(); }
  [[nodiscard]] auto policy() const noexcept -> const RetryPolicy& { return policy_; }

  [[nodiscard]] auto forRegion(const std::string& region) const -> ProviderClient {
    if (region.empty() || region == provider_->region()) {
      return *this;
    }
    return ProviderClient(provider_->forRegion(region), policy_);
  }

  // fn: (IStorageProvider&) -> ApiError
  template<typename Fn>
  auto execute(const char* op_name, const Common::CancelToken& cancel, Fn&& fn) const -> ApiError {
    return executeWithRetry(policy_, cancel, op_name, [&]() { return fn(*provider_); });
  }

private:
  StorageProviderPtr provider_;
  RetryPolicy policy_;
};

} // namespace Drift::Provider
