#pragma once

// In-process IStorageProvider for network-free tests. Region-bound copies
// made by forRegion() share one scripted account.

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "drift/provider/storage_provider.h"

namespace Drift::Testing {

using namespace Drift::Provider;

struct FakeContainer {
    Common::EpochSeconds creation_time{0};
    std::string region{"us-east-1"};
    bool versioning{false};
    uint32_t lifecycle_rules{0};
    TagMap tags;
    std::vector<ObjectEntry> objects;
    uint32_t version_pages{1};
    uint32_t versions_per_page{3};
    int64_t version_size{10};
    EncryptionState encryption{true, "AES256", ""};
    PublicAccessState public_access{};

    // Operation name -> error returned on every call
    std::map<std::string, ApiError> errors;
    // Operation name -> number of transient failures before success
    std::map<std::string, int> transient_failures;
};

struct FakeAccount {
    std::mutex mutex;
    std::map<std::string, FakeContainer> containers;
    std::vector<std::string> regions{"eu-west-1", "us-east-1", "us-west-2"};
    ApiError list_error;
    ApiError regions_error;

    std::chrono::milliseconds call_delay{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::map<std::string, int> calls;           // op -> count
    std::map<std::string, int> region_calls;    // "op@region" -> count
    std::function<void(const std::string&)> on_call;

    auto callCount(const std::string& op) -> int {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = calls.find(op);
        return it == calls.end() ? 0 : it->second;
    }

    auto regionCallCount(const std::string& op, const std::string& region) -> int {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = region_calls.find(op + "@" + region);
        return it == region_calls.end() ? 0 : it->second;
    }
};

inline auto rateLimited() -> ApiError {
    return ApiError::make(ErrorKind::TRANSIENT, 503, "SlowDown", "Please reduce your request rate.");
}

inline auto accessDenied() -> ApiError {
    return ApiError::make(ErrorKind::PERMANENT, 403, "AccessDenied", "Access Denied");
}

class FakeStorageProvider final : public IStorageProvider {
public:
    explicit FakeStorageProvider(std::shared_ptr<FakeAccount> account, std::string region = "us-east-1")
        : account_(std::move(account)), region_(std::move(region)) {}

    auto region() const noexcept -> const std::string& override { return region_; }

    auto forRegion(const std::string& region) -> StorageProviderPtr override {
        return std::make_shared<FakeStorageProvider>(account_, region);
    }

    auto listContainers(const Common::CancelToken& cancel, std::vector<ContainerEntry>& out) -> ApiError override {
        Call call(*this, "ListBuckets");
        if (cancel.isCancelled()) return cancelled(cancel);
        std::lock_guard<std::mutex> lock(account_->mutex);
        if (!account_->list_error.ok()) return account_->list_error;
        for (const auto& [name, c] : account_->containers) {
            out.push_back({name, c.creation_time});
        }
        return ApiError::success();
    }

    auto getContainerLocation(const std::string& container, const Common::CancelToken& cancel,
                              std::string& region_out) -> ApiError override {
        return withContainer("GetBucketLocation", container, cancel, [&](FakeContainer& c) {
            region_out = c.region;
        });
    }

    auto getVersioning(const std::string& container, const Common::CancelToken& cancel, bool& enabled) -> ApiError override {
        return withContainer("GetBucketVersioning", container, cancel, [&](FakeContainer& c) {
            enabled = c.versioning;
        });
    }

    auto getLifecycleRuleCount(const std::string& container, const Common::CancelToken& cancel,
                               uint32_t& rule_count) -> ApiError override {
        return withContainer("GetBucketLifecycleConfiguration", container, cancel, [&](FakeContainer& c) {
            rule_count = c.lifecycle_rules;
        });
    }

    auto getTags(const std::string& container, const Common::CancelToken& cancel, TagMap& tags) -> ApiError override {
        return withContainer("GetBucketTagging", container, cancel, [&](FakeContainer& c) {
            tags = c.tags;
        });
    }

    auto listObjects(const std::string& container, const std::string& prefix, uint32_t max_keys,
                     const Common::CancelToken& cancel, ObjectPage& page) -> ApiError override {
        return withContainer("ListObjectsV2", container, cancel, [&](FakeContainer& c) {
            uint32_t matched = 0;
            for (const auto& object : c.objects) {
                if (object.key.compare(0, prefix.size(), prefix) != 0) continue;
                if (matched < max_keys) {
                    page.objects.push_back(object);
                }
                ++matched;
            }
            page.key_count = matched < max_keys ? matched : max_keys;
            page.truncated = matched > max_keys;
        });
    }

    auto listObjectVersions(const std::string& container, const std::string& key_marker,
                            const std::string& /*version_id_marker*/, uint32_t /*max_keys*/,
                            const Common::CancelToken& cancel, VersionPage& page) -> ApiError override {
        return withContainer("ListObjectVersions", container, cancel, [&](FakeContainer& c) {
            const uint32_t index = key_marker.empty() ? 0 : static_cast<uint32_t>(std::stoul(key_marker));
            page.version_count = c.versions_per_page;
            page.total_size = c.version_size * c.versions_per_page;
            page.truncated = index + 1 < c.version_pages;
            if (page.truncated) {
                page.next_key_marker = std::to_string(index + 1);
                page.next_version_id_marker = "v";
            }
        });
    }

    auto listRegions(const Common::CancelToken& cancel, std::vector<std::string>& regions) -> ApiError override {
        Call call(*this, "DescribeRegions");
        if (cancel.isCancelled()) return cancelled(cancel);
        std::lock_guard<std::mutex> lock(account_->mutex);
        if (!account_->regions_error.ok()) return account_->regions_error;
        regions = account_->regions;
        return ApiError::success();
    }

    auto getEncryption(const std::string& container, const Common::CancelToken& cancel,
                       EncryptionState& state) -> ApiError override {
        return withContainer("GetBucketEncryption", container, cancel, [&](FakeContainer& c) {
            state = c.encryption;
        });
    }

    auto getPublicAccess(const std::string& container, const Common::CancelToken& cancel,
                         PublicAccessState& state) -> ApiError override {
        return withContainer("GetPublicAccessBlock", container, cancel, [&](FakeContainer& c) {
            state = c.public_access;
        });
    }

private:
    // Counts the call, tracks concurrency and applies the configured delay.
    class Call {
    public:
        Call(FakeStorageProvider& owner, const std::string& op) : account_(*owner.account_) {
            std::function<void(const std::string&)> hook;
            {
                std::lock_guard<std::mutex> lock(account_.mutex);
                ++account_.calls[op];
                ++account_.region_calls[op + "@" + owner.region_];
                hook = account_.on_call;
            }
            if (hook) hook(op);
            int now = ++account_.in_flight;
            int seen = account_.max_in_flight.load();
            while (now > seen && !account_.max_in_flight.compare_exchange_weak(seen, now)) {
            }
            if (account_.call_delay.count() > 0) {
                std::this_thread::sleep_for(account_.call_delay);
            }
        }
        ~Call() { --account_.in_flight; }
        Call(const Call&) = delete;
        Call& operator=(const Call&) = delete;

    private:
        FakeAccount& account_;
    };

    static auto cancelled(const Common::CancelToken& cancel) -> ApiError {
        return ApiError::make(ErrorKind::CANCELLED, 0, "Cancelled", cancel.reason());
    }

    template<typename Fn>
    auto withContainer(const char* op, const std::string& name, const Common::CancelToken& cancel, Fn&& fn) -> ApiError {
        Call call(*this, op);
        if (cancel.isCancelled()) return cancelled(cancel);
        std::lock_guard<std::mutex> lock(account_->mutex);
        auto it = account_->containers.find(name);
        if (it == account_->containers.end()) {
            return ApiError::make(ErrorKind::PERMANENT, 404, "NoSuchBucket", "The specified bucket does not exist");
        }
        FakeContainer& c = it->second;
        auto err = c.errors.find(op);
        if (err != c.errors.end()) return err->second;
        auto transient = c.transient_failures.find(op);
        if (transient != c.transient_failures.end() && transient->second > 0) {
            --transient->second;
            return rateLimited();
        }
        fn(c);
        return ApiError::success();
    }

    std::shared_ptr<FakeAccount> account_;
    std::string region_;
};

} // namespace Drift::Testing
