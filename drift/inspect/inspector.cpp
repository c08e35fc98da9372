// ============================================================================
// inspector.cpp - Concurrent metadata collection Implementation
// ============================================================================

#include "drift/inspect/inspector.h"

#include <algorithm>
#include <future>
#include <map>
#include <mutex>

#include "common/logging.h"
#include "common/thread_utils.h"

namespace Drift::Inspect {

using Provider::ApiError;
using Provider::IStorageProvider;
using Provider::ProviderClient;

namespace {

// One retried provider call turned into a value-or-diagnostic.
template<typename T, typename Call>
auto fetchField(const ProviderClient& client, const char* op, const std::string& subject,
                const Common::CancelToken& cancel, Call&& call) -> Inspector::FieldResult<T> {
  Inspector::FieldResult<T> out;
  T value{};
  ApiError err = client.execute(op, cancel, [&](IStorageProvider& p) {
    value = T{};
    return call(p, value);
  });
  if (err.ok()) {
    out.value = std::move(value);
    return out;
  }
  out.cancelled = err.cancelled();
  out.diagnostic = out.cancelled ? std::string(op) + " cancelled for " + subject
                                 : Provider::formatOperationError(op, subject, err);
  return out;
}

auto systemicStatus(const ApiError& err) noexcept -> CollectionStatus {
  return err.cancelled() ? CollectionStatus::CANCELLED : CollectionStatus::SYSTEMIC_FAILURE;
}

} // namespace

Inspector::Inspector(ProviderClient client, InspectorConfig config)
  : client_(std::move(client)),
    config_(std::move(config)),
    width_(config_.concurrency > 0 ? static_cast<size_t>(config_.concurrency)
                                   : static_cast<size_t>(InspectorConfig::DEFAULT_CONCURRENCY)),
    scope_(),
    progress_() {
  if (!config_.clock) {
    config_.clock = Common::getWallClockSeconds;
  }
  if (config_.concurrency <= 0) {
    LOG_WARN("Concurrency %d is not positive, using %zu", config_.concurrency, width_);
  }
}

// ============================================================================
// Batch entry points
// ============================================================================

auto Inspector::inspect(const Scanner::ReferenceList& references,
                        const Common::CancelToken& cancel) -> CollectionResult {
  CollectionResult result;
  if (!resolveScope(cancel, result)) {
    return result;
  }

  // Unique prefixes per container
  std::map<std::string, std::vector<std::string>> grouped;
  for (const auto& ref : references) {
    if (ref.container.empty()) {
      continue;
    }
    auto& prefixes = grouped[ref.container];
    if (!ref.prefix.empty() && std::find(prefixes.begin(), prefixes.end(), ref.prefix) == prefixes.end()) {
      prefixes.push_back(ref.prefix);
    }
  }
  if (grouped.empty() && !config_.include_unreferenced) {
    LOG_INFO("No container references to inspect");
    return result;
  }

  std::vector<Provider::ContainerEntry> entries;
  if (!listAccount(cancel, result, entries)) {
    return result;
  }
  std::map<std::string, Common::EpochSeconds> created;
  for (const auto& entry : entries) {
    created[entry.name] = entry.creation_time;
    if (config_.include_unreferenced) {
      grouped.try_emplace(entry.name);
    }
  }

  std::vector<Job> jobs;
  jobs.reserve(grouped.size());
  for (auto& [name, prefixes] : grouped) {
    Job job;
    job.name = name;
    auto it = created.find(name);
    if (it != created.end()) {
      job.creation_time = it->second;
    } else {
      LOG_DEBUG("Container %s is not in the account listing", name.c_str());
    }
    std::sort(prefixes.begin(), prefixes.end());
    job.prefixes = std::move(prefixes);
    jobs.push_back(std::move(job));
  }

  LOG_INFO("Inspecting %zu container(s) with concurrency %zu", jobs.size(), width_);
  runJobs(jobs, Mode::REFERENCE, cancel, result);
  return result;
}

auto Inspector::discoverAll(const Common::CancelToken& cancel) -> CollectionResult {
  CollectionResult result;
  if (!resolveScope(cancel, result)) {
    return result;
  }

  std::vector<Provider::ContainerEntry> entries;
  if (!listAccount(cancel, result, entries)) {
    return result;
  }
  LOG_INFO("Account listing returned %zu container(s)", entries.size());

  // Locate every container first.
  std::vector<FieldResult<std::string>> locations(entries.size());
  {
    Common::ThreadPool pool(std::min(width_, std::max<size_t>(1, entries.size())));
    std::vector<std::future<void>> pending;
    pending.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
      pending.push_back(pool.enqueue([this, &entries, &locations, &cancel, i] {
        locations[i] = lookupRegion(entries[i].name, cancel);
      }));
    }
    for (auto& f : pending) {
      f.get();
    }
  }

  // Every listed container is kept; the region only picks the client.
  std::vector<Job> jobs;
  jobs.reserve(entries.size());
  size_t out_of_scope = 0;
  for (size_t i = 0; i < entries.size(); ++i) {
    Job job;
    job.name = entries[i].name;
    job.creation_time = entries[i].creation_time;
    if (locations[i].value) {
      if (std::find(scope_.begin(), scope_.end(), *locations[i].value) == scope_.end()) {
        ++out_of_scope;
      }
      job.region = *locations[i].value;
    } else {
      job.location_error = locations[i].diagnostic;
    }
    jobs.push_back(std::move(job));
  }
  if (out_of_scope > 0) {
    LOG_INFO("%zu container(s) live outside the resolved region scope", out_of_scope);
  }

  LOG_INFO("Discovering %zu container(s) with concurrency %zu", jobs.size(), width_);
  runJobs(jobs, Mode::DISCOVERY, cancel, result);
  return result;
}

auto Inspector::resolveScope(const Common::CancelToken& cancel, CollectionResult& result) -> bool {
  RegionResolver resolver(client_, config_.regions);
  ApiError err = resolver.resolve(cancel, result.regions);
  if (!err.ok()) {
    result.status = systemicStatus(err);
    result.error = "region resolution: " + err.describe();
    return false;
  }
  scope_ = result.regions;
  return true;
}

auto Inspector::listAccount(const Common::CancelToken& cancel, CollectionResult& result,
                            std::vector<Provider::ContainerEntry>& entries) -> bool {
  ApiError err = client_.execute("ListBuckets", cancel, [&](IStorageProvider& p) {
    entries.clear();
    return p.listContainers(cancel, entries);
  });
  if (!err.ok()) {
    LOG_ERROR("ListBuckets failed: %s", err.describe().c_str());
    result.status = systemicStatus(err);
    result.error = "ListBuckets: " + err.describe();
    return false;
  }
  return true;
}

auto Inspector::runJobs(std::vector<Job>& jobs, Mode mode, const Common::CancelToken& cancel,
                        CollectionResult& result) -> void {
  const size_t total = jobs.size();

  // Every enumerated container is present even if its worker never runs.
  for (const auto& job : jobs) {
    ResourceMetadata placeholder;
    placeholder.name = job.name;
    placeholder.error = "cancelled";
    result.containers[job.name] = std::move(placeholder);
  }

  std::mutex result_mutex;
  size_t completed = 0;
  {
    Common::ThreadPool pool(std::min(width_, std::max<size_t>(1, total)));
    std::vector<std::future<void>> pending;
    pending.reserve(total);
    for (const auto& job : jobs) {
      pending.push_back(pool.enqueue([this, &job, mode, &cancel, &result, &result_mutex, &completed, total] {
        if (cancel.isCancelled()) {
          return;
        }
        ResourceMetadata meta = collectContainer(job, mode, cancel);

        std::lock_guard<std::mutex> lock(result_mutex);
        result.containers[job.name] = std::move(meta);
        ++completed;
        reportProgress(completed, total, job.name);
      }));
    }
    for (auto& f : pending) {
      f.get();
    }
  }

  if (cancel.isCancelled()) {
    result.status = CollectionStatus::CANCELLED;
    result.error = std::string("collection interrupted: ") + cancel.reason();
    LOG_WARN("Collection cancelled after %zu/%zu container(s)", completed, total);
  } else {
    LOG_INFO("Collected metadata for %zu container(s)", completed);
  }
}

auto Inspector::reportProgress(size_t completed, size_t total, const std::string& description) -> void {
  LOG_DEBUG("Progress %zu/%zu: %s", completed, total, description.c_str());
  if (progress_) {
    progress_(completed, total, description);
  }
}

// ============================================================================
// Per-container collection
// ============================================================================

auto Inspector::collectContainer(const Job& job, Mode mode, const Common::CancelToken& cancel) -> ResourceMetadata {
  ResourceMetadata meta;
  meta.name = job.name;
  meta.creation_time = job.creation_time;

  const Common::EpochSeconds now = config_.clock();
  meta.age_in_days = Common::daysBetween(job.creation_time, now);

  if (!job.location_error.empty()) {
    meta.exists = false;
    meta.error = job.location_error;
    return meta;
  }

  std::string region;
  if (job.region) {
    region = *job.region;
  } else {
    auto location = lookupRegion(job.name, cancel);
    if (!location.value) {
      meta.exists = false;
      meta.error = location.diagnostic;
      return meta;
    }
    region = *location.value;
    if (std::find(scope_.begin(), scope_.end(), region) == scope_.end()) {
      LOG_WARN("Referenced container %s lives in %s, outside the region scope", job.name.c_str(), region.c_str());
    }
  }

  meta.exists = true;
  meta.region = region;
  const ProviderClient client = client_.forRegion(region);

  auto versioning = collectVersioning(client, job.name, cancel);
  if (versioning.value) {
    meta.versioning_enabled = *versioning.value;
  } else {
    meta.addError(versioning.diagnostic);
  }

  auto lifecycle = collectLifecycle(client, job.name, cancel);
  if (lifecycle.value) {
    meta.lifecycle_rules = *lifecycle.value;
  } else {
    meta.addError(lifecycle.diagnostic);
  }

  auto tags = collectTags(client, job.name, cancel);
  if (tags.value) {
    meta.tags = std::move(*tags.value);
  } else {
    meta.addError(tags.diagnostic);
  }

  const uint32_t sample_keys = mode == Mode::DISCOVERY ? config_.discovery_sample_keys : config_.reference_sample_keys;
  auto sample = collectSample(client, job.name, sample_keys, cancel);
  if (sample.value) {
    meta.object_count = sample.value->key_count;
    meta.is_empty = sample.value->key_count == 0;
    for (const auto& object : sample.value->objects) {
      meta.total_size += object.size;
      meta.last_activity = std::max(meta.last_activity, object.last_modified);
    }
    if (meta.last_activity > 0) {
      meta.days_since_activity = Common::daysBetween(meta.last_activity, now);
    }
  } else {
    meta.addError(sample.diagnostic);
  }

  if (mode == Mode::DISCOVERY && config_.check_encryption) {
    auto encryption = collectEncryption(client, job.name, cancel);
    if (encryption.value) {
      meta.encryption = std::move(*encryption.value);
    } else {
      meta.addError(encryption.diagnostic);
    }
  }

  if (mode == Mode::DISCOVERY && config_.check_public_access) {
    auto access = collectPublicAccess(client, job.name, cancel);
    if (access.value) {
      meta.public_access = *access.value;
    } else {
      meta.addError(access.diagnostic);
    }
  }

  if (meta.versioning_enabled) {
    meta.addError(collectVersions(client, job.name, cancel, meta));
  }

  if (!job.prefixes.empty()) {
    collectPrefixes(client, job.name, job.prefixes, cancel, meta);
  }

  if (!meta.error.empty()) {
    LOG_WARN("Partial metadata for %s: %s", job.name.c_str(), meta.error.c_str());
  }
  return meta;
}

auto Inspector::lookupRegion(const std::string& name, const Common::CancelToken& cancel) -> FieldResult<std::string> {
  return fetchField<std::string>(client_, "GetBucketLocation", name, cancel,
      [&](IStorageProvider& p, std::string& out) { return p.getContainerLocation(name, cancel, out); });
}

auto Inspector::collectVersioning(const ProviderClient& client, const std::string& name,
                                  const Common::CancelToken& cancel) -> FieldResult<bool> {
  return fetchField<bool>(client, "GetBucketVersioning", name, cancel,
      [&](IStorageProvider& p, bool& out) { return p.getVersioning(name, cancel, out); });
}

auto Inspector::collectLifecycle(const ProviderClient& client, const std::string& name,
                                 const Common::CancelToken& cancel) -> FieldResult<uint32_t> {
  return fetchField<uint32_t>(client, "GetBucketLifecycleConfiguration", name, cancel,
      [&](IStorageProvider& p, uint32_t& out) { return p.getLifecycleRuleCount(name, cancel, out); });
}

auto Inspector::collectTags(const ProviderClient& client, const std::string& name,
                            const Common::CancelToken& cancel) -> FieldResult<TagMap> {
  return fetchField<TagMap>(client, "GetBucketTagging", name, cancel,
      [&](IStorageProvider& p, TagMap& out) { return p.getTags(name, cancel, out); });
}

auto Inspector::collectSample(const ProviderClient& client, const std::string& name, uint32_t max_keys,
                              const Common::CancelToken& cancel) -> FieldResult<Provider::ObjectPage> {
  return fetchField<Provider::ObjectPage>(client, "ListObjectsV2", name, cancel,
      [&](IStorageProvider& p, Provider::ObjectPage& out) { return p.listObjects(name, "", max_keys, cancel, out); });
}

auto Inspector::collectEncryption(const ProviderClient& client, const std::string& name,
                                  const Common::CancelToken& cancel) -> FieldResult<EncryptionState> {
  return fetchField<EncryptionState>(client, "GetBucketEncryption", name, cancel,
      [&](IStorageProvider& p, EncryptionState& out) { return p.getEncryption(name, cancel, out); });
}

auto Inspector::collectPublicAccess(const ProviderClient& client, const std::string& name,
                                    const Common::CancelToken& cancel) -> FieldResult<PublicAccessState> {
  return fetchField<PublicAccessState>(client, "GetPublicAccessBlock", name, cancel,
      [&](IStorageProvider& p, PublicAccessState& out) { return p.getPublicAccess(name, cancel, out); });
}

auto Inspector::collectVersions(const ProviderClient& client, const std::string& name,
                                const Common::CancelToken& cancel, ResourceMetadata& meta) -> std::string {
  uint64_t versions = 0;
  int64_t bytes = 0;
  std::string key_marker;
  std::string version_marker;
  std::string diagnostic;

  uint32_t pages = 0;
  bool truncated = true;
  while (truncated && pages < config_.max_version_pages) {
    Provider::VersionPage page;
    ApiError err = client.execute("ListObjectVersions", cancel, [&](IStorageProvider& p) {
      page = Provider::VersionPage{};
      return p.listObjectVersions(name, key_marker, version_marker, config_.version_page_keys, cancel, page);
    });
    if (!err.ok()) {
      diagnostic = err.cancelled() ? "ListObjectVersions cancelled for " + name
                                   : Provider::formatOperationError("ListObjectVersions", name, err);
      break;
    }

    ++pages;
    versions += page.version_count;
    bytes += page.total_size;
    truncated = page.truncated;
    if (truncated && page.next_key_marker.empty() && page.next_version_id_marker.empty()) {
      break;  // truncated without a continuation point
    }
    key_marker = page.next_key_marker;
    version_marker = page.next_version_id_marker;
  }

  if (truncated && pages >= config_.max_version_pages) {
    LOG_DEBUG("Version listing for %s stopped at %u pages", name.c_str(), pages);
  }

  meta.version_count = versions;
  meta.total_version_size = bytes;
  return diagnostic;
}

auto Inspector::collectPrefixes(const ProviderClient& client, const std::string& name,
                                const std::vector<std::string>& prefixes, const Common::CancelToken& cancel,
                                ResourceMetadata& meta) -> void {
  std::vector<PrefixMetadata> results(prefixes.size());
  {
    Common::ThreadPool pool(std::min(width_, prefixes.size()));
    std::vector<std::future<void>> pending;
    pending.reserve(prefixes.size());
    for (size_t i = 0; i < prefixes.size(); ++i) {
      pending.push_back(pool.enqueue([this, &client, &name, &prefixes, &results, &cancel, i] {
        results[i] = inspectPrefix(client, name, prefixes[i], cancel);
      }));
    }
    for (auto& f : pending) {
      f.get();
    }
  }

  for (const auto& prefix : results) {
    meta.addError(prefix.error);
  }
  meta.prefixes = std::move(results);
}

auto Inspector::inspectPrefix(const ProviderClient& client, const std::string& name,
                              const std::string& prefix, const Common::CancelToken& cancel) -> PrefixMetadata {
  PrefixMetadata out;
  out.prefix = prefix;

  auto listing = fetchField<Provider::ObjectPage>(client, "ListObjectsV2", name + "/" + prefix, cancel,
      [&](IStorageProvider& p, Provider::ObjectPage& page) {
        return p.listObjects(name, prefix, config_.prefix_page_keys, cancel, page);
      });
  if (!listing.value) {
    out.error = listing.diagnostic;
    return out;
  }

  out.object_count = listing.value->key_count;
  out.exists = listing.value->key_count > 0;
  for (const auto& object : listing.value->objects) {
    out.latest_modified = std::max(out.latest_modified, object.last_modified);
  }
  if (out.latest_modified > 0) {
    out.days_since_modified = Common::daysBetween(out.latest_modified, config_.clock());
  }
  return out;
}

} // namespace Drift::Inspect
