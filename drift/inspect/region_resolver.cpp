#include "drift/inspect/region_resolver.h"

#include <algorithm>

#include "common/logging.h"

namespace Drift::Inspect {

using Provider::ApiError;
using Provider::IStorageProvider;

auto RegionResolver::resolve(const Common::CancelToken& cancel, std::vector<std::string>& regions) const -> ApiError {
  regions.clear();

  if (!selection_.explicit_regions.empty()) {
    for (const auto& region : selection_.explicit_regions) {
      if (!region.empty() && std::find(regions.begin(), regions.end(), region) == regions.end()) {
        regions.push_back(region);
      }
    }
    if (!regions.empty()) {
      LOG_INFO("Using %zu explicit region(s)", regions.size());
      return ApiError::success();
    }
  }

  if (selection_.all_regions) {
    std::vector<std::string> listed;
    ApiError err = client_.execute("DescribeRegions", cancel, [&](IStorageProvider& p) {
      listed.clear();
      return p.listRegions(cancel, listed);
    });
    if (!err.ok()) {
      LOG_ERROR("Region listing failed: %s", err.describe().c_str());
      return err;
    }
    if (listed.empty()) {
      return ApiError::make(Provider::ErrorKind::PERMANENT, 0, "NoRegions",
                            "region listing returned no enabled regions");
    }
    std::sort(listed.begin(), listed.end());
    listed.erase(std::unique(listed.begin(), listed.end()), listed.end());
    regions = std::move(listed);
    LOG_INFO("Discovered %zu enabled regions", regions.size());
    return ApiError::success();
  }

  const std::string& fallback = selection_.default_region.empty() ? client_.region() : selection_.default_region;
  regions.push_back(fallback);
  LOG_INFO("Using default region %s", fallback.c_str());
  return ApiError::success();
}

} // namespace Drift::Inspect
