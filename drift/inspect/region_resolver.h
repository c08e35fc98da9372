#pragma once

#include <string>
#include <vector>

#include "common/cancel_token.h"
#include "drift/provider/provider_client.h"

namespace Drift::Inspect {

struct RegionSelection {
  std::vector<std::string> explicit_regions;
  bool all_regions{false};
  std::string default_region;
};

// Target region set. Precedence: explicit list, then every enabled region
// (listing call), then the default region. A failed listing is an error;
// there is no fallback to the default.
class RegionResolver {
public:
  RegionResolver(Provider::ProviderClient client, RegionSelection selection)
    : client_(std::move(client)), selection_(std::move(selection)) {}

  auto resolve(const Common::CancelToken& cancel, std::vector<std::string>& regions) const -> Provider::ApiError;

private:
  Provider::ProviderClient client_;
  RegionSelection selection_;
};

} // namespace Drift::Inspect
