#pragma once

// ============================================================================
// s3_responses.h - Response body parsing for the S3 and EC2 query APIs
// ============================================================================
//
// Bodies are flat enough for tag extraction; no general XML parser is used.
// Each parser returns false only when the body is not the expected document.

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "drift/provider/storage_provider.h"

namespace Drift::Provider::S3 {

// ----------------------------------------------------------------------------
// Tag extraction
// ----------------------------------------------------------------------------

// Finds the first <tag ...>inner</tag> or <tag/> at or after `from`.
// `next` receives the offset just past the element.
auto findElement(std::string_view xml, std::string_view tag, size_t from,
                 std::string_view& inner, size_t* next) noexcept -> bool;

// Inner text of the first `tag`, entity-decoded.
auto extractTag(std::string_view xml, std::string_view tag, std::string& out) -> bool;

// Calls fn(inner) for every `tag` element in order.
auto forEachElement(std::string_view xml, std::string_view tag,
                    const std::function<void(std::string_view)>& fn) -> uint32_t;

[[nodiscard]] auto xmlUnescape(std::string_view text) -> std::string;

// ----------------------------------------------------------------------------
// Documents
// ----------------------------------------------------------------------------

auto parseErrorBody(std::string_view body, std::string& code, std::string& message) -> bool;

auto parseListBuckets(std::string_view body, std::vector<ContainerEntry>& out,
                      std::string& continuation_token) -> bool;

// Empty constraint means us-east-1; legacy "EU" means eu-west-1.
auto parseLocation(std::string_view body, std::string& region) -> bool;

auto parseVersioning(std::string_view body, bool& enabled) -> bool;
auto parseLifecycleRuleCount(std::string_view body, uint32_t& count) -> bool;
auto parseTagging(std::string_view body, TagMap& tags) -> bool;
auto parseListObjects(std::string_view body, ObjectPage& page) -> bool;
auto parseListVersions(std::string_view body, VersionPage& page) -> bool;
auto parseEncryption(std::string_view body, EncryptionState& state) -> bool;
auto parsePublicAccessBlock(std::string_view body, PublicAccessState& state) -> bool;
auto parsePolicyStatus(std::string_view body, bool& is_public) -> bool;
auto parseDescribeRegions(std::string_view body, std::vector<std::string>& regions) -> bool;

} // namespace Drift::Provider::S3
