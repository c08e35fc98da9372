// ============================================================================
// s3_responses.cpp - Response body parsing
// ============================================================================

#include "drift/provider/s3_responses.h"

#include <cstdlib>

#include "common/time_utils.h"

namespace Drift::Provider::S3 {

namespace {

auto parseInt64(const std::string& text, int64_t fallback = 0) noexcept -> int64_t {
  if (text.empty()) {
    return fallback;
  }
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  return end == text.c_str() ? fallback : static_cast<int64_t>(value);
}

auto parseBool(const std::string& text) noexcept -> bool {
  return text == "true" || text == "TRUE" || text == "True";
}

auto parseTime(const std::string& text) noexcept -> Common::EpochSeconds {
  Common::EpochSeconds t = 0;
  return Common::parseIso8601(text.c_str(), t) ? t : 0;
}

} // namespace

// ============================================================================
// Tag extraction
// ============================================================================

auto findElement(std::string_view xml, std::string_view tag, size_t from,
                 std::string_view& inner, size_t* next) noexcept -> bool {
  size_t pos = from;
  while (pos < xml.size()) {
    pos = xml.find('<', pos);
    if (pos == std::string_view::npos || pos + 1 + tag.size() > xml.size()) {
      return false;
    }
    if (xml.compare(pos + 1, tag.size(), tag) != 0) {
      ++pos;
      continue;
    }

    size_t after_name = pos + 1 + tag.size();
    char c = after_name < xml.size() ? xml[after_name] : '\0';
    if (c != '>' && c != ' ' && c != '/' && c != '\t' && c != '\n' && c != '\r') {
      ++pos;  // longer tag sharing this prefix, e.g. <VersionId> vs <Version>
      continue;
    }

    size_t open_end = xml.find('>', after_name);
    if (open_end == std::string_view::npos) {
      return false;
    }
    if (xml[open_end - 1] == '/') {
      inner = std::string_view();
      if (next) *next = open_end + 1;
      return true;
    }

    std::string closing;
    closing.reserve(tag.size() + 3);
    closing.append("</").append(tag).append(">");
    size_t close = xml.find(closing, open_end + 1);
    if (close == std::string_view::npos) {
      return false;
    }
    inner = xml.substr(open_end + 1, close - open_end - 1);
    if (next) *next = close + closing.size();
    return true;
  }
  return false;
}

auto extractTag(std::string_view xml, std::string_view tag, std::string& out) -> bool {
  std::string_view inner;
  if (!findElement(xml, tag, 0, inner, nullptr)) {
    return false;
  }
  out = xmlUnescape(inner);
  return true;
}

auto forEachElement(std::string_view xml, std::string_view tag,
                    const std::function<void(std::string_view)>& fn) -> uint32_t {
  uint32_t count = 0;
  size_t pos = 0;
  std::string_view inner;
  while (findElement(xml, tag, pos, inner, &pos)) {
    fn(inner);
    ++count;
  }
  return count;
}

auto xmlUnescape(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '&') {
      out.push_back(text[i]);
      continue;
    }
    size_t semi = text.find(';', i);
    if (semi == std::string_view::npos) {
      out.push_back('&');
      continue;
    }
    std::string_view entity = text.substr(i + 1, semi - i - 1);
    if (entity == "amp") out.push_back('&');
    else if (entity == "lt") out.push_back('<');
    else if (entity == "gt") out.push_back('>');
    else if (entity == "quot") out.push_back('"');
    else if (entity == "apos") out.push_back('\'');
    else if (!entity.empty() && entity[0] == '#') {
      long cp = entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X')
          ? std::strtol(std::string(entity.substr(2)).c_str(), nullptr, 16)
          : std::strtol(std::string(entity.substr(1)).c_str(), nullptr, 10);
      if (cp > 0 && cp < 0x80) {
        out.push_back(static_cast<char>(cp));
      } else {
        out.append(text.substr(i, semi - i + 1));
      }
    } else {
      out.append(text.substr(i, semi - i + 1));
    }
    i = semi;
  }
  return out;
}

// ============================================================================
// Documents
// ============================================================================

auto parseErrorBody(std::string_view body, std::string& code, std::string& message) -> bool {
  bool found = extractTag(body, "Code", code);
  extractTag(body, "Message", message);
  return found;
}

auto parseListBuckets(std::string_view body, std::vector<ContainerEntry>& out,
                      std::string& continuation_token) -> bool {
  if (body.find("ListAllMyBucketsResult") == std::string_view::npos) {
    return false;
  }
  forEachElement(body, "Bucket", [&](std::string_view bucket) {
    ContainerEntry entry;
    std::string created;
    if (!extractTag(bucket, "Name", entry.name)) {
      return;
    }
    if (extractTag(bucket, "CreationDate", created)) {
      entry.creation_time = parseTime(created);
    }
    out.push_back(std::move(entry));
  });

  continuation_token.clear();
  extractTag(body, "ContinuationToken", continuation_token);
  return true;
}

auto parseLocation(std::string_view body, std::string& region) -> bool {
  std::string constraint;
  if (!extractTag(body, "LocationConstraint", constraint)) {
    return false;
  }
  if (constraint.empty()) {
    region = "us-east-1";
  } else if (constraint == "EU") {
    region = "eu-west-1";
  } else {
    region = constraint;
  }
  return true;
}

auto parseVersioning(std::string_view body, bool& enabled) -> bool {
  if (body.find("VersioningConfiguration") == std::string_view::npos) {
    return false;
  }
  std::string status;
  extractTag(body, "Status", status);
  enabled = (status == "Enabled");
  return true;
}

auto parseLifecycleRuleCount(std::string_view body, uint32_t& count) -> bool {
  if (body.find("LifecycleConfiguration") == std::string_view::npos) {
    return false;
  }
  count = forEachElement(body, "Rule", [](std::string_view) {});
  return true;
}

auto parseTagging(std::string_view body, TagMap& tags) -> bool {
  if (body.find("Tagging") == std::string_view::npos) {
    return false;
  }
  forEachElement(body, "Tag", [&](std::string_view tag) {
    std::string key;
    std::string value;
    if (extractTag(tag, "Key", key)) {
      extractTag(tag, "Value", value);
      tags[key] = value;
    }
  });
  return true;
}

auto parseListObjects(std::string_view body, ObjectPage& page) -> bool {
  if (body.find("ListBucketResult") == std::string_view::npos) {
    return false;
  }
  forEachElement(body, "Contents", [&](std::string_view contents) {
    ObjectEntry entry;
    std::string text;
    extractTag(contents, "Key", entry.key);
    if (extractTag(contents, "Size", text)) {
      entry.size = parseInt64(text);
    }
    if (extractTag(contents, "LastModified", text)) {
      entry.last_modified = parseTime(text);
    }
    page.objects.push_back(std::move(entry));
  });

  std::string text;
  if (extractTag(body, "KeyCount", text)) {
    page.key_count = static_cast<uint32_t>(parseInt64(text));
  } else {
    page.key_count = static_cast<uint32_t>(page.objects.size());
  }
  page.truncated = extractTag(body, "IsTruncated", text) && parseBool(text);
  return true;
}

auto parseListVersions(std::string_view body, VersionPage& page) -> bool {
  if (body.find("ListVersionsResult") == std::string_view::npos) {
    return false;
  }
  page.version_count += forEachElement(body, "Version", [&](std::string_view version) {
    std::string size;
    if (extractTag(version, "Size", size)) {
      page.total_size += parseInt64(size);
    }
  });
  page.version_count += forEachElement(body, "DeleteMarker", [](std::string_view) {});

  std::string text;
  page.truncated = extractTag(body, "IsTruncated", text) && parseBool(text);
  page.next_key_marker.clear();
  page.next_version_id_marker.clear();
  extractTag(body, "NextKeyMarker", page.next_key_marker);
  extractTag(body, "NextVersionIdMarker", page.next_version_id_marker);
  return true;
}

auto parseEncryption(std::string_view body, EncryptionState& state) -> bool {
  if (body.find("ServerSideEncryptionConfiguration") == std::string_view::npos) {
    return false;
  }
  state.enabled = extractTag(body, "SSEAlgorithm", state.algorithm) && !state.algorithm.empty();
  extractTag(body, "KMSMasterKeyID", state.kms_key_id);
  return true;
}

auto parsePublicAccessBlock(std::string_view body, PublicAccessState& state) -> bool {
  if (body.find("PublicAccessBlockConfiguration") == std::string_view::npos) {
    return false;
  }
  std::string text;
  state.block_public_acls = extractTag(body, "BlockPublicAcls", text) && parseBool(text);
  state.ignore_public_acls = extractTag(body, "IgnorePublicAcls", text) && parseBool(text);
  state.block_public_policy = extractTag(body, "BlockPublicPolicy", text) && parseBool(text);
  state.restrict_public_buckets = extractTag(body, "RestrictPublicBuckets", text) && parseBool(text);
  return true;
}

auto parsePolicyStatus(std::string_view body, bool& is_public) -> bool {
  std::string text;
  if (!extractTag(body, "IsPublic", text)) {
    return false;
  }
  is_public = parseBool(text);
  return true;
}

auto parseDescribeRegions(std::string_view body, std::vector<std::string>& regions) -> bool {
  if (body.find("DescribeRegionsResponse") == std::string_view::npos) {
    return false;
  }
  forEachElement(body, "regionName", [&](std::string_view name) {
    regions.push_back(xmlUnescape(name));
  });
  return true;
}

} // namespace Drift::Provider::S3
