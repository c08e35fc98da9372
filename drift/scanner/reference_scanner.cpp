// ============================================================================
// reference_scanner.cpp - Container references in source trees Implementation
// ============================================================================

#include "drift/scanner/reference_scanner.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <tuple>

#include "common/logging.h"

namespace fs = std::filesystem;

namespace Drift::Scanner {

namespace {

// Bucket naming rules: 3-63 chars, lowercase alnum, dots and dashes inside.
#define BUCKET_NAME "([a-z0-9][a-z0-9.\\-]{1,61}[a-z0-9])"

const std::regex& s3UriPattern() {
  static const std::regex re("s3://" BUCKET_NAME "(?:/([^?\\s\"']+))?(?:\\?versionId=([^\\s\"']+))?");
  return re;
}

const std::regex& s3HttpPattern() {
  static const std::regex re("https?://" BUCKET_NAME "\\.s3(?:[.\\-]([a-z0-9\\-]+))?\\.amazonaws\\.com"
                             "(?:/([^?\\s\"']+))?(?:\\?versionId=([^\\s\"']+))?");
  return re;
}

const std::regex& assignmentPattern() {
  static const std::regex re("(?:s3[\\-_]?bucket|bucket(?:[\\-_]?name)?|s3[\\-_]?name)[\\s:=]+['\"]?" BUCKET_NAME "['\"]?",
                             std::regex::ECMAScript | std::regex::icase);
  return re;
}

#undef BUCKET_NAME

const std::regex& writePattern() {
  static const std::regex re("put|write|upload|store|save|create", std::regex::icase);
  return re;
}

const std::regex& readPattern() {
  static const std::regex re("get|read|download|fetch|retrieve|load", std::regex::icase);
  return re;
}

const std::regex& listPattern() {
  static const std::regex re("list|ls|scan|iterate", std::regex::icase);
  return re;
}

auto readWholeFile(const fs::path& path, std::string& content) -> bool {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return false;
  }
  content = ss.str();
  return true;
}

// Every recognised form contains "s3", "bucket" or "name" in some case.
auto mayReference(const std::string& line) -> bool {
  std::string lower(line);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("s3") != std::string::npos || lower.find("bucket") != std::string::npos ||
         lower.find("name") != std::string::npos;
}

auto referenceOrder(const Reference& a, const Reference& b) -> bool {
  return std::tie(a.source_file, a.source_line, a.container, a.prefix) <
         std::tie(b.source_file, b.source_line, b.container, b.prefix);
}

} // namespace

ReferenceScanner::ReferenceScanner(ScannerConfig config)
  : config_(std::move(config)) {
}

auto ReferenceScanner::detectAccess(const std::string& line) -> AccessMode {
  // Write before read so that "upload" is not taken for "load".
  if (std::regex_search(line, writePattern())) {
    return AccessMode::WRITE;
  }
  if (std::regex_search(line, readPattern())) {
    return AccessMode::READ;
  }
  if (std::regex_search(line, listPattern())) {
    return AccessMode::LIST;
  }
  return AccessMode::UNKNOWN;
}

auto ReferenceScanner::looksBinary(const std::string& content) noexcept -> bool {
  const size_t probe = std::min<size_t>(content.size(), 8192);
  return content.find('\0') < probe;
}

auto ReferenceScanner::scanLine(const std::string& line, const std::string& file, uint32_t line_no,
                                ReferenceList& out) const -> void {
  const size_t first = out.size();
  AccessMode access = AccessMode::UNKNOWN;
  bool access_known = false;

  auto add = [&](std::string container, std::string prefix, std::string version) {
    for (size_t i = first; i < out.size(); ++i) {
      if (out[i].container == container && out[i].prefix == prefix) {
        return;
      }
    }
    if (!access_known) {
      access = detectAccess(line);
      access_known = true;
    }
    Reference ref;
    ref.container = std::move(container);
    ref.prefix = std::move(prefix);
    ref.version_id = std::move(version);
    ref.source_file = file;
    ref.source_line = line_no;
    ref.access = access;
    out.push_back(std::move(ref));
  };

  for (std::sregex_iterator it(line.begin(), line.end(), s3UriPattern()), end; it != end; ++it) {
    add((*it)[1].str(), (*it)[2].str(), (*it)[3].str());
  }
  for (std::sregex_iterator it(line.begin(), line.end(), s3HttpPattern()), end; it != end; ++it) {
    add((*it)[1].str(), (*it)[3].str(), (*it)[4].str());
  }

  // Bare names only when no URL on this line already named the container.
  for (std::sregex_iterator it(line.begin(), line.end(), assignmentPattern()), end; it != end; ++it) {
    const std::string name = (*it)[1].str();
    bool seen = false;
    for (size_t i = first; i < out.size(); ++i) {
      if (out[i].container == name) {
        seen = true;
        break;
      }
    }
    if (!seen) {
      add(name, "", "");
    }
  }
}

auto ReferenceScanner::scanText(const std::string& content, const std::string& file, ReferenceList& out) const -> void {
  uint32_t line_no = 0;
  size_t start = 0;
  while (start <= content.size()) {
    size_t end = content.find('\n', start);
    if (end == std::string::npos) {
      end = content.size();
    }
    ++line_no;
    std::string line = content.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (mayReference(line)) {
      scanLine(line, file, line_no, out);
    }
    if (end == content.size()) {
      break;
    }
    start = end + 1;
  }
}

auto ReferenceScanner::scanDirectory(const std::string& root, const Common::CancelToken& cancel,
                                     ReferenceList& out, std::string& error) const -> bool {
  std::error_code ec;
  const fs::path base(root);
  if (!fs::is_directory(base, ec)) {
    error = "repository path is not a directory: " + root;
    LOG_ERROR("%s", error.c_str());
    return false;
  }

  fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    error = "cannot walk " + root + ": " + ec.message();
    LOG_ERROR("%s", error.c_str());
    return false;
  }

  ReferenceList found;
  size_t files_scanned = 0;
  size_t files_skipped = 0;
  for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      LOG_WARN("Directory walk stopped under %s: %s", root.c_str(), ec.message().c_str());
      break;
    }
    if (cancel.isCancelled()) {
      error = std::string("scan interrupted: ") + cancel.reason();
      LOG_WARN("%s", error.c_str());
      return false;
    }

    const fs::directory_entry& entry = *it;
    const std::string name = entry.path().filename().string();
    if (entry.is_directory(ec)) {
      if (std::find(config_.skip_directories.begin(), config_.skip_directories.end(), name) !=
          config_.skip_directories.end()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(ec)) {
      continue;
    }

    const uintmax_t size = entry.file_size(ec);
    if (ec || size > config_.max_file_bytes) {
      ++files_skipped;
      ec.clear();
      continue;
    }

    std::string content;
    if (!readWholeFile(entry.path(), content)) {
      LOG_WARN("Cannot read %s, skipping", entry.path().string().c_str());
      ++files_skipped;
      continue;
    }
    if (looksBinary(content)) {
      ++files_skipped;
      continue;
    }

    const std::string relative = entry.path().lexically_relative(base).generic_string();
    scanText(content, relative, found);
    ++files_scanned;
  }

  std::sort(found.begin(), found.end(), referenceOrder);
  LOG_INFO("Scanned %zu file(s) under %s (%zu skipped), found %zu reference(s)",
           files_scanned, root.c_str(), files_skipped, found.size());
  out.insert(out.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  return true;
}

} // namespace Drift::Scanner
