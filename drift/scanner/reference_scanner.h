#pragma once

// ============================================================================
// reference_scanner.h - Container references in source trees
// ============================================================================
//
// Recognised forms:
//   s3://bucket[/prefix][?versionId=v]
//   https://bucket.s3[.-region].amazonaws.com[/prefix][?versionId=v]
//   bucket = "name", s3_bucket: name, S3_NAME=name   (case-insensitive key)

#include <cstdint>
#include <string>
#include <vector>

#include "common/cancel_token.h"
#include "drift/scanner/reference.h"

namespace Drift::Scanner {

struct ScannerConfig {
  static constexpr uint64_t DEFAULT_MAX_FILE_BYTES = 5ull * 1024 * 1024;

  uint64_t max_file_bytes{DEFAULT_MAX_FILE_BYTES};
  std::vector<std::string> skip_directories{".git", "node_modules", "vendor", ".terraform", "build"};
};

class ReferenceScanner {
public:
  explicit ReferenceScanner(ScannerConfig config = ScannerConfig{});

  // Walks `root` and appends every reference, ordered by (file, line,
  // container, prefix). Unreadable files are skipped with a warning; a root
  // that cannot be walked fails the call.
  [[nodiscard]] auto scanDirectory(const std::string& root, const Common::CancelToken& cancel,
                                   ReferenceList& out, std::string& error) const -> bool;

  // References in one file's content; `file` is recorded as the source.
  auto scanText(const std::string& content, const std::string& file, ReferenceList& out) const -> void;

  [[nodiscard]] static auto detectAccess(const std::string& line) -> AccessMode;

  // NUL byte in the first 8 KiB.
  [[nodiscard]] static auto looksBinary(const std::string& content) noexcept -> bool;

private:
  auto scanLine(const std::string& line, const std::string& file, uint32_t line_no, ReferenceList& out) const -> void;

  ScannerConfig config_;
};

} // namespace Drift::Scanner
