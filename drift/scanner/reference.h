#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Drift::Scanner {

enum class AccessMode : uint8_t {
  UNKNOWN = 0,
  READ = 1,
  WRITE = 2,
  LIST = 3
};

[[nodiscard]] inline auto accessModeName(AccessMode mode) noexcept -> const char* {
  switch (mode) {
    case AccessMode::READ:  return "read";
    case AccessMode::WRITE: return "write";
    case AccessMode::LIST:  return "list";
    default:                return "unknown";
  }
}

// One container mention found in source. Prefix and version id may be empty.
struct Reference {
  std::string container;
  std::string prefix;
  std::string version_id;
  std::string source_file;
  uint32_t source_line{0};
  AccessMode access{AccessMode::UNKNOWN};
};

using ReferenceList = std::vector<Reference>;

} // namespace Drift::Scanner
