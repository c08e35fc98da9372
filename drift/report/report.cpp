#include "drift/report/report.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include "common/logging.h"

namespace Drift::Report {

auto parseFormat(const std::string& text, Format& out) noexcept -> bool {
  if (text == "text") {
    out = Format::TEXT;
    return true;
  }
  if (text == "json") {
    out = Format::JSON;
    return true;
  }
  return false;
}

auto writeOutput(const std::string& path, const std::string& content, std::string& error) -> bool {
  const bool to_stdout = path.empty() || path == "-";
  FILE* file = to_stdout ? stdout : std::fopen(path.c_str(), "w");
  if (!file) {
    error = "open " + path + ": " + std::strerror(errno);
    LOG_ERROR("Failed to write report: %s", error.c_str());
    return false;
  }

  const size_t written = std::fwrite(content.data(), 1, content.size(), file);
  bool ok = written == content.size();
  if (to_stdout) {
    ok = std::fflush(file) == 0 && ok;
  } else {
    ok = std::fclose(file) == 0 && ok;
  }
  if (!ok) {
    error = "write " + (to_stdout ? std::string("stdout") : path) + ": short write";
    LOG_ERROR("Failed to write report: %s", error.c_str());
    return false;
  }
  if (!to_stdout) {
    LOG_INFO("Report written to %s (%zu bytes)", path.c_str(), content.size());
  }
  return true;
}

} // namespace Drift::Report
