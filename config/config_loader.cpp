#include "config/config_loader.h"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <unistd.h>

#include "common/logging.h"

namespace Config {

namespace {

auto trim(std::string text) -> std::string {
  const char* ws = " \t\r\n";
  size_t start = text.find_first_not_of(ws);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(ws);
  text = text.substr(start, end - start + 1);
  if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
    text = text.substr(1, text.size() - 2);
  }
  return text;
}

auto fileReadable(const std::string& path) -> bool {
  return !path.empty() && access(path.c_str(), R_OK) == 0;
}

} // namespace

// ============================================================================
// AuditConfig
// ============================================================================

auto AuditConfig::validate(std::string& error) const -> bool {
  struct Threshold { const char* name; int32_t value; };
  const Threshold thresholds[] = {
    {"stale days", scan.stale_days},
    {"unused threshold days", scan.unused_threshold_days},
    {"unused score threshold", scan.unused_score_threshold},
    {"age threshold days", discovery.age_threshold_days},
    {"inactive days", discovery.inactive_days},
    {"risk score threshold", discovery.risk_score_threshold},
    {"timeout", provider.timeout_seconds},
    {"request timeout", provider.request_timeout_seconds},
  };
  for (const auto& t : thresholds) {
    if (t.value < 0) {
      error = std::string(t.name) + " must not be negative (got " + std::to_string(t.value) + ")";
      return false;
    }
  }

  if (output.format != "text" && output.format != "json") {
    error = "unknown output format '" + output.format + "' (expected text or json)";
    return false;
  }
  Common::LogLevel level;
  if (!Common::parseLogLevel(logging.level.c_str(), level)) {
    error = "unknown log level '" + logging.level + "'";
    return false;
  }
  if (output.update_baseline && output.baseline_path.empty()) {
    error = "--update-baseline requires --baseline <file>";
    return false;
  }
  return true;
}

auto AuditConfig::isExcludedContainer(const std::string& name) const -> bool {
  for (const auto& excluded : filters.exclude_containers) {
    if (excluded == name) {
      return true;
    }
  }
  return false;
}

auto AuditConfig::isExcludedPrefix(const std::string& prefix) const -> bool {
  for (const auto& excluded : filters.exclude_prefixes) {
    if (!excluded.empty() && prefix.compare(0, excluded.size(), excluded) == 0) {
      return true;
    }
  }
  return false;
}

// ============================================================================
// ConfigLoader
// ============================================================================

auto ConfigLoader::parseBool(const char* text, bool& out) noexcept -> bool {
  if (strcasecmp(text, "true") == 0 || strcasecmp(text, "yes") == 0 ||
      strcasecmp(text, "on") == 0 || strcmp(text, "1") == 0) {
    out = true;
    return true;
  }
  if (strcasecmp(text, "false") == 0 || strcasecmp(text, "no") == 0 ||
      strcasecmp(text, "off") == 0 || strcmp(text, "0") == 0) {
    out = false;
    return true;
  }
  return false;
}

auto ConfigLoader::parseInt(const char* text, int32_t& out) noexcept -> bool {
  if (!text || !*text) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  long value = strtol(text, &end, 10);
  if (errno != 0 || *end != '\0' || value < INT32_MIN || value > INT32_MAX) {
    return false;
  }
  out = static_cast<int32_t>(value);
  return true;
}

auto ConfigLoader::parseDuration(const char* text, int32_t& seconds) noexcept -> bool {
  if (!text || !*text) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  long value = strtol(text, &end, 10);
  if (errno != 0 || end == text || value < 0) {
    return false;
  }
  long scale = 1;
  if (strcmp(end, "") == 0 || strcmp(end, "s") == 0) {
    scale = 1;
  } else if (strcmp(end, "m") == 0) {
    scale = 60;
  } else if (strcmp(end, "h") == 0) {
    scale = 3600;
  } else {
    return false;
  }
  if (value > INT32_MAX / scale) {
    return false;
  }
  seconds = static_cast<int32_t>(value * scale);
  return true;
}

auto ConfigLoader::splitList(const std::string& text) -> std::vector<std::string> {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string::npos) {
      comma = text.size();
    }
    std::string item = trim(text.substr(start, comma - start));
    if (!item.empty()) {
      out.push_back(std::move(item));
    }
    start = comma + 1;
  }
  return out;
}

auto ConfigLoader::applyLine(const char* line, AuditConfig& config, std::string& error) noexcept -> bool {
  const char* equals = strchr(line, '=');
  const std::string whole = trim(line);
  if (whole.empty() || whole[0] == '#') {
    return true;
  }
  if (!equals) {
    error = "expected KEY=VALUE: " + whole;
    return false;
  }

  const std::string key = trim(std::string(line, static_cast<size_t>(equals - line)));
  const std::string value = trim(equals + 1);
  const char* v = value.c_str();

  auto intValue = [&](int32_t& field) {
    if (parseInt(v, field)) {
      return true;
    }
    error = key + ": not an integer: " + value;
    return false;
  };
  auto boolValue = [&](bool& field) {
    if (parseBool(v, field)) {
      return true;
    }
    error = key + ": not a boolean: " + value;
    return false;
  };

  if (key == "AWS_PROFILE") {
    config.provider.profile = value;
  } else if (key == "REGION") {
    config.provider.region = value;
  } else if (key == "REGIONS") {
    config.provider.regions = splitList(value);
  } else if (key == "ALL_REGIONS") {
    return boolValue(config.provider.all_regions);
  } else if (key == "ENDPOINT") {
    config.provider.endpoint = value;
  } else if (key == "CONCURRENCY") {
    return intValue(config.provider.concurrency);
  } else if (key == "TIMEOUT_SECONDS") {
    if (!parseDuration(v, config.provider.timeout_seconds)) {
      error = key + ": not a duration: " + value;
      return false;
    }
  } else if (key == "REQUEST_TIMEOUT_SECONDS") {
    return intValue(config.provider.request_timeout_seconds);
  } else if (key == "STALE_DAYS") {
    return intValue(config.scan.stale_days);
  } else if (key == "UNUSED_THRESHOLD_DAYS") {
    return intValue(config.scan.unused_threshold_days);
  } else if (key == "UNUSED_SCORE_THRESHOLD") {
    return intValue(config.scan.unused_score_threshold);
  } else if (key == "CHECK_UNUSED") {
    return boolValue(config.scan.check_unused);
  } else if (key == "AGE_THRESHOLD_DAYS") {
    return intValue(config.discovery.age_threshold_days);
  } else if (key == "INACTIVE_DAYS") {
    return intValue(config.discovery.inactive_days);
  } else if (key == "RISK_SCORE_THRESHOLD") {
    return intValue(config.discovery.risk_score_threshold);
  } else if (key == "CHECK_ENCRYPTION") {
    return boolValue(config.discovery.check_encryption);
  } else if (key == "CHECK_PUBLIC") {
    return boolValue(config.discovery.check_public);
  } else if (key == "FORMAT") {
    config.output.format = value;
  } else if (key == "OUTPUT") {
    config.output.path = value;
  } else if (key == "EXCLUDE_BUCKETS") {
    config.filters.exclude_containers = splitList(value);
  } else if (key == "EXCLUDE_PREFIXES") {
    config.filters.exclude_prefixes = splitList(value);
  } else if (key == "LOG_LEVEL") {
    config.logging.level = value;
  } else if (key == "LOGS_DIR") {
    config.logging.logs_dir = value;
  } else {
    LOG_WARN("Ignoring unknown config key: %s", key.c_str());
  }
  return true;
}

auto ConfigLoader::loadFromFile(const char* path, AuditConfig& config, std::string& error) noexcept -> bool {
  FILE* fp = fopen(path, "r");
  if (!fp) {
    error = std::string("cannot open config file ") + path + ": " + strerror(errno);
    return false;
  }

  char line[1024];
  int line_no = 0;
  bool ok = true;
  while (fgets(line, sizeof(line), fp)) {
    ++line_no;
    if (!applyLine(line, config, error)) {
      error = std::string(path) + ":" + std::to_string(line_no) + ": " + error;
      ok = false;
      break;
    }
  }
  fclose(fp);

  if (ok) {
    LOG_INFO("Loaded configuration from %s", path);
  }
  return ok;
}

auto ConfigLoader::locate(const std::string& explicit_path) -> std::string {
  if (!explicit_path.empty()) {
    return explicit_path;
  }
  if (fileReadable(".s3drift.conf")) {
    return ".s3drift.conf";
  }
  const char* home = getenv("HOME");
  if (home && *home) {
    std::string path = std::string(home) + "/.s3drift.conf";
    if (fileReadable(path)) {
      return path;
    }
  }
  return "";
}

// ============================================================================
// EnvLoader
// ============================================================================

auto EnvLoader::loadFromFile(const char* filepath) noexcept -> bool {
  FILE* fp = fopen(filepath, "r");
  if (!fp) {
    return false;
  }

  char line[1024];
  int loaded_count = 0;
  while (fgets(line, sizeof(line), fp)) {
    if (line[0] == '#' || line[0] == '\n' || line[0] == '\r') {
      continue;
    }
    if (setEnvVar(line)) {
      loaded_count++;
    }
  }

  fclose(fp);
  LOG_DEBUG("Loaded %d variable(s) from %s", loaded_count, filepath);
  return true;
}

auto EnvLoader::setEnvVar(const char* line) noexcept -> bool {
  const char* equals = strchr(line, '=');
  if (!equals) {
    return false;
  }

  std::string key = trim(std::string(line, static_cast<size_t>(equals - line)));
  if (key.compare(0, 7, "export ") == 0) {
    key = trim(key.substr(7));
  }
  if (key.empty()) {
    return false;
  }
  const std::string value = trim(equals + 1);

  // overwrite=0: the real environment wins
  return setenv(key.c_str(), value.c_str(), 0) == 0;
}

auto EnvLoader::getEnv(const char* key, const char* default_val) noexcept -> const char* {
  const char* value = getenv(key);
  return value ? value : default_val;
}

} // namespace Config
