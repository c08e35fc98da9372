#pragma once

#include <string>
#include <vector>

#include "config/audit_config.h"

namespace Config {

// KEY=VALUE files: '#' comments and blank lines ignored, unknown keys warned
// about and skipped.
class ConfigLoader {
public:
  // Applies every recognised key in `path` on top of `config`. Returns false
  // if the file cannot be opened or a value does not parse.
  [[nodiscard]] static auto loadFromFile(const char* path, AuditConfig& config, std::string& error) noexcept -> bool;

  // Applies one "KEY=VALUE" line. Comment and blank lines are accepted.
  [[nodiscard]] static auto applyLine(const char* line, AuditConfig& config, std::string& error) noexcept -> bool;

  // First existing file of: explicit, ./.s3drift.conf, $HOME/.s3drift.conf.
  // An explicit path is returned even if it does not exist.
  [[nodiscard]] static auto locate(const std::string& explicit_path) -> std::string;

  // "a, b,,c" -> {"a", "b", "c"}
  [[nodiscard]] static auto splitList(const std::string& text) -> std::vector<std::string>;

  [[nodiscard]] static auto parseBool(const char* text, bool& out) noexcept -> bool;
  [[nodiscard]] static auto parseInt(const char* text, int32_t& out) noexcept -> bool;

  // "30s", "5m", "1h" or plain seconds.
  [[nodiscard]] static auto parseDuration(const char* text, int32_t& seconds) noexcept -> bool;
};

// Populates the process environment from a .env file.
class EnvLoader {
public:
  // Existing variables are left untouched. Returns false if the file cannot
  // be opened.
  static auto loadFromFile(const char* filepath) noexcept -> bool;

  static auto getEnv(const char* key, const char* default_val = nullptr) noexcept -> const char*;

private:
  static auto setEnvVar(const char* line) noexcept -> bool;
};

} // namespace Config
