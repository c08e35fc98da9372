#include "drift/provider/credentials.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "common/logging.h"

namespace Drift::Provider {

namespace {

auto trim(char* s) noexcept -> char* {
  while (*s == ' ' || *s == '\t') {
    ++s;
  }
  size_t len = strlen(s);
  while (len > 0 && (s[len - 1] == ' ' || s[len - 1] == '\t' || s[len - 1] == '\n' || s[len - 1] == '\r')) {
    s[--len] = '\0';
  }
  return s;
}

} // namespace

auto CredentialLoader::fromEnvironment(AwsCredentials& out) noexcept -> bool {
  const char* key = getenv("AWS_ACCESS_KEY_ID");
  const char* secret = getenv("AWS_SECRET_ACCESS_KEY");
  if (!key || !secret || !*key || !*secret) {
    return false;
  }
  out.access_key_id = key;
  out.secret_access_key = secret;
  const char* token = getenv("AWS_SESSION_TOKEN");
  out.session_token = token ? token : "";
  return true;
}

auto CredentialLoader::sharedFilePath() -> std::string {
  const char* override_path = getenv("AWS_SHARED_CREDENTIALS_FILE");
  if (override_path && *override_path) {
    return override_path;
  }
  const char* home = getenv("HOME");
  return std::string(home ? home : ".") + "/.aws/credentials";
}

auto CredentialLoader::fromSharedFile(const char* path, const std::string& profile,
                                      AwsCredentials& out) noexcept -> bool {
  FILE* fp = fopen(path, "r");
  if (!fp) {
    return false;
  }

  AwsCredentials found;
  bool in_profile = false;
  char line[1024];
  while (fgets(line, sizeof(line), fp)) {
    char* text = trim(line);
    if (*text == '\0' || *text == '#' || *text == ';') {
      continue;
    }
    if (*text == '[') {
      char* close = strchr(text, ']');
      if (close) {
        *close = '\0';
      }
      in_profile = (profile == trim(text + 1));
      continue;
    }
    if (!in_profile) {
      continue;
    }

    char* equals = strchr(text, '=');
    if (!equals) {
      continue;
    }
    *equals = '\0';
    const char* key = trim(text);
    const char* value = trim(equals + 1);

    if (strcmp(key, "aws_access_key_id") == 0) {
      found.access_key_id = value;
    } else if (strcmp(key, "aws_secret_access_key") == 0) {
      found.secret_access_key = value;
    } else if (strcmp(key, "aws_session_token") == 0) {
      found.session_token = value;
    }
  }
  fclose(fp);

  if (!found.valid()) {
    return false;
  }
  out = found;
  return true;
}

auto CredentialLoader::load(const std::string& profile, AwsCredentials& out) noexcept -> bool {
  if (profile.empty() && fromEnvironment(out)) {
    LOG_DEBUG("Using AWS credentials from environment");
    return true;
  }

  std::string name = profile;
  if (name.empty()) {
    const char* env_profile = getenv("AWS_PROFILE");
    name = (env_profile && *env_profile) ? env_profile : "default";
  }

  const std::string path = sharedFilePath();
  if (fromSharedFile(path.c_str(), name, out)) {
    LOG_DEBUG("Using AWS credentials from profile '%s' in %s", name.c_str(), path.c_str());
    return true;
  }

  LOG_ERROR("No AWS credentials found (environment or profile '%s' in %s)", name.c_str(), path.c_str());
  return false;
}

auto CredentialLoader::resolveDefaultRegion(const std::string& explicit_region) -> std::string {
  if (!explicit_region.empty()) {
    return explicit_region;
  }
  for (const char* var : {"AWS_REGION", "AWS_DEFAULT_REGION"}) {
    const char* value = getenv(var);
    if (value && *value) {
      return value;
    }
  }
  return "us-east-1";
}

} // namespace Drift::Provider
