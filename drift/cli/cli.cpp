// ============================================================================
// cli.cpp - Command line handling Implementation
// ============================================================================

#include "drift/cli/cli.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <map>

#include "common/logging.h"
#include "config/config_loader.h"
#include "drift/analysis/classification.h"

namespace Drift::Cli {

using Analysis::Classification;
using Analysis::classificationName;
using Config::ConfigLoader;

namespace {

enum class Scope : uint8_t { COMMON, SCAN, DISCOVER };

struct Flag {
  const char* name;
  Scope scope;
  bool takes_value;
};

constexpr Flag FLAGS[] = {
  {"--config", Scope::COMMON, true},
  {"--aws-profile", Scope::COMMON, true},
  {"--aws-region", Scope::COMMON, true},
  {"--regions", Scope::COMMON, true},
  {"--all-regions", Scope::COMMON, false},
  {"--single-region", Scope::COMMON, false},
  {"--endpoint", Scope::COMMON, true},
  {"--concurrency", Scope::COMMON, true},
  {"--timeout", Scope::COMMON, true},
  {"--format", Scope::COMMON, true},
  {"--output", Scope::COMMON, true},
  {"--baseline", Scope::COMMON, true},
  {"--update-baseline", Scope::COMMON, false},
  {"--exclude-bucket", Scope::COMMON, true},
  {"--exclude-prefix", Scope::COMMON, true},
  {"--verbose", Scope::COMMON, false},
  {"--no-progress", Scope::COMMON, false},
  {"--logs-dir", Scope::COMMON, true},
  {"--log-level", Scope::COMMON, true},
  {"--fail-on-unused", Scope::COMMON, false},

  {"--repo", Scope::SCAN, true},
  {"--stale-days", Scope::SCAN, true},
  {"--unused-threshold-days", Scope::SCAN, true},
  {"--check-unused", Scope::SCAN, false},
  {"--unused-score", Scope::SCAN, true},
  {"--include-references", Scope::SCAN, false},
  {"--fail-on-missing", Scope::SCAN, false},
  {"--fail-on-stale", Scope::SCAN, false},
  {"--fail-on-version-sprawl", Scope::SCAN, false},

  {"--age-threshold-days", Scope::DISCOVER, true},
  {"--inactive-days", Scope::DISCOVER, true},
  {"--risk-threshold", Scope::DISCOVER, true},
  {"--check-encryption", Scope::DISCOVER, false},
  {"--check-public", Scope::DISCOVER, false},
  {"--fail-on-risky", Scope::DISCOVER, false},
};

auto findFlag(const std::string& name) -> const Flag* {
  for (const auto& flag : FLAGS) {
    if (name == flag.name) {
      return &flag;
    }
  }
  return nullptr;
}

auto commandName(Command command) -> const char* {
  switch (command) {
    case Command::SCAN:     return "scan";
    case Command::DISCOVER: return "discover";
    case Command::VERSION:  return "version";
    default:                return "help";
  }
}

auto parseCommand(const char* text, Command& out) -> bool {
  if (strcmp(text, "scan") == 0) {
    out = Command::SCAN;
  } else if (strcmp(text, "discover") == 0) {
    out = Command::DISCOVER;
  } else if (strcmp(text, "version") == 0 || strcmp(text, "--version") == 0) {
    out = Command::VERSION;
  } else if (strcmp(text, "help") == 0 || strcmp(text, "--help") == 0 || strcmp(text, "-h") == 0) {
    out = Command::HELP;
  } else {
    return false;
  }
  return true;
}

auto intFlag(const std::string& name, const std::string& value, int32_t& field, std::string& error) -> bool {
  if (!ConfigLoader::parseInt(value.c_str(), field)) {
    error = name + ": expected an integer, got '" + value + "'";
    return false;
  }
  return true;
}

auto applyFlag(const std::string& name, const std::string& value, Config::AuditConfig& cfg, std::string& error) -> bool {
  if (name == "--config") {
    return true;  // handled before the file is loaded
  }
  if (name == "--aws-profile") {
    cfg.provider.profile = value;
  } else if (name == "--aws-region") {
    cfg.provider.region = value;
  } else if (name == "--regions") {
    cfg.provider.regions = ConfigLoader::splitList(value);
  } else if (name == "--all-regions") {
    cfg.provider.all_regions = true;
  } else if (name == "--single-region") {
    cfg.provider.all_regions = false;
    cfg.provider.regions.clear();
  } else if (name == "--endpoint") {
    cfg.provider.endpoint = value;
  } else if (name == "--concurrency") {
    return intFlag(name, value, cfg.provider.concurrency, error);
  } else if (name == "--timeout") {
    if (!ConfigLoader::parseDuration(value.c_str(), cfg.provider.timeout_seconds)) {
      error = name + ": expected a duration like 30s, 5m or 1h, got '" + value + "'";
      return false;
    }
  } else if (name == "--format") {
    cfg.output.format = value;
  } else if (name == "--output") {
    cfg.output.path = value;
  } else if (name == "--baseline") {
    cfg.output.baseline_path = value;
  } else if (name == "--update-baseline") {
    cfg.output.update_baseline = true;
  } else if (name == "--exclude-bucket") {
    for (auto& item : ConfigLoader::splitList(value)) {
      cfg.filters.exclude_containers.push_back(std::move(item));
    }
  } else if (name == "--exclude-prefix") {
    for (auto& item : ConfigLoader::splitList(value)) {
      cfg.filters.exclude_prefixes.push_back(std::move(item));
    }
  } else if (name == "--verbose") {
    cfg.logging.verbose = true;
  } else if (name == "--no-progress") {
    cfg.output.progress = false;
  } else if (name == "--logs-dir") {
    cfg.logging.logs_dir = value;
  } else if (name == "--log-level") {
    cfg.logging.level = value;
  } else if (name == "--fail-on-unused") {
    cfg.gates.fail_on_unused = true;
  } else if (name == "--repo") {
    cfg.scan.repo_path = value;
  } else if (name == "--stale-days") {
    return intFlag(name, value, cfg.scan.stale_days, error);
  } else if (name == "--unused-threshold-days") {
    return intFlag(name, value, cfg.scan.unused_threshold_days, error);
  } else if (name == "--check-unused") {
    cfg.scan.check_unused = true;
  } else if (name == "--unused-score") {
    return intFlag(name, value, cfg.scan.unused_score_threshold, error);
  } else if (name == "--include-references") {
    cfg.scan.include_references = true;
  } else if (name == "--fail-on-missing") {
    cfg.gates.fail_on_missing = true;
  } else if (name == "--fail-on-stale") {
    cfg.gates.fail_on_stale = true;
  } else if (name == "--fail-on-version-sprawl") {
    cfg.gates.fail_on_version_sprawl = true;
  } else if (name == "--age-threshold-days") {
    return intFlag(name, value, cfg.discovery.age_threshold_days, error);
  } else if (name == "--inactive-days") {
    return intFlag(name, value, cfg.discovery.inactive_days, error);
  } else if (name == "--risk-threshold") {
    return intFlag(name, value, cfg.discovery.risk_score_threshold, error);
  } else if (name == "--check-encryption") {
    cfg.discovery.check_encryption = true;
  } else if (name == "--check-public") {
    cfg.discovery.check_public = true;
  } else if (name == "--fail-on-risky") {
    cfg.gates.fail_on_risky = true;
  }
  return true;
}

} // namespace

auto parseCommandLine(int argc, const char* const argv[], CliOptions& out, std::string& error) -> bool {
  out = CliOptions{};
  if (argc < 2) {
    out.command = Command::HELP;
    return true;
  }
  if (!parseCommand(argv[1], out.command)) {
    error = std::string("unknown command '") + argv[1] + "'";
    return false;
  }
  if (out.command == Command::HELP || out.command == Command::VERSION) {
    return true;
  }

  // Split "--name=value" and "--name value" into pairs.
  std::vector<std::pair<std::string, std::string>> flags;
  std::string explicit_config;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      out.command = Command::HELP;
      return true;
    }
    std::string value;
    const size_t eq = arg.find('=');
    bool inline_value = false;
    if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
      value = arg.substr(eq + 1);
      arg.resize(eq);
      inline_value = true;
    }

    const Flag* flag = findFlag(arg);
    if (!flag) {
      error = "unknown flag '" + arg + "'";
      return false;
    }
    if ((flag->scope == Scope::SCAN && out.command != Command::SCAN) ||
        (flag->scope == Scope::DISCOVER && out.command != Command::DISCOVER)) {
      error = "flag '" + arg + "' is not valid for '" + commandName(out.command) + "'";
      return false;
    }
    if (flag->takes_value && !inline_value) {
      if (i + 1 >= argc) {
        error = "flag '" + arg + "' requires a value";
        return false;
      }
      value = argv[++i];
    } else if (!flag->takes_value && inline_value) {
      error = "flag '" + arg + "' does not take a value";
      return false;
    }

    if (arg == "--config") {
      explicit_config = value;
    }
    flags.emplace_back(std::move(arg), std::move(value));
  }

  out.config_path = ConfigLoader::locate(explicit_config);
  if (!out.config_path.empty() &&
      !ConfigLoader::loadFromFile(out.config_path.c_str(), out.config, error)) {
    return false;
  }

  for (const auto& [name, value] : flags) {
    if (!applyFlag(name, value, out.config, error)) {
      return false;
    }
  }
  return out.config.validate(error);
}

auto printUsage(const char* program) -> void {
  const char* usage = R"(
USAGE: %s <command> [OPTIONS]

Detects drift between code references to S3 buckets and the live account.

COMMANDS:
    scan        Compare bucket references in a repository with live state
    discover    Score every bucket in the account for unused, inactive and risky state
    version     Print the version
    help        Show this help message

COMMON OPTIONS:
    --config <file>             KEY=VALUE config (default ./.s3drift.conf, ~/.s3drift.conf)
    --aws-profile <name>        Shared credentials profile
    --aws-region <region>       Default region
    --regions <a,b,...>         Explicit region list
    --all-regions               Every enabled region (default)
    --single-region             Only the default region
    --endpoint <url>            S3-compatible endpoint (path-style)
    --concurrency <n>           Parallel bucket inspections (default 10)
    --timeout <30s|5m|n>        Deadline for the whole run
    --format <text|json>        Report format (default text)
    --output <file>             Report file (default stdout)
    --baseline <file>           Previous JSON report; gates apply to new findings only
    --update-baseline           Write this run's JSON report to the baseline file
    --exclude-bucket <name>     Ignore a bucket (repeatable, comma-separated)
    --exclude-prefix <prefix>   Ignore prefixes starting with this text
    --verbose                   Mirror debug logging to stderr
    --no-progress               No progress line on stderr
    --logs-dir <dir>            Log file directory (default logs)
    --log-level <level>         DEBUG, INFO, WARN or ERROR (default INFO)
    --fail-on-unused            Exit 1 if unused buckets are found

SCAN OPTIONS:
    --repo <dir>                Repository to scan (default .)
    --stale-days <n>            Prefix staleness threshold (default 90)
    --unused-threshold-days <n> Unused age threshold echoed in reports (default 180)
    --check-unused              Score unreferenced buckets for unused detection
    --unused-score <n>          Unused score threshold (default 150)
    --include-references        List every reference in the report
    --fail-on-missing           Exit 1 if referenced buckets are missing
    --fail-on-stale             Exit 1 if stale prefixes are found
    --fail-on-version-sprawl    Exit 1 if version sprawl is found

DISCOVER OPTIONS:
    --age-threshold-days <n>    Old bucket threshold (default 365)
    --inactive-days <n>         Inactivity threshold (default 180)
    --risk-threshold <n>        Risk score threshold (default 100)
    --check-encryption          Score buckets without default encryption
    --check-public              Score publicly accessible buckets
    --fail-on-risky             Exit 1 if risky buckets are found

EXIT CODES:
    0 - No gate fired
    1 - A --fail-on-* gate fired
    2 - Runtime failure or cancellation
    3 - Usage or configuration error

)";
  fprintf(stdout, usage, program);
}

auto applyExcludes(const Config::AuditConfig& config, Scanner::ReferenceList& references) -> size_t {
  size_t changed = 0;
  auto it = std::remove_if(references.begin(), references.end(), [&](const Scanner::Reference& ref) {
    return config.isExcludedContainer(ref.container);
  });
  changed += static_cast<size_t>(references.end() - it);
  references.erase(it, references.end());

  for (auto& ref : references) {
    if (!ref.prefix.empty() && config.isExcludedPrefix(ref.prefix)) {
      ref.prefix.clear();
      ++changed;
    }
  }
  if (changed > 0) {
    LOG_INFO("Excludes removed or trimmed %zu reference(s)", changed);
  }
  return changed;
}

auto applyExcludes(const Config::AuditConfig& config, Inspect::MetadataMap& metadata) -> size_t {
  size_t changed = 0;
  for (auto it = metadata.begin(); it != metadata.end();) {
    if (config.isExcludedContainer(it->first)) {
      it = metadata.erase(it);
      ++changed;
      continue;
    }
    auto& prefixes = it->second.prefixes;
    auto end = std::remove_if(prefixes.begin(), prefixes.end(), [&](const Inspect::PrefixMetadata& p) {
      return config.isExcludedPrefix(p.prefix);
    });
    changed += static_cast<size_t>(prefixes.end() - end);
    prefixes.erase(end, prefixes.end());
    ++it;
  }
  if (changed > 0) {
    LOG_INFO("Excludes removed %zu container(s) or prefix(es)", changed);
  }
  return changed;
}

auto evaluateGates(const Config::GateSettings& gates, Command command,
                   const Baseline::FindingList& findings) -> std::vector<std::string> {
  std::map<std::string, size_t> counts;
  for (const auto& f : findings) {
    ++counts[f.type];
  }

  std::vector<std::pair<bool, Classification>> checks;
  if (command == Command::SCAN) {
    checks = {
      {gates.fail_on_missing, Classification::RESOURCE_MISSING},
      {gates.fail_on_stale, Classification::PREFIX_STALE},
      {gates.fail_on_version_sprawl, Classification::VERSION_SPRAWL},
      {gates.fail_on_unused, Classification::RESOURCE_UNUSED},
    };
  } else if (command == Command::DISCOVER) {
    checks = {
      {gates.fail_on_unused, Classification::RESOURCE_UNUSED},
      {gates.fail_on_risky, Classification::RISKY},
    };
  }

  std::vector<std::string> fired;
  char buf[128];
  for (const auto& [enabled, status] : checks) {
    if (!enabled) {
      continue;
    }
    auto it = counts.find(classificationName(status));
    if (it != counts.end() && it->second > 0) {
      snprintf(buf, sizeof(buf), "%zu %s finding(s)", it->second, classificationName(status));
      fired.emplace_back(buf);
    }
  }
  return fired;
}

} // namespace Drift::Cli
