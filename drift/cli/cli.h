#pragma once

// ============================================================================
// cli.h - Command line handling for the s3drift binary
// ============================================================================

#include <cstdint>
#include <string>
#include <vector>

#include "config/audit_config.h"
#include "drift/baseline/baseline.h"
#include "drift/inspect/metadata.h"
#include "drift/scanner/reference.h"

namespace Drift::Cli {

enum class Command : uint8_t { HELP = 0, VERSION = 1, SCAN = 2, DISCOVER = 3 };

enum ExitCode : int {
  EXIT_CLEAN = 0,
  EXIT_GATE_FAILED = 1,
  EXIT_RUNTIME_ERROR = 2,
  EXIT_USAGE_ERROR = 3
};

struct CliOptions {
  Command command{Command::HELP};
  std::string config_path;     // file actually loaded, empty if none
  Config::AuditConfig config;
};

// Defaults, then the config file, then flags. Returns false with `error` set
// on unknown commands or flags, bad values, or an unreadable config file.
[[nodiscard]] auto parseCommandLine(int argc, const char* const argv[], CliOptions& out, std::string& error) -> bool;

auto printUsage(const char* program) -> void;

// Drops references to excluded containers and clears excluded prefixes.
// Returns the number of references changed or removed.
auto applyExcludes(const Config::AuditConfig& config, Scanner::ReferenceList& references) -> size_t;

// Drops excluded containers and excluded prefixes from collected metadata.
auto applyExcludes(const Config::AuditConfig& config, Inspect::MetadataMap& metadata) -> size_t;

// One line per gate that fired, e.g. "2 MISSING_BUCKET finding(s)".
// `findings` are the new findings when a baseline is in use.
[[nodiscard]] auto evaluateGates(const Config::GateSettings& gates, Command command,
                                 const Baseline::FindingList& findings) -> std::vector<std::string>;

} // namespace Drift::Cli
