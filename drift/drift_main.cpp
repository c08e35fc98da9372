// ============================================================================
// drift_main.cpp - Entry point for the s3drift auditor
// ============================================================================

#include "common/cancel_token.h"
#include "common/logging.h"
#include "common/macros.h"
#include "common/time_utils.h"

#include "config/config_loader.h"
#include "drift/analysis/discovery_analyzer.h"
#include "drift/analysis/scan_analyzer.h"
#include "drift/baseline/baseline.h"
#include "drift/cli/cli.h"
#include "drift/inspect/inspector.h"
#include "drift/provider/credentials.h"
#include "drift/provider/s3_provider.h"
#include "drift/report/report.h"
#include "drift/scanner/reference_scanner.h"
#include "drift/version.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <thread>
#include <unistd.h>

using namespace Drift;

// Set from the signal handler; a watcher thread turns it into cancellation.
static std::atomic<bool> g_shutdown{false};

static void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown.store(true);
  }
}

// Polls the shutdown flag and cancels the run token.
class SignalWatcher {
public:
  explicit SignalWatcher(Common::CancelToken token)
    : token_(std::move(token)), thread_([this] { run(); }) {}

  ~SignalWatcher() {
    stop_.store(true);
    thread_.join();
  }

  DELETE_COPY_AND_MOVE(SignalWatcher);

private:
  auto run() -> void {
    while (!stop_.load()) {
      if (g_shutdown.load()) {
        LOG_WARN("Interrupted, cancelling outstanding requests");
        token_.cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }

  Common::CancelToken token_;
  std::atomic<bool> stop_{false};
  std::thread thread_;
};

static auto setupLogging(const Config::AuditConfig& cfg) -> void {
  Common::LogLevel level = Common::LogLevel::INFO;
  if (!Common::parseLogLevel(cfg.logging.level.c_str(), level)) {
    level = Common::LogLevel::INFO;
  }
  if (cfg.logging.verbose) {
    level = Common::LogLevel::DEBUG;
    Common::setConsoleLevel(Common::LogLevel::DEBUG);
  }
  Common::setLogLevel(level);

  const std::string path = cfg.logging.logs_dir + "/s3drift_" + Common::getFileTimestamp() + ".log";
  if (!Common::initLogging(path.c_str())) {
    fprintf(stderr, "Warning: cannot open log file %s, logging to stderr only\n", path.c_str());
  }
}

static auto makeProgress(const Config::AuditConfig& cfg) -> Inspect::ProgressCallback {
  if (!cfg.output.progress || !isatty(STDERR_FILENO)) {
    return nullptr;
  }
  return [](size_t completed, size_t total, const std::string& name) {
    fprintf(stderr, "\r\033[K[%zu/%zu] %s", completed, total, name.c_str());
    if (completed == total) {
      fprintf(stderr, "\n");
    }
    fflush(stderr);
  };
}

static auto makeInspector(const Config::AuditConfig& cfg, Provider::StorageProviderPtr provider,
                          const std::string& default_region, bool include_unreferenced) -> Inspect::Inspector {
  Inspect::InspectorConfig icfg;
  icfg.concurrency = cfg.provider.concurrency;
  icfg.regions.explicit_regions = cfg.provider.regions;
  icfg.regions.all_regions = cfg.provider.all_regions;
  icfg.regions.default_region = default_region;
  icfg.check_encryption = cfg.discovery.check_encryption;
  icfg.check_public_access = cfg.discovery.check_public;
  icfg.include_unreferenced = include_unreferenced;

  Inspect::Inspector inspector(Provider::ProviderClient(std::move(provider), Provider::RetryPolicy{}), icfg);
  inspector.setProgressCallback(makeProgress(cfg));
  return inspector;
}

// Loads the baseline findings. A missing file is an empty baseline when the
// run is about to create it.
static auto loadBaseline(const Config::AuditConfig& cfg, bool scan, Baseline::FindingList& findings) -> bool {
  std::error_code ec;
  if (cfg.output.update_baseline && !std::filesystem::exists(cfg.output.baseline_path, ec)) {
    LOG_INFO("Baseline %s does not exist yet, starting empty", cfg.output.baseline_path.c_str());
    return true;
  }
  std::string error;
  const bool ok = scan ? Baseline::loadScanBaseline(cfg.output.baseline_path, findings, error)
                       : Baseline::loadDiscoveryBaseline(cfg.output.baseline_path, findings, error);
  if (!ok) {
    fprintf(stderr, "Error: %s\n", error.c_str());
  }
  return ok;
}

// Writes the report and, when asked, the baseline; then evaluates gates.
static auto finish(const Config::AuditConfig& cfg, Cli::Command command, const std::string& rendered,
                   const std::string& json, const Baseline::FindingList& gate_findings) -> int {
  std::string error;
  if (!Report::writeOutput(cfg.output.path, rendered, error)) {
    fprintf(stderr, "Error: %s\n", error.c_str());
    return Cli::EXIT_RUNTIME_ERROR;
  }
  if (cfg.output.update_baseline) {
    if (!Report::writeOutput(cfg.output.baseline_path, json, error)) {
      fprintf(stderr, "Error: baseline write: %s\n", error.c_str());
      return Cli::EXIT_RUNTIME_ERROR;
    }
    LOG_INFO("Updated baseline %s", cfg.output.baseline_path.c_str());
  }

  const auto fired = Cli::evaluateGates(cfg.gates, command, gate_findings);
  for (const auto& gate : fired) {
    fprintf(stderr, "Gate failed: %s\n", gate.c_str());
    LOG_WARN("Gate failed: %s", gate.c_str());
  }
  return fired.empty() ? Cli::EXIT_CLEAN : Cli::EXIT_GATE_FAILED;
}

static auto reportCollectionFailure(const Inspect::CollectionResult& collection) -> int {
  if (collection.status == Inspect::CollectionStatus::CANCELLED) {
    fprintf(stderr, "Error: cancelled: %s\n", collection.error.c_str());
  } else {
    fprintf(stderr, "Error: %s\n", collection.error.c_str());
  }
  LOG_ERROR("Collection failed: %s", collection.error.c_str());
  return Cli::EXIT_RUNTIME_ERROR;
}

static auto runScan(const Config::AuditConfig& cfg, Provider::StorageProviderPtr provider,
                    const std::string& default_region, const Common::CancelToken& cancel) -> int {
  std::error_code ec;
  if (!std::filesystem::is_directory(cfg.scan.repo_path, ec)) {
    fprintf(stderr, "Error: repository path not found: %s\n", cfg.scan.repo_path.c_str());
    return Cli::EXIT_USAGE_ERROR;
  }

  Scanner::ReferenceList references;
  std::string error;
  Scanner::ReferenceScanner scanner;
  if (!scanner.scanDirectory(cfg.scan.repo_path, cancel, references, error)) {
    fprintf(stderr, "Error: %s\n", error.c_str());
    return Cli::EXIT_RUNTIME_ERROR;
  }
  Cli::applyExcludes(cfg, references);

  Baseline::FindingList baseline_findings;
  if (!cfg.output.baseline_path.empty() && !loadBaseline(cfg, true, baseline_findings)) {
    return Cli::EXIT_USAGE_ERROR;
  }

  Inspect::Inspector inspector = makeInspector(cfg, std::move(provider), default_region, cfg.scan.check_unused);
  Inspect::CollectionResult collection = inspector.inspect(references, cancel);
  if (!collection.ok()) {
    return reportCollectionFailure(collection);
  }
  Cli::applyExcludes(cfg, collection.containers);

  Analysis::ScanConfig scfg;
  scfg.stale_threshold_days = cfg.scan.stale_days;
  scfg.check_unused = cfg.scan.check_unused;
  scfg.unused_score_threshold = cfg.scan.unused_score_threshold;

  Report::ScanReport report;
  report.timestamp = Common::getWallClockSeconds();
  report.config.repo_path = cfg.scan.repo_path;
  report.config.aws_profile = cfg.provider.profile;
  report.config.aws_region = default_region;
  report.config.regions = collection.regions;
  report.config.stale_threshold_days = cfg.scan.stale_days;
  report.config.unused_threshold_days = cfg.scan.unused_threshold_days;
  report.config.check_unused = cfg.scan.check_unused;
  report.config.unused_score_threshold = scfg.effectiveUnusedThreshold();
  report.result = Analysis::analyzeScan(references, collection.containers, scfg);
  if (cfg.scan.include_references) {
    report.references = references;
  }

  Baseline::FindingList gate_findings = Baseline::flattenScanFindings(report.result);
  if (!cfg.output.baseline_path.empty()) {
    report.baseline = Baseline::diffFindings(gate_findings, baseline_findings);
    LOG_INFO("Baseline comparison: %zu new, %zu resolved, %zu unchanged",
             report.baseline->added.size(), report.baseline->resolved.size(), report.baseline->unchanged.size());
    gate_findings = report.baseline->added;
  }

  const std::string json = Report::renderScanJson(report);
  const std::string rendered = cfg.output.format == "json" ? json : Report::renderScanText(report);
  return finish(cfg, Cli::Command::SCAN, rendered, json, gate_findings);
}

static auto runDiscover(const Config::AuditConfig& cfg, Provider::StorageProviderPtr provider,
                        const std::string& default_region, const Common::CancelToken& cancel) -> int {
  Baseline::FindingList baseline_findings;
  if (!cfg.output.baseline_path.empty() && !loadBaseline(cfg, false, baseline_findings)) {
    return Cli::EXIT_USAGE_ERROR;
  }

  Inspect::Inspector inspector = makeInspector(cfg, std::move(provider), default_region, false);
  Inspect::CollectionResult collection = inspector.discoverAll(cancel);
  if (!collection.ok()) {
    return reportCollectionFailure(collection);
  }
  Cli::applyExcludes(cfg, collection.containers);

  Analysis::DiscoveryConfig dcfg;
  dcfg.age_threshold_days = cfg.discovery.age_threshold_days;
  dcfg.inactivity_threshold_days = cfg.discovery.inactive_days;
  dcfg.check_encryption = cfg.discovery.check_encryption;
  dcfg.check_public_access = cfg.discovery.check_public;
  dcfg.risk_score_threshold = cfg.discovery.risk_score_threshold;

  Report::DiscoveryReport report;
  report.timestamp = Common::getWallClockSeconds();
  report.config.aws_profile = cfg.provider.profile;
  report.config.all_regions = cfg.provider.all_regions && cfg.provider.regions.empty();
  report.config.regions = collection.regions;
  report.config.age_threshold_days = dcfg.age_threshold_days;
  report.config.inactivity_threshold_days = dcfg.inactivity_threshold_days;
  report.config.risk_score_threshold = dcfg.effectiveRiskThreshold();
  report.config.check_encryption = dcfg.check_encryption;
  report.config.check_public_access = dcfg.check_public_access;
  report.result = Analysis::analyzeDiscovery(collection.containers, dcfg);

  Baseline::FindingList gate_findings = Baseline::flattenDiscoveryFindings(report.result);
  if (!cfg.output.baseline_path.empty()) {
    report.baseline = Baseline::diffFindings(gate_findings, baseline_findings);
    LOG_INFO("Baseline comparison: %zu new, %zu resolved, %zu unchanged",
             report.baseline->added.size(), report.baseline->resolved.size(), report.baseline->unchanged.size());
    gate_findings = report.baseline->added;
  }

  const std::string json = Report::renderDiscoveryJson(report);
  const std::string rendered = cfg.output.format == "json" ? json : Report::renderDiscoveryText(report);
  return finish(cfg, Cli::Command::DISCOVER, rendered, json, gate_findings);
}

int main(int argc, char* argv[]) {
  // Credentials may come from a local .env
  if (access(".env", F_OK) == 0 && !Config::EnvLoader::loadFromFile(".env")) {
    fprintf(stderr, "Warning: cannot read .env\n");
  }

  Cli::CliOptions options;
  std::string error;
  if (!Cli::parseCommandLine(argc, argv, options, error)) {
    fprintf(stderr, "Error: %s\nRun '%s help' for usage.\n", error.c_str(), argv[0]);
    return Cli::EXIT_USAGE_ERROR;
  }

  switch (options.command) {
    case Cli::Command::HELP:
      Cli::printUsage(argv[0]);
      return Cli::EXIT_CLEAN;
    case Cli::Command::VERSION:
      printf("%s %s\n", TOOL_NAME, TOOL_VERSION);
      return Cli::EXIT_CLEAN;
    default:
      break;
  }

  const Config::AuditConfig& cfg = options.config;
  setupLogging(cfg);
  LOG_INFO("%s %s starting (%s)", TOOL_NAME, TOOL_VERSION, argv[1]);
  if (!options.config_path.empty()) {
    LOG_INFO("Using config file %s", options.config_path.c_str());
  }

  if (!Provider::S3::S3Provider::globalInit()) {
    fprintf(stderr, "Error: HTTP client initialisation failed\n");
    Common::shutdownLogging();
    return Cli::EXIT_RUNTIME_ERROR;
  }

  const std::string default_region = Provider::CredentialLoader::resolveDefaultRegion(cfg.provider.region);
  Provider::S3::S3ProviderConfig pcfg;
  pcfg.region = default_region;
  pcfg.endpoint = cfg.provider.endpoint;
  pcfg.request_timeout = std::chrono::seconds(cfg.provider.request_timeout_seconds > 0
                                                  ? cfg.provider.request_timeout_seconds : 30);

  auto provider = Provider::S3::S3Provider::create(cfg.provider.profile, pcfg);
  if (!provider) {
    fprintf(stderr, "Error: no AWS credentials found. Set AWS_ACCESS_KEY_ID/AWS_SECRET_ACCESS_KEY "
                    "or configure a profile in %s\n", Provider::CredentialLoader::sharedFilePath().c_str());
    Provider::S3::S3Provider::globalCleanup();
    Common::shutdownLogging();
    return Cli::EXIT_USAGE_ERROR;
  }

  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  const Common::CancelToken cancel =
      Common::CancelToken::withTimeout(std::chrono::seconds(cfg.provider.timeout_seconds));

  int exit_code = Cli::EXIT_CLEAN;
  {
    SignalWatcher watcher(cancel);
    exit_code = options.command == Cli::Command::SCAN
        ? runScan(cfg, provider, default_region, cancel)
        : runDiscover(cfg, provider, default_region, cancel);
  }

  const Common::LoggerStats stats = Common::getLoggerStats();
  LOG_INFO("Finished with exit code %d", exit_code);
  if (stats.messages_dropped > 0) {
    fprintf(stderr, "Warning: %llu log message(s) dropped\n",
            static_cast<unsigned long long>(stats.messages_dropped));
  }

  provider.reset();
  Provider::S3::S3Provider::globalCleanup();
  Common::shutdownLogging();
  return exit_code;
}
