#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "common/logging.h"
#include "config/config_loader.h"
#include "drift/cli/cli.h"

using namespace Drift;
using Config::AuditConfig;
using Config::ConfigLoader;
using Config::EnvLoader;

class ConfigTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        timestamp_ = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        Common::initLogging(("logs/test_config_" + timestamp_ + ".log").c_str());
    }

    void TearDown() override {
        for (const auto& path : files_) {
            std::remove(path.c_str());
        }
        Common::shutdownLogging();
    }

    auto writeFile(const std::string& name, const std::string& content) -> std::string {
        const std::string path = "logs/" + name + "_" + timestamp_;
        FILE* file = std::fopen(path.c_str(), "w");
        EXPECT_NE(file, nullptr);
        if (file) {
            std::fputs(content.c_str(), file);
            std::fclose(file);
        }
        files_.push_back(path);
        return path;
    }

    auto parse(std::vector<std::string> args, Cli::CliOptions& out, std::string& error) -> bool {
        std::vector<const char*> argv;
        argv.push_back("s3drift");
        for (const auto& a : args) {
            argv.push_back(a.c_str());
        }
        return Cli::parseCommandLine(static_cast<int>(argv.size()), argv.data(), out, error);
    }

    std::string timestamp_;
    std::vector<std::string> files_;
};

// ============================================================================
// ConfigLoader
// ============================================================================

TEST_F(ConfigTestBase, ValueParsersContract) {
    bool b = false;
    EXPECT_TRUE(ConfigLoader::parseBool("Yes", b));
    EXPECT_TRUE(b);
    EXPECT_TRUE(ConfigLoader::parseBool("off", b));
    EXPECT_FALSE(b);
    EXPECT_FALSE(ConfigLoader::parseBool("maybe", b));

    int32_t n = 0;
    EXPECT_TRUE(ConfigLoader::parseInt("-12", n));
    EXPECT_EQ(n, -12);
    EXPECT_FALSE(ConfigLoader::parseInt("12abc", n));
    EXPECT_FALSE(ConfigLoader::parseInt("", n));
    EXPECT_FALSE(ConfigLoader::parseInt("99999999999", n));

    int32_t seconds = 0;
    EXPECT_TRUE(ConfigLoader::parseDuration("45", seconds));
    EXPECT_EQ(seconds, 45);
    EXPECT_TRUE(ConfigLoader::parseDuration("30s", seconds));
    EXPECT_EQ(seconds, 30);
    EXPECT_TRUE(ConfigLoader::parseDuration("5m", seconds));
    EXPECT_EQ(seconds, 300);
    EXPECT_TRUE(ConfigLoader::parseDuration("2h", seconds));
    EXPECT_EQ(seconds, 7200);
    EXPECT_FALSE(ConfigLoader::parseDuration("5d", seconds));
    EXPECT_FALSE(ConfigLoader::parseDuration("-1s", seconds));

    EXPECT_EQ(ConfigLoader::splitList(" a, b,,c "), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(ConfigLoader::splitList("").empty());
}

TEST_F(ConfigTestBase, LoadFromFileAppliesKnownKeys) {
    const std::string path = writeFile("drift.conf",
        "# drift settings\n"
        "\n"
        "AWS_PROFILE = audit\n"
        "REGIONS=us-east-1, eu-west-1\n"
        "CONCURRENCY=4\n"
        "TIMEOUT_SECONDS=5m\n"
        "STALE_DAYS=30\n"
        "CHECK_UNUSED=true\n"
        "CHECK_ENCRYPTION=on\n"
        "FORMAT=\"json\"\n"
        "EXCLUDE_BUCKETS=tmp-bucket,scratch\n"
        "SOMETHING_ELSE=ignored\n");

    AuditConfig config;
    std::string error;
    ASSERT_TRUE(ConfigLoader::loadFromFile(path.c_str(), config, error)) << error;

    EXPECT_EQ(config.provider.profile, "audit");
    EXPECT_EQ(config.provider.regions, (std::vector<std::string>{"us-east-1", "eu-west-1"}));
    EXPECT_EQ(config.provider.concurrency, 4);
    EXPECT_EQ(config.provider.timeout_seconds, 300);
    EXPECT_EQ(config.scan.stale_days, 30);
    EXPECT_TRUE(config.scan.check_unused);
    EXPECT_TRUE(config.discovery.check_encryption);
    EXPECT_EQ(config.output.format, "json");
    EXPECT_TRUE(config.isExcludedContainer("scratch"));
    EXPECT_EQ(config.discovery.inactive_days, 180);
}

TEST_F(ConfigTestBase, BadValueReportsFileAndLine) {
    const std::string path = writeFile("bad.conf", "STALE_DAYS=30\nCONCURRENCY=lots\n");

    AuditConfig config;
    std::string error;
    EXPECT_FALSE(ConfigLoader::loadFromFile(path.c_str(), config, error));
    EXPECT_EQ(error, path + ":2: CONCURRENCY: not an integer: lots");
}

TEST_F(ConfigTestBase, MissingFileIsAnError) {
    AuditConfig config;
    std::string error;
    EXPECT_FALSE(ConfigLoader::loadFromFile("/nonexistent/s3drift.conf", config, error));
    EXPECT_EQ(error.rfind("cannot open config file /nonexistent/s3drift.conf", 0), 0u) << error;
}

TEST_F(ConfigTestBase, ValidateRejectsBadSettings) {
    std::string error;
    AuditConfig config;
    EXPECT_TRUE(config.validate(error)) << error;

    config.scan.stale_days = -1;
    EXPECT_FALSE(config.validate(error));
    EXPECT_EQ(error, "stale days must not be negative (got -1)");

    config = AuditConfig{};
    config.output.format = "xml";
    EXPECT_FALSE(config.validate(error));

    config = AuditConfig{};
    config.logging.level = "chatty";
    EXPECT_FALSE(config.validate(error));

    config = AuditConfig{};
    config.output.update_baseline = true;
    EXPECT_FALSE(config.validate(error));
    config.output.baseline_path = "baseline.json";
    EXPECT_TRUE(config.validate(error));
}

TEST_F(ConfigTestBase, PrefixExcludesMatchLeadingText) {
    AuditConfig config;
    config.filters.exclude_prefixes = {"tmp/", ""};

    EXPECT_TRUE(config.isExcludedPrefix("tmp/"));
    EXPECT_TRUE(config.isExcludedPrefix("tmp/2024/"));
    EXPECT_FALSE(config.isExcludedPrefix("data/tmp/"));
    EXPECT_FALSE(config.isExcludedPrefix("tm"));
}

TEST_F(ConfigTestBase, EnvFileDoesNotOverrideEnvironment) {
    const std::string key_new = "S3DRIFT_TEST_NEW_" + timestamp_;
    const std::string key_set = "S3DRIFT_TEST_SET_" + timestamp_;
    setenv(key_set.c_str(), "from-shell", 1);

    const std::string path = writeFile("test.env",
        "# comment\n"
        "export " + key_new + "=\"quoted value\"\n" +
        key_set + "=from-file\n"
        "not a variable\n");

    EXPECT_TRUE(EnvLoader::loadFromFile(path.c_str()));
    EXPECT_STREQ(EnvLoader::getEnv(key_new.c_str()), "quoted value");
    EXPECT_STREQ(EnvLoader::getEnv(key_set.c_str()), "from-shell");
    EXPECT_STREQ(EnvLoader::getEnv("S3DRIFT_TEST_ABSENT", "fallback"), "fallback");

    EXPECT_FALSE(EnvLoader::loadFromFile("/nonexistent/.env"));

    unsetenv(key_new.c_str());
    unsetenv(key_set.c_str());
}

// ============================================================================
// Command line
// ============================================================================

TEST_F(ConfigTestBase, CommandsAndHelp) {
    Cli::CliOptions out;
    std::string error;

    ASSERT_TRUE(parse({}, out, error));
    EXPECT_EQ(out.command, Cli::Command::HELP);
    ASSERT_TRUE(parse({"--version"}, out, error));
    EXPECT_EQ(out.command, Cli::Command::VERSION);
    ASSERT_TRUE(parse({"scan", "--help"}, out, error));
    EXPECT_EQ(out.command, Cli::Command::HELP);

    EXPECT_FALSE(parse({"audit"}, out, error));
    EXPECT_EQ(error, "unknown command 'audit'");
}

TEST_F(ConfigTestBase, ScanFlagsOverrideConfigFile) {
    const std::string path = writeFile("flags.conf", "STALE_DAYS=30\nCONCURRENCY=4\nREGION=eu-west-1\n");

    Cli::CliOptions out;
    std::string error;
    ASSERT_TRUE(parse({"scan", "--config", path, "--stale-days=45", "--repo", "/src/app",
                       "--check-unused", "--fail-on-missing", "--exclude-bucket", "a,b",
                       "--exclude-bucket=c", "--timeout", "30s", "--format", "json"}, out, error)) << error;

    EXPECT_EQ(out.command, Cli::Command::SCAN);
    EXPECT_EQ(out.config_path, path);
    EXPECT_EQ(out.config.scan.stale_days, 45);
    EXPECT_EQ(out.config.provider.concurrency, 4);
    EXPECT_EQ(out.config.provider.region, "eu-west-1");
    EXPECT_EQ(out.config.scan.repo_path, "/src/app");
    EXPECT_TRUE(out.config.scan.check_unused);
    EXPECT_TRUE(out.config.gates.fail_on_missing);
    EXPECT_EQ(out.config.filters.exclude_containers, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(out.config.provider.timeout_seconds, 30);
    EXPECT_EQ(out.config.output.format, "json");
}

TEST_F(ConfigTestBase, FlagErrors) {
    Cli::CliOptions out;
    std::string error;

    EXPECT_FALSE(parse({"scan", "--bogus"}, out, error));
    EXPECT_EQ(error, "unknown flag '--bogus'");

    EXPECT_FALSE(parse({"discover", "--repo", "."}, out, error));
    EXPECT_EQ(error, "flag '--repo' is not valid for 'discover'");

    EXPECT_FALSE(parse({"scan", "--check-public"}, out, error));
    EXPECT_EQ(error, "flag '--check-public' is not valid for 'scan'");

    EXPECT_FALSE(parse({"scan", "--stale-days"}, out, error));
    EXPECT_EQ(error, "flag '--stale-days' requires a value");

    EXPECT_FALSE(parse({"scan", "--verbose=yes"}, out, error));
    EXPECT_EQ(error, "flag '--verbose' does not take a value");

    EXPECT_FALSE(parse({"scan", "--stale-days", "many"}, out, error));
    EXPECT_EQ(error, "--stale-days: expected an integer, got 'many'");

    EXPECT_FALSE(parse({"discover", "--config", "/nonexistent/s3drift.conf"}, out, error));

    EXPECT_FALSE(parse({"discover", "--risk-threshold", "-5"}, out, error));
    EXPECT_EQ(error, "risk score threshold must not be negative (got -5)");

    EXPECT_FALSE(parse({"discover", "--update-baseline"}, out, error));
}

TEST_F(ConfigTestBase, DiscoverFlags) {
    Cli::CliOptions out;
    std::string error;
    ASSERT_TRUE(parse({"discover", "--all-regions", "--check-encryption", "--check-public",
                       "--inactive-days", "90", "--fail-on-risky", "--fail-on-unused",
                       "--log-level", "debug"}, out, error)) << error;

    EXPECT_EQ(out.command, Cli::Command::DISCOVER);
    EXPECT_TRUE(out.config.provider.all_regions);
    EXPECT_TRUE(out.config.discovery.check_encryption);
    EXPECT_TRUE(out.config.discovery.check_public);
    EXPECT_EQ(out.config.discovery.inactive_days, 90);
    EXPECT_TRUE(out.config.gates.fail_on_risky);
    EXPECT_TRUE(out.config.gates.fail_on_unused);
    EXPECT_EQ(out.config.logging.level, "debug");

    ASSERT_TRUE(parse({"discover", "--all-regions", "--single-region"}, out, error)) << error;
    EXPECT_FALSE(out.config.provider.all_regions);
}

TEST_F(ConfigTestBase, EveryRegionIsTheDefaultScope) {
    Cli::CliOptions out;
    std::string error;
    ASSERT_TRUE(parse({"discover"}, out, error)) << error;
    EXPECT_TRUE(out.config.provider.all_regions);

    ASSERT_TRUE(parse({"scan", "--single-region"}, out, error)) << error;
    EXPECT_FALSE(out.config.provider.all_regions);
}

// ============================================================================
// Excludes and gates
// ============================================================================

TEST_F(ConfigTestBase, ExcludesTrimReferences) {
    AuditConfig config;
    config.filters.exclude_containers = {"scratch"};
    config.filters.exclude_prefixes = {"tmp/"};

    Scanner::ReferenceList refs(3);
    refs[0].container = "scratch";
    refs[1].container = "app";
    refs[1].prefix = "tmp/cache/";
    refs[2].container = "app";
    refs[2].prefix = "data/";

    EXPECT_EQ(Cli::applyExcludes(config, refs), 2u);
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0].container, "app");
    EXPECT_TRUE(refs[0].prefix.empty());
    EXPECT_EQ(refs[1].prefix, "data/");
}

TEST_F(ConfigTestBase, ExcludesTrimMetadata) {
    AuditConfig config;
    config.filters.exclude_containers = {"scratch"};
    config.filters.exclude_prefixes = {"tmp/"};

    Inspect::MetadataMap metadata;
    metadata["scratch"].name = "scratch";
    metadata["app"].name = "app";
    metadata["app"].prefixes.resize(2);
    metadata["app"].prefixes[0].prefix = "tmp/x/";
    metadata["app"].prefixes[1].prefix = "data/";

    EXPECT_EQ(Cli::applyExcludes(config, metadata), 2u);
    EXPECT_EQ(metadata.count("scratch"), 0u);
    ASSERT_EQ(metadata["app"].prefixes.size(), 1u);
    EXPECT_EQ(metadata["app"].prefixes[0].prefix, "data/");
}

TEST_F(ConfigTestBase, GatesFireOnMatchingFindingsOnly) {
    Baseline::FindingList findings = {
        {"MISSING_BUCKET", "ghost", ""},
        {"MISSING_BUCKET", "phantom", ""},
        {"STALE_PREFIX", "app", "old/"},
        {"RISKY", "exposed", ""},
    };

    Config::GateSettings gates;
    EXPECT_TRUE(Cli::evaluateGates(gates, Cli::Command::SCAN, findings).empty());

    gates.fail_on_missing = true;
    gates.fail_on_version_sprawl = true;
    gates.fail_on_risky = true;
    std::vector<std::string> fired = Cli::evaluateGates(gates, Cli::Command::SCAN, findings);
    ASSERT_EQ(fired.size(), 1u);
    EXPECT_EQ(fired[0], "2 MISSING_BUCKET finding(s)");

    fired = Cli::evaluateGates(gates, Cli::Command::DISCOVER, findings);
    ASSERT_EQ(fired.size(), 1u);
    EXPECT_EQ(fired[0], "1 RISKY finding(s)");

    EXPECT_TRUE(Cli::evaluateGates(gates, Cli::Command::SCAN, {}).empty());
}
