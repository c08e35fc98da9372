#include <gtest/gtest.h>
#include <chrono>
#include <string>

#include "common/logging.h"
#include "drift/baseline/baseline.h"
#include "drift/report/report.h"

using namespace Drift;
using namespace Drift::Baseline;

class BaselineTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        std::string timestamp = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        Common::initLogging(("logs/test_baseline_" + timestamp + ".log").c_str());
    }

    void TearDown() override {
        Common::shutdownLogging();
    }

    static auto sampleScan() -> Analysis::ScanResult {
        Analysis::ScanResult result;
        Analysis::ContainerAnalysis ghost;
        ghost.name = "ghost";
        ghost.status = Analysis::Classification::RESOURCE_MISSING;
        result.containers["ghost"] = ghost;

        Analysis::ContainerAnalysis app;
        app.name = "app";
        app.exists = true;
        Analysis::PrefixAnalysis stale;
        stale.prefix = "old/";
        stale.status = Analysis::Classification::PREFIX_STALE;
        Analysis::PrefixAnalysis fine;
        fine.prefix = "new/";
        app.prefixes = {stale, fine};
        result.containers["app"] = app;
        return result;
    }
};

TEST_F(BaselineTestBase, FindingKeyContract) {
    EXPECT_EQ((Finding{"MISSING_BUCKET", "ghost", ""}).key(), "MISSING_BUCKET|ghost");
    EXPECT_EQ((Finding{"STALE_PREFIX", "app", "old/"}).key(), "STALE_PREFIX|app|old/");
}

TEST_F(BaselineTestBase, FlattenSkipsHealthyEntries) {
    FindingList findings = flattenScanFindings(sampleScan());

    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0], (Finding{"STALE_PREFIX", "app", "old/"}));
    EXPECT_EQ(findings[1], (Finding{"MISSING_BUCKET", "ghost", ""}));
}

TEST_F(BaselineTestBase, FlattenDiscoveryIsContainerLevelOnly) {
    Analysis::DiscoveryResult result;
    result.containers["a"].status = Analysis::Classification::RISKY;
    result.containers["b"].status = Analysis::Classification::OK;
    result.containers["c"].status = Analysis::Classification::INACTIVE;

    FindingList findings = flattenDiscoveryFindings(result);

    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0], (Finding{"RISKY", "a", ""}));
    EXPECT_EQ(findings[1], (Finding{"INACTIVE", "c", ""}));
}

TEST_F(BaselineTestBase, DiffSeparatesNewResolvedAndUnchanged) {
    FindingList baseline = {
        {"MISSING_BUCKET", "ghost", ""},
        {"STALE_PREFIX", "app", "logs/"},
    };
    FindingList current = {
        {"MISSING_BUCKET", "ghost", ""},
        {"STALE_PREFIX", "app", "old/"},
        // Same container, different type is a different finding
        {"VERSION_SPRAWL", "ghost", ""},
    };

    DiffResult diff = diffFindings(current, baseline);

    ASSERT_EQ(diff.added.size(), 2u);
    EXPECT_EQ(diff.added[0].prefix, "old/");
    EXPECT_EQ(diff.added[1].type, "VERSION_SPRAWL");
    ASSERT_EQ(diff.resolved.size(), 1u);
    EXPECT_EQ(diff.resolved[0].prefix, "logs/");
    ASSERT_EQ(diff.unchanged.size(), 1u);
    EXPECT_EQ(diff.unchanged[0].container, "ghost");
}

TEST_F(BaselineTestBase, DiffAgainstItselfIsAllUnchanged) {
    FindingList findings = flattenScanFindings(sampleScan());
    findings.push_back({"VERSION_SPRAWL", "history", ""});

    DiffResult diff = diffFindings(findings, findings);

    EXPECT_TRUE(diff.added.empty());
    EXPECT_TRUE(diff.resolved.empty());
    EXPECT_EQ(diff.unchanged, findings);
}

TEST_F(BaselineTestBase, EmptyBaselineMakesEverythingNew) {
    FindingList current = flattenScanFindings(sampleScan());
    DiffResult diff = diffFindings(current, {});

    EXPECT_EQ(diff.added.size(), current.size());
    EXPECT_TRUE(diff.resolved.empty());
    EXPECT_TRUE(diff.unchanged.empty());
}

TEST_F(BaselineTestBase, ParseScanBaselineReadsContainersAndPrefixes) {
    const std::string json = R"({
        "tool": "s3drift",
        "buckets": {
            "app": {
                "status": "OK",
                "prefixes": [
                    {"prefix": "old/", "status": "STALE_PREFIX"},
                    {"prefix": "new/", "status": "OK"}
                ]
            },
            "ghost": {"status": "MISSING_BUCKET"},
            "weird": 42
        }
    })";

    FindingList findings;
    std::string error;
    ASSERT_TRUE(parseScanBaseline(json, findings, error)) << error;

    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0], (Finding{"STALE_PREFIX", "app", "old/"}));
    EXPECT_EQ(findings[1], (Finding{"MISSING_BUCKET", "ghost", ""}));
}

TEST_F(BaselineTestBase, ParseDiscoveryBaselineIgnoresPrefixes) {
    const std::string json = R"({"buckets": {
        "a": {"status": "UNUSED_BUCKET", "prefixes": [{"prefix": "x/", "status": "MISSING_PREFIX"}]},
        "b": {"status": "OK"}
    }})";

    FindingList findings;
    std::string error;
    ASSERT_TRUE(parseDiscoveryBaseline(json, findings, error)) << error;

    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0], (Finding{"UNUSED_BUCKET", "a", ""}));
}

TEST_F(BaselineTestBase, MissingContainerSectionIsEmptyBaseline) {
    FindingList findings = {{"RISKY", "stale", ""}};
    std::string error;

    EXPECT_TRUE(parseScanBaseline(R"({"tool": "s3drift"})", findings, error));
    EXPECT_TRUE(findings.empty());
    EXPECT_TRUE(parseScanBaseline(R"({"buckets": null})", findings, error));
    EXPECT_TRUE(findings.empty());
}

TEST_F(BaselineTestBase, MalformedDocumentsAreRejected) {
    FindingList findings;
    std::string error;

    EXPECT_FALSE(parseScanBaseline("{\"buckets\": {", findings, error));
    EXPECT_EQ(error.rfind("parse baseline: ", 0), 0u) << error;
    EXPECT_NE(error.find("offset"), std::string::npos);

    error.clear();
    EXPECT_FALSE(parseScanBaseline("[1, 2]", findings, error));
    EXPECT_EQ(error, "parse baseline: document is not an object");

    error.clear();
    EXPECT_FALSE(parseDiscoveryBaseline(R"({"buckets": []})", findings, error));
    EXPECT_EQ(error, "parse baseline: \"buckets\" is not an object");
}

TEST_F(BaselineTestBase, UnreadableFileReportsPath) {
    FindingList findings;
    std::string error;

    EXPECT_FALSE(loadScanBaseline("/nonexistent/baseline.json", findings, error));
    EXPECT_EQ(error.rfind("read baseline: /nonexistent/baseline.json: ", 0), 0u) << error;
}

TEST_F(BaselineTestBase, RenderedReportReadsBackAsBaseline) {
    Report::ScanReport report;
    report.timestamp = 1700000000;
    report.config.repo_path = ".";
    report.result = sampleScan();

    FindingList findings;
    std::string error;
    ASSERT_TRUE(parseScanBaseline(Report::renderScanJson(report), findings, error)) << error;

    EXPECT_EQ(findings, flattenScanFindings(report.result));
}
