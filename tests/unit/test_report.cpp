#include <gtest/gtest.h>
#include <rapidjson/document.h>

#include <chrono>
#include <cstdio>
#include <string>

#include "common/logging.h"
#include "drift/report/report.h"

using namespace Drift;
using namespace Drift::Report;

class ReportTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        std::string timestamp = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        Common::initLogging(("logs/test_report_" + timestamp + ".log").c_str());
    }

    void TearDown() override {
        Common::shutdownLogging();
    }

    static auto scanReport() -> ScanReport {
        ScanReport report;
        report.timestamp = 946684800;
        report.config.repo_path = "/src/app";
        report.config.stale_threshold_days = 90;
        report.config.check_unused = true;
        report.config.unused_score_threshold = 150;

        Analysis::ContainerAnalysis ghost;
        ghost.name = "ghost";
        ghost.status = Analysis::Classification::RESOURCE_MISSING;
        ghost.message = "Bucket referenced in code but does not exist in AWS";
        ghost.referenced_in_code = true;
        report.result.containers["ghost"] = ghost;
        report.result.summary.total_containers = 2;
        report.result.summary.missing_containers = {"ghost"};

        Analysis::ContainerAnalysis app;
        app.name = "app";
        app.exists = true;
        app.region = "eu-west-1";
        app.message = "Bucket exists and matches expected usage";
        Analysis::PrefixAnalysis stale;
        stale.prefix = "old/";
        stale.status = Analysis::Classification::PREFIX_STALE;
        stale.object_count = 4;
        stale.days_since_modified = 120;
        app.prefixes = {stale};
        app.error = "GetBucketTagging failed for app: Access Denied - check IAM permissions";
        report.result.containers["app"] = app;
        report.result.summary.ok_containers = 1;
        report.result.summary.stale_prefixes = {"app/old/"};

        Scanner::Reference ref;
        ref.container = "app";
        ref.prefix = "old/";
        ref.source_file = "src/upload.py";
        ref.source_line = 12;
        ref.access = Scanner::AccessMode::WRITE;
        report.references = Scanner::ReferenceList{ref};
        return report;
    }
};

TEST_F(ReportTestBase, FormatNamesContract) {
    Format f = Format::TEXT;
    EXPECT_TRUE(parseFormat("json", f));
    EXPECT_EQ(f, Format::JSON);
    EXPECT_TRUE(parseFormat("text", f));
    EXPECT_EQ(f, Format::TEXT);
    EXPECT_FALSE(parseFormat("yaml", f));
    EXPECT_FALSE(parseFormat("JSON", f));
}

TEST_F(ReportTestBase, ScanJsonLayout) {
    const std::string json = renderScanJson(scanReport());
    ASSERT_FALSE(json.empty());
    EXPECT_EQ(json.back(), '\n');

    rapidjson::Document doc;
    doc.Parse(json.c_str());
    ASSERT_FALSE(doc.HasParseError());

    EXPECT_STREQ(doc["tool"].GetString(), "s3drift");
    EXPECT_STREQ(doc["timestamp"].GetString(), "2000-01-01T00:00:00Z");
    EXPECT_STREQ(doc["config"]["repo_path"].GetString(), "/src/app");
    EXPECT_EQ(doc["summary"]["total_buckets"].GetUint(), 2u);
    EXPECT_EQ(doc["summary"]["missing_buckets"].Size(), 1u);
    EXPECT_FALSE(doc["summary"].HasMember("unused_buckets"));

    const rapidjson::Value& ghost = doc["buckets"]["ghost"];
    EXPECT_STREQ(ghost["status"].GetString(), "MISSING_BUCKET");
    EXPECT_FALSE(ghost["exists_in_aws"].GetBool());
    EXPECT_TRUE(ghost["referenced_in_code"].GetBool());

    const rapidjson::Value& app = doc["buckets"]["app"];
    EXPECT_STREQ(app["region"].GetString(), "eu-west-1");
    EXPECT_STREQ(app["prefixes"][0]["status"].GetString(), "STALE_PREFIX");
    EXPECT_EQ(app["prefixes"][0]["days_since_modified"].GetInt(), 120);
    EXPECT_TRUE(app.HasMember("error"));

    ASSERT_TRUE(doc.HasMember("references"));
    EXPECT_STREQ(doc["references"][0]["file"].GetString(), "src/upload.py");
    EXPECT_EQ(doc["references"][0]["line"].GetUint(), 12u);
    EXPECT_FALSE(doc.HasMember("baseline"));
}

TEST_F(ReportTestBase, BaselineBlockListsNewAndResolved) {
    ScanReport report = scanReport();
    report.references.reset();
    Baseline::DiffResult diff;
    diff.added = {{"STALE_PREFIX", "app", "old/"}};
    diff.resolved = {{"MISSING_BUCKET", "legacy", ""}};
    diff.unchanged = {{"MISSING_BUCKET", "ghost", ""}};
    report.baseline = diff;

    rapidjson::Document doc;
    doc.Parse(renderScanJson(report).c_str());
    ASSERT_FALSE(doc.HasParseError());

    EXPECT_FALSE(doc.HasMember("references"));
    const rapidjson::Value& block = doc["baseline"];
    EXPECT_STREQ(block["new"][0]["prefix"].GetString(), "old/");
    EXPECT_FALSE(block["resolved"][0].HasMember("prefix"));
    EXPECT_EQ(block["unchanged_count"].GetUint(), 1u);

    const std::string text = renderScanText(report);
    EXPECT_NE(text.find("Baseline Comparison"), std::string::npos);
    EXPECT_NE(text.find("[NEW] STALE_PREFIX: app/old/"), std::string::npos);
    EXPECT_NE(text.find("[RESOLVED] MISSING_BUCKET: legacy"), std::string::npos);
}

TEST_F(ReportTestBase, ScanTextSections) {
    const std::string text = renderScanText(scanReport());

    EXPECT_EQ(text.rfind("S3 Drift Report\n", 0), 0u);
    EXPECT_NE(text.find("Repository: /src/app"), std::string::npos);
    EXPECT_NE(text.find("Total Buckets Scanned: 2"), std::string::npos);
    EXPECT_NE(text.find("[MISSING_BUCKET]: ghost"), std::string::npos);
    EXPECT_NE(text.find("[STALE_PREFIX]: app/old/"), std::string::npos);
    EXPECT_NE(text.find("[OK]: app"), std::string::npos);
    EXPECT_NE(text.find("Collection Errors"), std::string::npos);
    EXPECT_EQ(text.find("Unused Buckets"), std::string::npos);
}

TEST_F(ReportTestBase, DiscoveryReportCapsHealthyListing) {
    DiscoveryReport report;
    report.timestamp = 946684800;
    report.config.all_regions = true;
    for (int i = 0; i < 12; ++i) {
        Analysis::ContainerRisk risk;
        risk.name = "bucket-" + std::to_string(10 + i);
        risk.region = "us-east-1";
        report.result.containers[risk.name] = risk;
    }
    Analysis::ContainerRisk exposed;
    exposed.name = "exposed";
    exposed.region = "eu-west-1";
    exposed.status = Analysis::Classification::RISKY;
    exposed.risk_score = 100;
    exposed.risk_factors = {"No encryption enabled", "Public access enabled"};
    exposed.recommendations = {"Enable default encryption (AES256 or KMS)"};
    exposed.metadata.name = "exposed";
    exposed.metadata.encryption = Provider::EncryptionState{false, "", ""};
    report.result.containers["exposed"] = exposed;
    report.result.summary.total_containers = 13;
    report.result.summary.healthy = 12;
    report.result.summary.risky_containers = {"exposed"};
    report.result.summary.total_regions = 2;

    const std::string text = renderDiscoveryText(report);
    EXPECT_EQ(text.rfind("S3 Drift Discovery Report\n", 0), 0u);
    EXPECT_NE(text.find("Scanning: All enabled AWS regions"), std::string::npos);
    EXPECT_NE(text.find("[RISKY]: exposed (eu-west-1)"), std::string::npos);
    EXPECT_NE(text.find("Risk Score: 100"), std::string::npos);
    EXPECT_NE(text.find("Enable default encryption"), std::string::npos);
    EXPECT_NE(text.find("[OK]: bucket-19 (us-east-1)"), std::string::npos);
    EXPECT_EQ(text.find("[OK]: bucket-20"), std::string::npos);
    EXPECT_NE(text.find("... and 2 more"), std::string::npos);

    rapidjson::Document doc;
    doc.Parse(renderDiscoveryJson(report).c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["summary"]["healthy_buckets"].GetUint(), 12u);
    EXPECT_EQ(doc["buckets"]["exposed"]["risk_score"].GetInt(), 100);
    EXPECT_FALSE(doc["buckets"]["exposed"]["bucket_info"]["encryption"]["enabled"].GetBool());
    EXPECT_FALSE(doc["buckets"]["bucket-10"]["bucket_info"].HasMember("encryption"));
}

TEST_F(ReportTestBase, FormatBytesContract) {
    EXPECT_EQ(formatBytes(0), "0 B");
    EXPECT_EQ(formatBytes(1023), "1023 B");
    EXPECT_EQ(formatBytes(1536), "1.50 KB");
    EXPECT_EQ(formatBytes(1048576), "1.00 MB");
    EXPECT_EQ(formatBytes(int64_t{5} * 1024 * 1024 * 1024), "5.00 GB");
}

TEST_F(ReportTestBase, WriteOutputToFile) {
    const std::string path = "logs/report_output_test.json";
    std::string error;
    ASSERT_TRUE(writeOutput(path, "{}\n", error)) << error;

    FILE* file = std::fopen(path.c_str(), "r");
    ASSERT_NE(file, nullptr);
    char buf[16] = {};
    size_t n = std::fread(buf, 1, sizeof(buf) - 1, file);
    std::fclose(file);
    std::remove(path.c_str());
    EXPECT_EQ(std::string(buf, n), "{}\n");

    EXPECT_FALSE(writeOutput("/nonexistent/dir/report.json", "x", error));
    EXPECT_EQ(error.rfind("open /nonexistent/dir/report.json: ", 0), 0u) << error;
}
