#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "common/cancel_token.h"
#include "common/logging.h"
#include "drift/provider/retry.h"

using namespace Drift::Provider;

class RetryTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        std::string timestamp = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        Common::initLogging(("logs/test_retry_" + timestamp + ".log").c_str());
        LOG_INFO("=== Starting Retry Test ===");

        policy_.base_delay = std::chrono::milliseconds(1);
    }

    void TearDown() override {
        LOG_INFO("=== Retry Test Completed ===");
        Common::shutdownLogging();
    }

    RetryPolicy policy_;
    Common::CancelToken cancel_;
};

TEST_F(RetryTestBase, TransientFailuresAreRetriedUntilSuccess) {
    int calls = 0;
    ApiError result = executeWithRetry(policy_, cancel_, "GetBucketVersioning", [&] {
        ++calls;
        if (calls < 3) {
            return ApiError::make(ErrorKind::TRANSIENT, 503, "SlowDown", "Please reduce your request rate.");
        }
        return ApiError::success();
    });

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(calls, 3);
}

TEST_F(RetryTestBase, PermanentErrorIsReturnedWithoutRetry) {
    int calls = 0;
    ApiError result = executeWithRetry(policy_, cancel_, "GetBucketTagging", [&] {
        ++calls;
        return ApiError::make(ErrorKind::PERMANENT, 403, "AccessDenied", "Access Denied");
    });

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(result.kind, ErrorKind::PERMANENT);
    EXPECT_EQ(result.code, "AccessDenied");
}

TEST_F(RetryTestBase, ExhaustionReportsMaxRetriesExceeded) {
    int calls = 0;
    ApiError result = executeWithRetry(policy_, cancel_, "ListObjectsV2", [&] {
        ++calls;
        return ApiError::make(ErrorKind::TRANSIENT, 500, "InternalError", "We encountered an internal error.");
    });

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(result.kind, ErrorKind::TRANSIENT);
    EXPECT_EQ(result.message.rfind("max retries exceeded: ", 0), 0u) << result.message;
    EXPECT_NE(result.message.find("InternalError"), std::string::npos);
}

TEST_F(RetryTestBase, BackoffDoublesPerAttempt) {
    RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(1000);

    EXPECT_EQ(policy.delayFor(0).count(), 1000);
    EXPECT_EQ(policy.delayFor(1).count(), 2000);
    EXPECT_EQ(policy.delayFor(2).count(), 4000);
}

TEST_F(RetryTestBase, CancellationInterruptsBackoffSleep) {
    policy_.base_delay = std::chrono::milliseconds(10000);
    std::thread canceller([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel_.cancel();
    });

    int calls = 0;
    auto start = std::chrono::steady_clock::now();
    ApiError result = executeWithRetry(policy_, cancel_, "ListBuckets", [&] {
        ++calls;
        return ApiError::make(ErrorKind::TRANSIENT, 503, "ServiceUnavailable", "Service Unavailable");
    });
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(result.cancelled());
    EXPECT_EQ(calls, 1);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(RetryTestBase, CancelledTokenNeverInvokesOperation) {
    cancel_.cancel();
    int calls = 0;
    ApiError result = executeWithRetry(policy_, cancel_, "ListBuckets", [&] {
        ++calls;
        return ApiError::success();
    });

    EXPECT_TRUE(result.cancelled());
    EXPECT_EQ(calls, 0);
}

TEST_F(RetryTestBase, ExpiredDeadlineReportsDeadlineExceeded) {
    auto token = Common::CancelToken::withTimeout(std::chrono::milliseconds(1));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    ApiError result = executeWithRetry(policy_, token, "ListBuckets", [] { return ApiError::success(); });

    EXPECT_TRUE(result.cancelled());
    EXPECT_EQ(result.message, "context deadline exceeded");
}

TEST_F(RetryTestBase, RetryableSignatureContract) {
    EXPECT_TRUE(isRetryableSignature("RequestLimitExceeded", "", 400));
    EXPECT_TRUE(isRetryableSignature("Throttling", "Rate exceeded", 400));
    EXPECT_TRUE(isRetryableSignature("", "upstream returned 503", 0));
    EXPECT_TRUE(isRetryableSignature("Whatever", "", 502));
    EXPECT_TRUE(isRetryableSignature("", "", 429));

    EXPECT_FALSE(isRetryableSignature("AccessDenied", "Access Denied", 403));
    EXPECT_FALSE(isRetryableSignature("NoSuchBucket", "The specified bucket does not exist", 404));

    EXPECT_FALSE(defaultRetryable(ApiError::make(ErrorKind::CANCELLED, 0, "Cancelled", "context canceled")));
    EXPECT_EQ(classifyError("SlowDown", "", 503), ErrorKind::TRANSIENT);
    EXPECT_EQ(classifyError("InvalidBucketName", "", 400), ErrorKind::PERMANENT);
}

TEST_F(RetryTestBase, OperationErrorHintsContract) {
    EXPECT_EQ(formatOperationError("GetBucketTagging", "logs", ApiError::make(ErrorKind::PERMANENT, 403, "AccessDenied", "Access Denied")),
              "GetBucketTagging failed for logs: Access Denied - check IAM permissions");
    EXPECT_EQ(formatOperationError("GetBucketLocation", "gone", ApiError::make(ErrorKind::PERMANENT, 404, "NoSuchBucket", "")),
              "GetBucketLocation failed for gone: Bucket does not exist or is in a different region");
    EXPECT_EQ(formatOperationError("ListObjectsV2", "busy", ApiError::make(ErrorKind::TRANSIENT, 503, "SlowDown", "")),
              "ListObjectsV2 failed for busy: Rate limit exceeded - consider reducing --concurrency");
    EXPECT_EQ(formatOperationError("GetBucketVersioning", "b", ApiError::make(ErrorKind::PERMANENT, 400, "InvalidRequest", "bad")),
              "GetBucketVersioning failed for b: InvalidRequest: bad");
}
