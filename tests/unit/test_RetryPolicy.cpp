#include <gtest/gtest.h>
#include "storage/RetryPolicy.hpp"

using namespace std::chrono_literals;
using namespace wsync::storage;
using Kind = StorageError::Kind;

class RetryPolicyTest : public ::testing::Test {
protected:
    std::vector<std::chrono::milliseconds> sleeps;
    RetryPolicy policy;

    void SetUp() override {
        policy.sleeper = [this](const std::chrono::milliseconds d) { sleeps.push_back(d); };
    }
};

TEST_F(RetryPolicyTest, BackoffDoublesAndCaps) {
    policy.max_backoff = 1000ms;
    EXPECT_EQ(policy.backoffFor(1), 200ms);
    EXPECT_EQ(policy.backoffFor(2), 400ms);
    EXPECT_EQ(policy.backoffFor(3), 800ms);
    EXPECT_EQ(policy.backoffFor(4), 1000ms);
    EXPECT_EQ(policy.backoffFor(10), 1000ms);
}

TEST_F(RetryPolicyTest, TransientErrorsAreRetriedUntilSuccess) {
    int calls = 0;
    const int result = policy.run("op", [&] {
        if (++calls < 3) throw StorageError(Kind::Transient, "503");
        return 7;
    });
    EXPECT_EQ(result, 7);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps, (std::vector{200ms, 400ms}));
}

TEST_F(RetryPolicyTest, GivesUpAfterMaxAttempts) {
    int calls = 0;
    EXPECT_THROW(policy.run("op", [&] {
        ++calls;
        throw StorageError(Kind::Transient, "timeout");
    }), StorageError);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps.size(), 2u);
}

TEST_F(RetryPolicyTest, NonTransientErrorsSurfaceImmediately) {
    for (const auto kind : {Kind::NotFound, Kind::PermissionDenied, Kind::Configuration, Kind::Unknown}) {
        int calls = 0;
        try {
            policy.run("op", [&] {
                ++calls;
                throw StorageError(kind, "nope");
            });
            FAIL() << "expected a StorageError";
        } catch (const StorageError& e) {
            EXPECT_EQ(e.kind(), kind);
        }
        EXPECT_EQ(calls, 1);
    }
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RetryPolicyTest, OtherExceptionsAreNotRetried) {
    int calls = 0;
    EXPECT_THROW(policy.run("op", [&] {
        ++calls;
        throw std::logic_error("bug");
    }), std::logic_error);
    EXPECT_EQ(calls, 1);
}

TEST(StorageErrorTest, TransferErrorSummarizesFailures) {
    std::vector<std::string> failures;
    for (int i = 0; i < 7; ++i) failures.push_back("f" + std::to_string(i) + ".txt: boom");

    const TransferError err("uploadDirectory /w -> k", failures, 20);
    EXPECT_EQ(err.failures().size(), 7u);
    EXPECT_EQ(err.attempted(), 20u);
    EXPECT_EQ(err.kind(), Kind::Unknown);
    const std::string what = err.what();
    EXPECT_NE(what.find("7 of 20 transfers failed"), std::string::npos);
    EXPECT_NE(what.find("... and 2 more"), std::string::npos);
    EXPECT_EQ(to_string(Kind::PermissionDenied), "permission_denied");
}
