#include <gtest/gtest.h>

#include <string>

#include "client/tracking_client.h"
#include "errors.h"

using runscope::FailureKind;
using runscope::client::ClassifyHttpStatus;
using runscope::client::ClassifyTransportError;

TEST(ErrorClassificationTest, SuccessStatusesAreNotFailures) {
    EXPECT_FALSE(ClassifyHttpStatus(200).has_value());
    EXPECT_FALSE(ClassifyHttpStatus(204).has_value());
    EXPECT_FALSE(ClassifyHttpStatus(304).has_value());
}

TEST(ErrorClassificationTest, HttpStatusKinds) {
    EXPECT_EQ(ClassifyHttpStatus(401).value(), FailureKind::AUTHENTICATION);
    EXPECT_EQ(ClassifyHttpStatus(403).value(), FailureKind::AUTHENTICATION);
    EXPECT_EQ(ClassifyHttpStatus(404).value(), FailureKind::NOT_FOUND);
    EXPECT_EQ(ClassifyHttpStatus(408).value(), FailureKind::TIMEOUT);
    EXPECT_EQ(ClassifyHttpStatus(429).value(), FailureKind::RATE_LIMITED);
    EXPECT_EQ(ClassifyHttpStatus(500).value(), FailureKind::SERVER);
    EXPECT_EQ(ClassifyHttpStatus(503).value(), FailureKind::SERVER);
    EXPECT_EQ(ClassifyHttpStatus(400).value(), FailureKind::INVALID_REQUEST);
    EXPECT_EQ(ClassifyHttpStatus(422).value(), FailureKind::INVALID_REQUEST);
}

TEST(ErrorClassificationTest, TransportErrors) {
    EXPECT_EQ(ClassifyTransportError(httplib::Error::Connection), FailureKind::CONNECTION);
    EXPECT_EQ(ClassifyTransportError(httplib::Error::ConnectionTimeout), FailureKind::TIMEOUT);
    EXPECT_EQ(ClassifyTransportError(httplib::Error::Read), FailureKind::TIMEOUT);
    EXPECT_EQ(ClassifyTransportError(httplib::Error::SSLConnection), FailureKind::CONNECTION);
}

TEST(ErrorClassificationTest, TransientKinds) {
    EXPECT_TRUE(runscope::IsTransient(FailureKind::CONNECTION));
    EXPECT_TRUE(runscope::IsTransient(FailureKind::TIMEOUT));
    EXPECT_TRUE(runscope::IsTransient(FailureKind::RATE_LIMITED));
    EXPECT_TRUE(runscope::IsTransient(FailureKind::SERVER));
    EXPECT_FALSE(runscope::IsTransient(FailureKind::AUTHENTICATION));
    EXPECT_FALSE(runscope::IsTransient(FailureKind::NOT_FOUND));
    EXPECT_FALSE(runscope::IsTransient(FailureKind::INVALID_REQUEST));
}

TEST(ErrorClassificationTest, ServiceErrorCarriesStableCode) {
    runscope::ServiceError err("tracking", FailureKind::RATE_LIMITED, "HTTP 429");
    EXPECT_STREQ(err.code(), runscope::obs::kErrServiceRateLimited);
    EXPECT_TRUE(err.transient());
    EXPECT_EQ(err.service(), "tracking");
    EXPECT_STREQ(runscope::FailureKindToString(err.kind()), "rate_limited");
}

TEST(ErrorClassificationTest, ExhaustionMessageNamesReason) {
    runscope::RetriesExhaustedError err("llm", 3, runscope::ExhaustionReason::MAX_ATTEMPTS,
                                        FailureKind::SERVER, "HTTP 502");
    EXPECT_EQ(std::string(err.what()), "llm: retries exhausted after 3 attempt(s): HTTP 502");
    EXPECT_STREQ(err.code(), runscope::obs::kErrRetriesExhausted);
}

TEST(ErrorClassificationTest, ValidateName) {
    EXPECT_NO_THROW(runscope::client::ValidateName("my-team", "Entity"));
    EXPECT_THROW(runscope::client::ValidateName("", "Entity"), runscope::ValidationError);
    EXPECT_THROW(runscope::client::ValidateName("   ", "Project"), runscope::ValidationError);
    EXPECT_THROW(runscope::client::ValidateName(std::string(101, 'x'), "Project"), runscope::ValidationError);
    EXPECT_NO_THROW(runscope::client::ValidateName(std::string(100, 'x'), "Project"));
}
