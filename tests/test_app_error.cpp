/**
 * @file test_app_error.cpp
 * @brief Error vocabulary and state value tests
 */

#include <gtest/gtest.h>
#include <string>
#include "error/AppError.hpp"
#include "include/states.hpp"

namespace {
const ErrorCode kAllCodes[] = {
    ErrorCode::CameraUnavailable, ErrorCode::CameraStartFailed,
    ErrorCode::ModelOutputMissing, ErrorCode::ModelFailedToLoad,
    ErrorCode::FaceValidationFailed, ErrorCode::ImageFailedToLoad,
    ErrorCode::FacePreprocessingFailedResize, ErrorCode::FacePreprocessingFailedRender,
    ErrorCode::EmployeeNotFound, ErrorCode::FaceConfidenceTooLow, ErrorCode::DbError,
    ErrorCode::NetworkUnavailable, ErrorCode::RequestTimedOut, ErrorCode::BadUrl,
    ErrorCode::InvalidResponse, ErrorCode::DecodingFailed,
    ErrorCode::Cancelled, ErrorCode::Unknown,
};
}

TEST(AppErrorTest, BackendStringsAreStable) {
    EXPECT_EQ(toBackendString(ErrorCode::EmployeeNotFound), "EMPLOYEE_NOT_FOUND");
    EXPECT_EQ(toBackendString(ErrorCode::FaceConfidenceTooLow), "FACE_CONFIDENCE_TOO_LOW");
    EXPECT_EQ(toBackendString(ErrorCode::ModelFailedToLoad), "MODEL_LOAD_FAILURE");
    EXPECT_EQ(toBackendString(ErrorCode::NetworkUnavailable), "NETWORK_UNAVAILABLE");
    EXPECT_EQ(toBackendString(ErrorCode::Unknown), "UNKNOWN");
}

TEST(AppErrorTest, EveryCodeMapsBackFromItsString) {
    for (ErrorCode c : kAllCodes) {
        if (c == ErrorCode::Cancelled) continue;
        EXPECT_EQ(fromBackend(toBackendString(c)), c) << toBackendString(c);
    }
}

TEST(AppErrorTest, BackendCannotProduceInternalCancel) {
    EXPECT_EQ(toBackendString(ErrorCode::Cancelled), "CANCELLED");
    EXPECT_EQ(fromBackend("CANCELLED"), ErrorCode::Unknown);
}

TEST(AppErrorTest, UnrecognizedBackendCodeIsUnknown) {
    EXPECT_EQ(fromBackend("SOMETHING_NEW"), ErrorCode::Unknown);
    EXPECT_EQ(fromBackend(""), ErrorCode::Unknown);
    EXPECT_EQ(fromBackend("employee_not_found"), ErrorCode::Unknown);
}

TEST(AppErrorTest, EveryCodeHasUserMessage) {
    for (ErrorCode c : kAllCodes) {
        EXPECT_FALSE(userMessage(c).empty()) << toBackendString(c);
    }
}

TEST(AppErrorTest, CarriesCodeAndDebugMessage) {
    AppError e(ErrorCode::DecodingFailed, "bad json");
    EXPECT_EQ(e.code(), ErrorCode::DecodingFailed);
    EXPECT_EQ(e.debugMessage(), "bad json");
    EXPECT_NE(std::string(e.what()).find("DECODING_FAILED"), std::string::npos);

    try {
        throw AppError(ErrorCode::BadUrl);
    } catch (const std::runtime_error& re) {
        EXPECT_STREQ(re.what(), "BAD_URL");
    }
}

TEST(VerificationStateTest, EqualityConsidersPayload) {
    EXPECT_EQ(VerificationState::detecting(), VerificationState::detecting());
    EXPECT_EQ(VerificationState::matched("A"), VerificationState::matched("A"));
    EXPECT_NE(VerificationState::matched("A"), VerificationState::matched("B"));
    EXPECT_EQ(VerificationState::error(ErrorCode::DbError), VerificationState::error(ErrorCode::DbError));
    EXPECT_NE(VerificationState::error(ErrorCode::DbError), VerificationState::error(ErrorCode::BadUrl));
    EXPECT_NE(VerificationState::processing(), VerificationState::detecting());
}

TEST(VerificationStateTest, ToStringNamesPayload) {
    EXPECT_EQ(VerificationState::matched("E1").toString(), QStringLiteral("MATCHED(E1)"));
    EXPECT_EQ(VerificationState::error(ErrorCode::DbError).toString(), QStringLiteral("ERROR(DB_ERROR)"));
    EXPECT_EQ(VerificationState::timedOut().toString(), QStringLiteral("TIMED_OUT"));
}
