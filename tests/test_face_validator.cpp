/**
 * @file test_face_validator.cpp
 * @brief Pose / brightness / sharpness validation rules
 */

#include <gtest/gtest.h>
#include <cmath>
#include "analyze/FaceValidator.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

constexpr double kPi = 3.14159265358979323846;

cv::Mat grayFrame(int level, int w = 200, int h = 200)
{
    return cv::Mat(h, w, CV_8UC3, cv::Scalar(level, level, level));
}

const cv::Rect kBox(50, 50, 100, 100);

} // namespace

TEST(FaceValidatorTest, FrontalWellLitSharpFacePasses) {
    FaceValidator v;
    auto r = v.validate(makeFace(kBox, 0.8f), grayFrame(128));

    EXPECT_TRUE(r.pass) << validationReasonName(r.reason);
    EXPECT_NEAR(r.rollDeg, 0.0, 1e-6);
    EXPECT_NEAR(r.yawProxy, 0.0, 1e-6);
    EXPECT_NEAR(r.brightness, 128.0 / 255.0, 1e-6);
    EXPECT_FLOAT_EQ(r.sharpness, 0.8f);
}

TEST(FaceValidatorTest, RejectsExcessiveRollEitherWay) {
    FaceValidator v;
    for (double deg : {20.0, -20.0}) {
        FaceDet f = makeFace(kBox);
        const float dx = f.lmk[1].x - f.lmk[0].x;
        f.lmk[1].y = f.lmk[0].y + dx * static_cast<float>(std::tan(deg * kPi / 180.0));

        auto r = v.validate(f, grayFrame(128));
        EXPECT_FALSE(r.pass);
        EXPECT_EQ(r.reason, ValidationResult::RollTooHigh);
        EXPECT_NEAR(r.rollDeg, deg, 1e-3);
    }
}

TEST(FaceValidatorTest, ModerateRollPasses) {
    FaceValidator v;
    FaceDet f = makeFace(kBox);
    const float dx = f.lmk[1].x - f.lmk[0].x;
    f.lmk[1].y = f.lmk[0].y + dx * static_cast<float>(std::tan(10.0 * kPi / 180.0));

    EXPECT_TRUE(v.validate(f, grayFrame(128)).pass);
}

TEST(FaceValidatorTest, RejectsNoseFarFromEyeMidline) {
    FaceValidator v;
    FaceDet f = makeFace(kBox);
    f.lmk[2].x += 20.0f;		// 20% of box width -> yaw proxy 20

    auto r = v.validate(f, grayFrame(128));
    EXPECT_FALSE(r.pass);
    EXPECT_EQ(r.reason, ValidationResult::YawTooHigh);
    EXPECT_NEAR(r.yawProxy, 20.0, 1e-3);

    f = makeFace(kBox);
    f.lmk[2].x -= 10.0f;
    auto ok = v.validate(f, grayFrame(128));
    EXPECT_TRUE(ok.pass);
    EXPECT_NEAR(ok.yawProxy, -10.0, 1e-3);
}

TEST(FaceValidatorTest, RejectsDarkAndBrightFaces) {
    FaceValidator v;

    auto dark = v.validate(makeFace(kBox), grayFrame(30));
    EXPECT_FALSE(dark.pass);
    EXPECT_EQ(dark.reason, ValidationResult::TooDark);

    auto bright = v.validate(makeFace(kBox), grayFrame(240));
    EXPECT_FALSE(bright.pass);
    EXPECT_EQ(bright.reason, ValidationResult::TooBright);
}

TEST(FaceValidatorTest, BrightnessUsesFaceRegionOnly) {
    cv::Mat img = grayFrame(20);
    img(kBox).setTo(cv::Scalar(128, 128, 128));

    EXPECT_NEAR(FaceValidator::estimateBrightness(img, kBox), 128.0 / 255.0, 1e-6);
    EXPECT_TRUE(FaceValidator().validate(makeFace(kBox), img).pass);
}

TEST(FaceValidatorTest, BrightnessFallsBackToWholeFrame) {
    cv::Mat img = grayFrame(100);
    EXPECT_NEAR(FaceValidator::estimateBrightness(img, cv::Rect(500, 500, 50, 50)), 100.0 / 255.0, 1e-6);
}

TEST(FaceValidatorTest, RequiresCaptureQuality) {
    FaceValidator v;
    FaceDet f = makeFace(kBox);
    f.captureQuality.reset();

    auto r = v.validate(f, grayFrame(128));
    EXPECT_FALSE(r.pass);
    EXPECT_EQ(r.reason, ValidationResult::NoCaptureQuality);
}

TEST(FaceValidatorTest, SharpnessThreshold) {
    FaceValidator v;

    auto blur = v.validate(makeFace(kBox, 0.1f), grayFrame(128));
    EXPECT_FALSE(blur.pass);
    EXPECT_EQ(blur.reason, ValidationResult::TooBlur);

    EXPECT_TRUE(v.validate(makeFace(kBox, 0.2f), grayFrame(128)).pass);
}

TEST(FaceValidatorTest, RejectsEmptyFrame) {
    auto r = FaceValidator().validate(makeFace(kBox), cv::Mat());
    EXPECT_FALSE(r.pass);
    EXPECT_EQ(r.reason, ValidationResult::InvalidInput);
}

TEST(FaceValidatorTest, ThresholdsAreConfigurable) {
    ValidationParams p;
    p.maxRollDeg = 30.0f;
    p.minBrightness = 0.05;
    FaceValidator v(p);

    FaceDet f = makeFace(kBox);
    const float dx = f.lmk[1].x - f.lmk[0].x;
    f.lmk[1].y = f.lmk[0].y + dx * static_cast<float>(std::tan(20.0 * kPi / 180.0));

    EXPECT_TRUE(v.validate(f, grayFrame(30)).pass);
}

TEST(FaceValidatorTest, PoseFactor) {
    FaceValidator v;
    EXPECT_FLOAT_EQ(v.poseFactor(0.0, 0.0), 1.0f);
    EXPECT_FLOAT_EQ(v.poseFactor(0.0, 15.0), 0.5f);
    EXPECT_FLOAT_EQ(v.poseFactor(-7.5, 3.0), 0.75f);
    EXPECT_FLOAT_EQ(v.poseFactor(60.0, 0.0), 0.0f);
}

TEST(FaceValidatorTest, FaceSizeCheckIsOffByDefault) {
    FaceValidator v;
    auto r = v.validate(makeFace({90, 90, 20, 20}), grayFrame(128));
    EXPECT_TRUE(r.pass) << validationReasonName(r.reason);
    EXPECT_NEAR(r.faceFraction, 0.1, 1e-9);
}

TEST(FaceValidatorTest, RejectsSmallFaceWhenConfigured) {
    ValidationParams p;
    p.minFaceFraction = 0.20;
    FaceValidator v(p);

    auto small = v.validate(makeFace({90, 90, 30, 30}), grayFrame(128));
    EXPECT_FALSE(small.pass);
    EXPECT_EQ(small.reason, ValidationResult::TooSmall);
    EXPECT_STREQ(validationReasonName(small.reason), "TooSmall");

    // 200x200 프레임에서 100 px -> 0.5
    EXPECT_TRUE(v.validate(makeFace(kBox), grayFrame(128)).pass);

    // 짧은 변 기준
    auto narrow = v.validate(makeFace({50, 20, 30, 150}), grayFrame(128));
    EXPECT_EQ(narrow.reason, ValidationResult::TooSmall);
}
