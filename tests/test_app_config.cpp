/**
 * @file test_app_config.cpp
 * @brief JSON configuration parsing
 */

#include <gtest/gtest.h>
#include <QTemporaryFile>
#include <stdexcept>
#include "config/AppConfig.hpp"

using nlohmann::json;

TEST(AppConfigTest, EmptyObjectGivesDefaults) {
    AppConfig c = AppConfig::fromJson(json::object());

    EXPECT_EQ(c.backendUrl, DEFAULT_BACKEND_URL);
    EXPECT_EQ(c.verifyTimeoutMs, 0);
    EXPECT_EQ(c.embeddingDim, 512);
    EXPECT_EQ(c.collector.windowMs, 800);
    EXPECT_FLOAT_EQ(c.collector.highWaterMark, 0.9f);
    EXPECT_FLOAT_EQ(c.validation.maxRollDeg, 15.0f);
    EXPECT_DOUBLE_EQ(c.validation.minBrightness, 0.25);
    EXPECT_DOUBLE_EQ(c.detector.sharpnessRefVar, 300.0);
    EXPECT_DOUBLE_EQ(c.validation.minFaceFraction, 0.0);
    EXPECT_EQ(c.camera.index, 0);
    EXPECT_TRUE(c.camera.device.empty());
}

TEST(AppConfigTest, OverridesAreApplied) {
    json j = {
        {"backendUrl", "https://auth.example.com"},
        {"verifyTimeoutMs", 5000},
        {"camera", {{"device", "/dev/video2"}, {"width", 1280}, {"height", 720}}},
        {"collector", {{"windowMs", 1200}, {"highWaterMark", 0.95}}},
        {"validation", {{"maxYawDeg", 20.0}, {"minSharpness", 0.3}, {"sharpnessRefVar", 500.0},
                        {"minFaceFraction", 0.2}}},
        {"detector", {{"scoreThreshold", 0.7}, {"topK", 100}}},
        {"somethingElse", true}
    };
    AppConfig c = AppConfig::fromJson(j);

    EXPECT_EQ(c.backendUrl, "https://auth.example.com");
    EXPECT_EQ(c.verifyTimeoutMs, 5000);
    EXPECT_EQ(c.camera.device, "/dev/video2");
    EXPECT_EQ(c.camera.width, 1280);
    EXPECT_EQ(c.camera.height, 720);
    EXPECT_EQ(c.collector.windowMs, 1200);
    EXPECT_FLOAT_EQ(c.collector.highWaterMark, 0.95f);
    EXPECT_FLOAT_EQ(c.validation.maxYawDeg, 20.0f);
    EXPECT_FLOAT_EQ(c.validation.minSharpness, 0.3f);
    EXPECT_FLOAT_EQ(c.validation.maxRollDeg, 15.0f);
    EXPECT_DOUBLE_EQ(c.detector.sharpnessRefVar, 500.0);
    EXPECT_DOUBLE_EQ(c.validation.minFaceFraction, 0.2);
    EXPECT_FLOAT_EQ(c.detector.scoreThr, 0.7f);
    EXPECT_EQ(c.detector.topK, 100);
}

TEST(AppConfigTest, NegativeTimeoutMeansNone) {
    AppConfig c = AppConfig::fromJson({{"verifyTimeoutMs", -1}});
    EXPECT_EQ(c.verifyTimeoutMs, 0);
}

TEST(AppConfigTest, RejectsBadShapes) {
    EXPECT_THROW(AppConfig::fromJson(json::array()), std::runtime_error);
    EXPECT_THROW(AppConfig::fromJson({{"camera", 3}}), std::runtime_error);
    EXPECT_THROW(AppConfig::fromJson({{"verifyTimeoutMs", "soon"}}), std::runtime_error);
    EXPECT_THROW(AppConfig::fromJson({{"collector", {{"windowMs", 0}}}}), std::runtime_error);
    EXPECT_THROW(AppConfig::fromJson({{"embeddingDim", 0}}), std::runtime_error);
    EXPECT_THROW(AppConfig::fromJson({{"validation", {{"minFaceFraction", 1.5}}}}), std::runtime_error);
}

TEST(AppConfigTest, LoadFromFile) {
    QTemporaryFile f;
    ASSERT_TRUE(f.open());
    f.write(R"({"backendUrl":"http://10.0.0.5:8000","collector":{"windowMs":600}})");
    f.flush();

    AppConfig c = AppConfig::load(f.fileName().toStdString());
    EXPECT_EQ(c.backendUrl, "http://10.0.0.5:8000");
    EXPECT_EQ(c.collector.windowMs, 600);
}

TEST(AppConfigTest, LoadFailures) {
    EXPECT_THROW(AppConfig::load("/nonexistent/faceVerifier.json"), std::runtime_error);

    QTemporaryFile f;
    ASSERT_TRUE(f.open());
    f.write("{ not json");
    f.flush();
    EXPECT_THROW(AppConfig::load(f.fileName().toStdString()), std::runtime_error);
}

TEST(AppConfigTest, CameraCaptureOptions) {
    AppConfig c = AppConfig::fromJson({{"camera", {{"fourcc", "MJPG"}, {"v4l2", false}, {"maxOpenAttempts", 3}}}});
    EXPECT_EQ(c.camera.fourcc, "MJPG");
    EXPECT_FALSE(c.camera.v4l2);
    EXPECT_EQ(c.camera.maxOpenAttempts, 3);

    EXPECT_THROW(AppConfig::fromJson({{"camera", {{"fourcc", "MJPEG"}}}}), std::runtime_error);
}
