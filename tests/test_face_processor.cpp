/**
 * @file test_face_processor.cpp
 * @brief Alignment + embedding with a fake inference model
 */

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include "process/FaceProcessor.hpp"
#include "detect/LandmarkAligner.hpp"
#include "test_helpers.hpp"

using namespace testutil;

namespace {

/**
 * @brief Returns a fixed-length row; counts forward() calls and checks the blob shape
 */
class FakeModel : public IEmbeddingModel {
public:
    explicit FakeModel(int outLen = 512) : outLen_(outLen) {}

    cv::Mat forward(const cv::Mat& blob) const override {
        calls.fetch_add(1);
        if (blob.dims == 4 && blob.size[1] == 3 && blob.size[2] == 112 && blob.size[3] == 112)
            shapeOk.store(true);
        if (throwCv) throw cv::Exception(cv::Error::StsError, "inference failed", "forward", __FILE__, __LINE__);
        return cv::Mat(1, outLen_, CV_32F, cv::Scalar(0.5f));
    }

    bool throwCv = false;
    mutable std::atomic<int> calls{0};
    mutable std::atomic<bool> shapeOk{false};

private:
    int outLen_;
};

Frame grayFrame()
{
    Frame f;
    f.image = cv::Mat(200, 200, CV_8UC3, cv::Scalar(128, 128, 128));
    f.seq = 7;
    return f;
}

FaceProcessor makeProcessor(std::shared_ptr<FakeModel> model, bool flipTTA = true)
{
    Embedder::Options opt;
    opt.flipTTA = flipTTA;
    return FaceProcessor(std::make_shared<Embedder>(model, opt));
}

} // namespace

TEST(FaceProcessorTest, ProducesUnitLengthEmbedding) {
    auto model = std::make_shared<FakeModel>();
    FaceProcessor p = makeProcessor(model);

    Embedding e = p.process(grayFrame(), makeFace({50, 50, 100, 100}));

    EXPECT_EQ(e.size(), 512u);
    EXPECT_NEAR(e.norm(), 1.0, 1e-5);
    EXPECT_EQ(model->calls.load(), 2);		// original + mirrored
    EXPECT_TRUE(model->shapeOk.load());
}

TEST(FaceProcessorTest, SingleForwardWithoutFlip) {
    auto model = std::make_shared<FakeModel>();
    FaceProcessor p = makeProcessor(model, false);

    p.process(grayFrame(), makeFace({50, 50, 100, 100}));
    EXPECT_EQ(model->calls.load(), 1);
}

TEST(FaceProcessorTest, WrongOutputLengthIsModelOutputMissing) {
    auto model = std::make_shared<FakeModel>(128);
    FaceProcessor p = makeProcessor(model);

    try {
        p.process(grayFrame(), makeFace({50, 50, 100, 100}));
        FAIL() << "expected AppError";
    } catch (const AppError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ModelOutputMissing);
    }
}

TEST(FaceProcessorTest, InferenceFailureIsModelOutputMissing) {
    auto model = std::make_shared<FakeModel>();
    model->throwCv = true;
    FaceProcessor p = makeProcessor(model);

    try {
        p.process(grayFrame(), makeFace({50, 50, 100, 100}));
        FAIL() << "expected AppError";
    } catch (const AppError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ModelOutputMissing);
    }
}

TEST(FaceProcessorTest, EmptyFrameIsPreprocessingFailure) {
    auto model = std::make_shared<FakeModel>();
    FaceProcessor p = makeProcessor(model);

    try {
        p.process(Frame{}, makeFace());
        FAIL() << "expected AppError";
    } catch (const AppError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FacePreprocessingFailedResize);
    }
    EXPECT_EQ(model->calls.load(), 0);
}

TEST(LandmarkAlignerTest, AlignsToTemplateSize) {
    LandmarkAligner a;
    cv::Mat img(200, 200, CV_8UC3, cv::Scalar(90, 90, 90));
    FaceDet f = makeFace({50, 50, 100, 100});

    cv::Mat out = a.alignBy5pts(img, f.lmk, cv::Size(112, 112));
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.size(), cv::Size(112, 112));
    EXPECT_EQ(out.type(), CV_8UC3);

    cv::Mat small = a.alignBy5pts(img, f.lmk, cv::Size(56, 56));
    EXPECT_EQ(small.size(), cv::Size(56, 56));

    EXPECT_TRUE(a.alignBy5pts(cv::Mat(), f.lmk, cv::Size(112, 112)).empty());
}

TEST(LandmarkAlignerTest, CropBoxClipsToFrame) {
    LandmarkAligner a;
    cv::Mat img(100, 100, CV_8UC3, cv::Scalar(10, 20, 30));

    cv::Mat out = a.cropBox(img, cv::Rect(80, 80, 50, 50), cv::Size(112, 112));
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.size(), cv::Size(112, 112));

    EXPECT_TRUE(a.cropBox(img, cv::Rect(300, 300, 20, 20), cv::Size(112, 112)).empty());
}
