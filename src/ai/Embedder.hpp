#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include "ai/Embedding.hpp"
#include "include/verify_params.hpp"

// NCHW blob -> 원시 출력. 실패 시 예외 (cv::Exception / AppError)
class IEmbeddingModel {
public:
	virtual ~IEmbeddingModel() = default;
	virtual cv::Mat forward(const cv::Mat& blob) const = 0;
};

// ONNX (cv::dnn). 로드 실패 시 생성자에서 AppError(ModelFailedToLoad)
class OnnxEmbeddingModel : public IEmbeddingModel {
public:
	explicit OnnxEmbeddingModel(const std::string& modelPath);
	cv::Mat forward(const cv::Mat& blob) const override;

private:
	mutable std::mutex mtx_;
	mutable cv::dnn::Net net_;
};

class Embedder {
public:
		struct Options {
				int inputSize = verify::ALIGN_SIZE;		// 112x112 입력
				int dim = verify::EMBEDDING_DIM;		// 출력 차원 (w600k_r50: 512)
				bool useRGB = true;						// 모델이 RGB 입력 모델
				bool flipTTA = true;					// 좌우반전 평균
				enum class Norm { ZeroToOne, MinusOneToOne } norm = Norm::MinusOneToOne;
		};

		Embedder(std::shared_ptr<const IEmbeddingModel> model, const Options& opt);

		// 정렬된 BGR 얼굴 -> 정규화된 임베딩
		// 실패: FacePreprocessingFailedRender (blob), ModelOutputMissing (추론/출력)
		Embedding embed(const cv::Mat& alignedBgr) const;

		const Options& options() const { return opt_; }

private:
		std::shared_ptr<const IEmbeddingModel> model_;
		Options opt_;

		cv::Mat preprocess(const cv::Mat& src) const;
		std::vector<float> runOnce(const cv::Mat& faceBgr) const;
};
