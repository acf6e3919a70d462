#pragma once
#include <memory>
#include <opencv2/core.hpp>
#include "ai/Embedding.hpp"
#include "analyze/FaceAnalyzer.hpp"
#include "process/FaceProcessor.hpp"

// 정지 이미지 -> 임베딩 (등록용 사진)
class FaceEmbeddingExtractor {
public:
	FaceEmbeddingExtractor(std::shared_ptr<const IFaceAnalyzer> analyzer,
						   std::shared_ptr<const IFaceProcessor> processor);

	// 쓸 만한 얼굴이 없으면 AppError(FaceValidationFailed)
	Embedding embedding(const cv::Mat& bgr) const;

	// 파일 로드 실패 시 AppError(ImageFailedToLoad)
	Embedding embeddingFromFile(const std::string& path) const;

private:
	std::shared_ptr<const IFaceAnalyzer> analyzer_;
	std::shared_ptr<const IFaceProcessor> processor_;
};
