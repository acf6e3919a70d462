#pragma once
#include <memory>
#include "include/types.hpp"
#include "ai/Embedding.hpp"
#include "ai/Embedder.hpp"
#include "detect/LandmarkAligner.hpp"

// 채택된 (프레임, 얼굴) -> 정규화된 임베딩. 실패 시 AppError
class IFaceProcessor {
public:
	virtual ~IFaceProcessor() = default;
	virtual Embedding process(const Frame& frame, const FaceDet& face) const = 0;
};

class FaceProcessor : public IFaceProcessor {
public:
	explicit FaceProcessor(std::shared_ptr<const Embedder> embedder);

	// 5점 정렬 (실패 시 박스 크롭) -> Embedder
	Embedding process(const Frame& frame, const FaceDet& face) const override;

private:
	std::shared_ptr<const Embedder> embedder_;
	LandmarkAligner aligner_;
};
