#pragma once
#include <memory>
#include <optional>
#include "include/types.hpp"
#include "detect/FaceDetector.hpp"
#include "analyze/FaceValidator.hpp"

// 검출 + 검증을 한 번에: 쓸 만한 얼굴이 없으면 nullopt
class IFaceAnalyzer {
public:
	virtual ~IFaceAnalyzer() = default;
	virtual std::optional<AnalysisResult> analyze(const Frame& frame) const = 0;
};

class FaceAnalyzer : public IFaceAnalyzer {
public:
	FaceAnalyzer(std::shared_ptr<const IFaceDetector> detector, FaceValidator validator);

	// 검출기 예외/실패는 "후보 없음"으로 접음
	std::optional<AnalysisResult> analyze(const Frame& frame) const override;

private:
	std::shared_ptr<const IFaceDetector> detector_;
	FaceValidator validator_;
};
