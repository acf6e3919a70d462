#pragma once
#include <array>
#include <optional>
#include <cstdint>
#include <QMetaType>
#include <opencv2/core.hpp>

// 카메라에서 전달되는 한 프레임 (불변)
struct Frame {
	cv::Mat		image;				// BGR
	qint64		tsMs = 0;			// 단조 시간(ms)
	uint64_t	seq  = 0;			// 캡처 시퀀스 번호

	bool empty() const { return image.empty(); }
};

// 얼굴 디스크립터: 검증에 필요한 값만 노출
struct FaceDet {
	cv::Rect box;
	std::array<cv::Point2f, 5> lmk;				// leftEye, rightEye, nose, mouthL, mouthR
	float score = 0.0f;							// 검출 스코어
	std::optional<float> captureQuality;		// 샤프니스 기반 캡처 품질 [0,1], 없으면 검증 실패
};

// 분석기를 통과한 후보 (얼굴 + 원본 프레임 + 품질)
struct FaceCandidate {
	FaceDet face;
	Frame	image;
	float	quality = 0.0f;			// [0,1]
};

// 분석 결과 (FaceAnalyzer -> 오케스트레이터)
struct AnalysisResult {
	FaceDet face;
	float	quality = 0.0f;
};

// 수집기 결과
struct CollectResult {
	std::optional<FaceCandidate> winner;
	double progress = 0.0;			// [0,1]
};

Q_DECLARE_METATYPE(Frame)
