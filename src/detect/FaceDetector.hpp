#pragma once
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>  // cv::FaceDetectorYN
#include "include/types.hpp"			// FaceDet
#include "include/verify_params.hpp"

// YuNet/UltraFace 등 어떤 백엔드든 래핑 가능하도록 최소 인터페이스만 둠
class IFaceDetector {
public:
	virtual ~IFaceDetector() = default;

	// 얼굴이 없거나 백엔드 오류면 nullopt
	virtual std::optional<FaceDet> detectBest(const cv::Mat& bgr) const = 0;
};

struct DetectorParams {
	int   inputW   = 320;
	int   inputH   = 240;
	float scoreThr = 0.6f;
	float nmsThr   = 0.3f;
	int   topK     = 500;
	double sharpnessRefVar = verify::SHARPNESS_REF_VAR;	// 이 분산이면 captureQuality = 1
};

class FaceDetector : public IFaceDetector {
	public:
		FaceDetector() = default;
		~FaceDetector() override = default;

		// YuNet 초기화 (modelPath 필수)
		bool init(const std::string& modelPath,
				  const DetectorParams& params = {},
				  int backend = cv::dnn::DNN_BACKEND_OPENCV,
				  int target  = cv::dnn::DNN_TARGET_CPU);

		bool isReady() const { return ready_; }

		// 랭킹 규칙(중앙+큰 얼굴 선호)으로 1개만 선택, captureQuality 채움
		std::optional<FaceDet> detectBest(const cv::Mat& bgr) const override;

		// 프레임에서 전체 후보 반환 (원본 좌표계)
		std::vector<FaceDet> detectAll(const cv::Mat& bgr) const;

		// 얼굴 영역 Laplacian 분산 / refVar, [0,1] 클램프. 영역이 비면 nullopt
		static std::optional<float> sharpnessScore(const cv::Mat& bgr, const cv::Rect& box, double refVar);

		// YuNet 출력 파서 (score는 맨 끝(14), lmk는 4~13)
		static std::vector<FaceDet> parseYuNet(const cv::Mat& dets, float scoreThresh);

	private:
		bool ready_ = false;
		DetectorParams p_;
		int backend_  = cv::dnn::DNN_BACKEND_OPENCV;
		int target_   = cv::dnn::DNN_TARGET_CPU;

		std::string modelPath_;
		cv::Ptr<cv::FaceDetectorYN> yunet_;		// Yunet 핸들
		mutable cv::Size yunet_InputSize_{0, 0};  // setInputSize cache
};
