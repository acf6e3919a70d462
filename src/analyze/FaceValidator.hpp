#pragma once
#include <opencv2/core.hpp>
#include "include/types.hpp"
#include "include/verify_params.hpp"

struct ValidationResult {
	enum Reason {
		Ok = 0,
		InvalidInput,
		RollTooHigh,
		YawTooHigh,
		TooSmall,
		TooDark,
		TooBright,
		NoCaptureQuality,
		TooBlur
	};

	bool pass = false;
	Reason reason = Reason::Ok;

	double rollDeg    = 0.0;
	double yawProxy   = 0.0;	// (noseX - eyeMidX) / boxW * 100
	double faceFraction = 0.0;	// min(boxW/W, boxH/H)
	double brightness = 0.0;	// [0,1]
	float  sharpness  = 0.0f;
};

const char* validationReasonName(ValidationResult::Reason r);

// 검출된 얼굴이 임베딩할 가치가 있는지 판단 (각도/밝기/샤프니스). 상태 없음.
class FaceValidator {
	public:
		explicit FaceValidator(const ValidationParams& p = {}) : p_(p) {}

		ValidationResult validate(const FaceDet& face, const cv::Mat& bgr) const;

		// 포즈 보정 계수: 1 - 0.5 * max(|roll|/maxRoll, |yaw|/maxYaw), [0,1]
		float poseFactor(double rollDeg, double yawProxy) const;

		const ValidationParams& params() const { return p_; }

		// 눈-눈 선분 각도(도)와 코의 수평 오프셋(박스 폭 대비 x100)
		static void estimateRollAndYaw(const FaceDet& face, double& rollDeg, double& yawProxy);

		// 얼굴 영역 회색조 평균 / 255. 박스가 프레임 밖이면 프레임 전체
		static double estimateBrightness(const cv::Mat& bgr, const cv::Rect& box);

	private:
		ValidationParams p_;
};
