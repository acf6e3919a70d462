#include "FaceValidator.hpp"
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include <QtCore/QDebug>

namespace {
// 경계값 근처 부동소수 오차로 인한 오탐 방지
constexpr double kAngleEpsilon = 0.0002;
constexpr double kRadToDeg = 180.0 / CV_PI;
}

const char* validationReasonName(ValidationResult::Reason r)
{
	switch (r) {
		case ValidationResult::Ok:               return "Ok";
		case ValidationResult::InvalidInput:     return "InvalidInput";
		case ValidationResult::RollTooHigh:      return "RollTooHigh";
		case ValidationResult::YawTooHigh:       return "YawTooHigh";
		case ValidationResult::TooSmall:         return "TooSmall";
		case ValidationResult::TooDark:          return "TooDark";
		case ValidationResult::TooBright:        return "TooBright";
		case ValidationResult::NoCaptureQuality: return "NoCaptureQuality";
		case ValidationResult::TooBlur:          return "TooBlur";
	}
	return "?";
}

void FaceValidator::estimateRollAndYaw(const FaceDet& face, double& rollDeg, double& yawProxy)
{
	const cv::Point2f& le   = face.lmk[0];
	const cv::Point2f& re   = face.lmk[1];
	const cv::Point2f& nose = face.lmk[2];

	rollDeg = std::atan2(static_cast<double>(re.y - le.y),
						 static_cast<double>(re.x - le.x)) * kRadToDeg;

	const double eyeMidX = 0.5 * (le.x + re.x);
	yawProxy = (face.box.width > 0)
		? (nose.x - eyeMidX) / static_cast<double>(face.box.width) * 100.0
		: 0.0;
}

double FaceValidator::estimateBrightness(const cv::Mat& bgr, const cv::Rect& box)
{
	if (bgr.empty()) return 0.0;

	cv::Rect roi = box & cv::Rect(0, 0, bgr.cols, bgr.rows);
	if (roi.empty()) roi = cv::Rect(0, 0, bgr.cols, bgr.rows);

	cv::Mat gray;
	if (bgr.channels() == 3) cv::cvtColor(bgr(roi), gray, cv::COLOR_BGR2GRAY);
	else if (bgr.channels() == 4) cv::cvtColor(bgr(roi), gray, cv::COLOR_BGRA2GRAY);
	else gray = bgr(roi);

	return cv::mean(gray)[0] / 255.0;
}

float FaceValidator::poseFactor(double rollDeg, double yawProxy) const
{
	const double r = (p_.maxRollDeg > 0) ? std::abs(rollDeg)  / p_.maxRollDeg : 0.0;
	const double y = (p_.maxYawDeg  > 0) ? std::abs(yawProxy) / p_.maxYawDeg  : 0.0;
	return static_cast<float>(std::clamp(1.0 - 0.5 * std::max(r, y), 0.0, 1.0));
}

ValidationResult FaceValidator::validate(const FaceDet& face, const cv::Mat& bgr) const
{
	ValidationResult vr;

	if (bgr.empty() || face.box.width <= 0 || face.box.height <= 0) {
		vr.reason = ValidationResult::InvalidInput;
		return vr;
	}

	// === 1) Roll / Yaw ===
	estimateRollAndYaw(face, vr.rollDeg, vr.yawProxy);

	if (std::abs(vr.rollDeg) > p_.maxRollDeg + kAngleEpsilon) {
		vr.reason = ValidationResult::RollTooHigh;
		qDebug() << "[Validator:FAIL]" << validationReasonName(vr.reason) << vr.rollDeg << ">" << p_.maxRollDeg;
		return vr;
	}
	if (std::abs(vr.yawProxy) > p_.maxYawDeg + kAngleEpsilon) {
		vr.reason = ValidationResult::YawTooHigh;
		qDebug() << "[Validator:FAIL]" << validationReasonName(vr.reason) << vr.yawProxy << ">" << p_.maxYawDeg;
		return vr;
	}

	// === 2) 얼굴 크기 (프레임 대비) ===
	vr.faceFraction = std::min(face.box.width  / static_cast<double>(bgr.cols),
							   face.box.height / static_cast<double>(bgr.rows));
	if (p_.minFaceFraction > 0.0 && vr.faceFraction < p_.minFaceFraction) {
		vr.reason = ValidationResult::TooSmall;
		qDebug() << "[Validator:FAIL]" << validationReasonName(vr.reason) << vr.faceFraction << "<" << p_.minFaceFraction;
		return vr;
	}

	// === 3) 밝기 ===
	vr.brightness = estimateBrightness(bgr, face.box);
	if (vr.brightness < p_.minBrightness) {
		vr.reason = ValidationResult::TooDark;
		qDebug() << "[Validator:FAIL]" << validationReasonName(vr.reason) << vr.brightness;
		return vr;
	}
	if (vr.brightness > p_.maxBrightness) {
		vr.reason = ValidationResult::TooBright;
		qDebug() << "[Validator:FAIL]" << validationReasonName(vr.reason) << vr.brightness;
		return vr;
	}

	// === 4) 캡처 품질 (샤프니스) ===
	if (!face.captureQuality) {
		vr.reason = ValidationResult::NoCaptureQuality;
		qDebug() << "[Validator:FAIL]" << validationReasonName(vr.reason);
		return vr;
	}
	vr.sharpness = *face.captureQuality;
	if (vr.sharpness < p_.minSharpness) {
		vr.reason = ValidationResult::TooBlur;
		qDebug() << "[Validator:FAIL]" << validationReasonName(vr.reason) << vr.sharpness << "<" << p_.minSharpness;
		return vr;
	}

	vr.pass = true;
	return vr;
}
