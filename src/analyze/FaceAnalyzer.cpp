#include "FaceAnalyzer.hpp"
#include <QtCore/QDebug>

FaceAnalyzer::FaceAnalyzer(std::shared_ptr<const IFaceDetector> detector, FaceValidator validator)
	: detector_(std::move(detector)), validator_(std::move(validator))
{
}

std::optional<AnalysisResult> FaceAnalyzer::analyze(const Frame& frame) const
{
	if (!detector_ || frame.empty()) return std::nullopt;

	std::optional<FaceDet> face;
	try {
		face = detector_->detectBest(frame.image);
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceAnalyzer] detector error:" << e.what();
		return std::nullopt;
	} catch (const std::exception& e) {
		qWarning() << "[FaceAnalyzer] detector error:" << e.what();
		return std::nullopt;
	}
	if (!face) return std::nullopt;

	ValidationResult vr;
	try {
		vr = validator_.validate(*face, frame.image);
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceAnalyzer] validator error:" << e.what();
		return std::nullopt;
	}
	if (!vr.pass) return std::nullopt;

	AnalysisResult r;
	r.face    = *face;
	r.quality = vr.sharpness * validator_.poseFactor(vr.rollDeg, vr.yawProxy);
	return r;
}
