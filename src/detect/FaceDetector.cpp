#include "detect/FaceDetector.hpp"
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include <QtCore/QDebug>


bool FaceDetector::init(const std::string& modelPath,
						const DetectorParams& params,
						int backend, int target)
{
	modelPath_ = modelPath;
	p_ = params;
	backend_ = backend; target_ = target;

	try {
		yunet_ = cv::FaceDetectorYN::create(
				modelPath_, /*config=*/"", cv::Size(p_.inputW, p_.inputH),
				p_.scoreThr, p_.nmsThr, p_.topK, backend_, target_);
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceDetector] YuNet create failed:" << e.what();
		ready_ = false;
		return false;
	}

	ready_ = (yunet_ != nullptr);
	yunet_InputSize_ = cv::Size(0,0);			// 첫 프레임에서 갱신
	if (!ready_) {
		qWarning() << "[FaceDetector] YuNet not ready";
		return false;
	}

	qDebug() << "[FaceDetector] YuNet init Ok"
			 << "model=" << QString::fromStdString(modelPath_)
			 << "in="    << p_.inputW << "x" << p_.inputH
			 << "thr="   << p_.scoreThr << "/" << p_.nmsThr
			 << "topK="  << p_.topK << " backend=" << backend_
			 << "target=" << target_;

	return true;
}

std::vector<FaceDet> FaceDetector::parseYuNet(const cv::Mat& dets, float scoreThresh)
{
	std::vector<FaceDet> out;
	if (dets.empty() || dets.cols < 15) return out;

	for (int i = 0; i < dets.rows; ++i) {
		const float x = dets.at<float>(i, 0);
		const float y = dets.at<float>(i, 1);
		const float w = dets.at<float>(i, 2);
		const float h = dets.at<float>(i, 3);

		const float score = dets.at<float>(i, 14);
		if (score < scoreThresh) continue;

		FaceDet f;
		f.box   = cv::Rect(cvRound(x), cvRound(y), cvRound(w), cvRound(h));
		f.score = score;

		// landmark: [LE, RE, Nose, LM, RM]
		for (int k = 0; k < 5; ++k)
			f.lmk[k] = cv::Point2f(dets.at<float>(i, 4 + 2*k), dets.at<float>(i, 5 + 2*k));

		out.push_back(std::move(f));
	}

	return out;
}

std::optional<float> FaceDetector::sharpnessScore(const cv::Mat& bgr, const cv::Rect& box, double refVar)
{
	if (bgr.empty() || refVar <= 0.0) return std::nullopt;

	const cv::Rect roi = box & cv::Rect(0, 0, bgr.cols, bgr.rows);
	if (roi.width < 3 || roi.height < 3) return std::nullopt;

	cv::Mat gray, lap;
	if (bgr.channels() == 3) cv::cvtColor(bgr(roi), gray, cv::COLOR_BGR2GRAY);
	else gray = bgr(roi);

	cv::Laplacian(gray, lap, CV_64F);
	cv::Scalar mu, sigma;
	cv::meanStdDev(lap, mu, sigma);
	const double var = sigma[0] * sigma[0];

	return static_cast<float>(std::clamp(var / refVar, 0.0, 1.0));
}

std::vector<FaceDet> FaceDetector::detectAll(const cv::Mat& bgr) const
{
	std::vector<FaceDet> out;
	if (!ready_) return out;
	if (bgr.empty()) return out;

	// YuNet 입력 크기 갱신 (프레임 크기 변경 시 필수)
	try {
		const cv::Size cur = bgr.size();
		if (yunet_ && cur != yunet_InputSize_) {
			yunet_->setInputSize(cur);
			yunet_InputSize_ = cur;
		}
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceDetector] setInputSize failed:" << e.what();
		return out;
	}

	// -- YuNet detect ---
	cv::Mat dets;
	try {
		yunet_->detect(bgr, dets);		// BGR 그대로 입력 가능
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceDetector] detect failed:" << e.what();
		return out;
	}

#ifdef DEBUG
	qDebug() << "[FaceDetector] dets rows=" << dets.rows
			 << " cols=" << dets.cols
			 << " type=" << dets.type();
#endif

	return parseYuNet(dets, p_.scoreThr);
}

std::optional<FaceDet> FaceDetector::detectBest(const cv::Mat& bgr) const
{
	auto faces = detectAll(bgr);
	if (faces.empty()) return std::nullopt;

	FaceDet best = faces.front();
	if (faces.size() > 1) {
		// rule: area * (1 - 0.35 * dist_to_center)
		auto rank = [&](const FaceDet& d) {
			double area = static_cast<double>(d.box.area());
			cv::Point2f c(d.box.x + d.box.width  * 0.5f,
						  d.box.y + d.box.height * 0.5f);
			cv::Point2f fc(bgr.cols * 0.5f, bgr.rows * 0.5f);
			double dist = cv::norm(c - fc) /
						  std::hypot(static_cast<double>(bgr.cols),
									 static_cast<double>(bgr.rows));
			return area * (1.0 - 0.35 * dist);
		};
		best = *std::max_element(
				faces.begin(), faces.end(),
				[&] (const FaceDet& a, const FaceDet& b) {
					return rank(a) < rank(b);
				});
	}

	try {
		best.captureQuality = sharpnessScore(bgr, best.box, p_.sharpnessRefVar);
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceDetector] sharpness failed:" << e.what();
		best.captureQuality.reset();
	}

	return best;
}
