#pragma once
#include <array>
#include <opencv2/core.hpp>

class LandmarkAligner {
	public:
		LandmarkAligner()  = default;
		~LandmarkAligner() = default;

		// 5점 기준 정렬. 성공 시 정렬된 BGR 얼굴(출력 크기 outSize), 실패 시 빈 Mat
		// lmk 순서: [LE, RE, Nose, LM, RM]  (YuNet 계약과 동일)
		cv::Mat alignBy5pts(const cv::Mat& srcBgr,
							const std::array<cv::Point2f,5>& src5_in,
							const cv::Size& outSize = {112, 112}) const;

		// 변환 추정 실패 시: 박스를 프레임에 클램프해 잘라 outSize로 리사이즈. 빈 영역이면 빈 Mat
		cv::Mat cropBox(const cv::Mat& srcBgr, const cv::Rect& box,
						const cv::Size& outSize = {112, 112}) const;

	private:
		// 기준 좌표(ArcFace 112x112 계열)
		static const std::array<cv::Point2f,5> kDst5_112;
};
