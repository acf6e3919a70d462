#include "FaceEmbeddingExtractor.hpp"
#include <opencv2/imgcodecs.hpp>
#include "error/AppError.hpp"
#include "logger.hpp"

FaceEmbeddingExtractor::FaceEmbeddingExtractor(std::shared_ptr<const IFaceAnalyzer> analyzer,
											   std::shared_ptr<const IFaceProcessor> processor)
	: analyzer_(std::move(analyzer)), processor_(std::move(processor))
{
}

Embedding FaceEmbeddingExtractor::embedding(const cv::Mat& bgr) const
{
	Frame frame;
	frame.image = bgr;

	auto result = analyzer_->analyze(frame);
	if (!result) {
		LOG_WARN(QStringLiteral("no valid face in %1x%2 image").arg(bgr.cols).arg(bgr.rows));
		throw AppError(ErrorCode::FaceValidationFailed, "no valid face in image");
	}

	Embedding e = processor_->process(frame, result->face);
	LOG_INFO(QStringLiteral("embedding dim=%1 quality=%2").arg(e.size()).arg(result->quality, 0, 'f', 3));
	return e;
}

Embedding FaceEmbeddingExtractor::embeddingFromFile(const std::string& path) const
{
	cv::Mat img;
	try {
		img = cv::imread(path, cv::IMREAD_COLOR);
	} catch (const cv::Exception& e) {
		throw AppError(ErrorCode::ImageFailedToLoad, e.what());
	}
	if (img.empty()) {
		LOG_WARN(QStringLiteral("cannot read %1").arg(QString::fromStdString(path)));
		throw AppError(ErrorCode::ImageFailedToLoad, path);
	}

	return embedding(img);
}
