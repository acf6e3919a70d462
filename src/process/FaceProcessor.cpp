#include "FaceProcessor.hpp"
#include <QtCore/QDebug>
#include "error/AppError.hpp"

FaceProcessor::FaceProcessor(std::shared_ptr<const Embedder> embedder)
	: embedder_(std::move(embedder))
{
}

Embedding FaceProcessor::process(const Frame& frame, const FaceDet& face) const
{
	if (!embedder_) throw AppError(ErrorCode::ModelFailedToLoad, "no embedder");
	if (frame.empty()) throw AppError(ErrorCode::FacePreprocessingFailedResize, "empty frame");

	const int S = embedder_->options().inputSize;
	cv::Mat aligned;
	try {
		aligned = aligner_.alignBy5pts(frame.image, face.lmk, cv::Size(S, S));
		if (aligned.empty()) {
			qDebug() << "[FaceProcessor] 5pt align failed, fallback to box crop";
			aligned = aligner_.cropBox(frame.image, face.box, cv::Size(S, S));
		}
	} catch (const cv::Exception& e) {
		throw AppError(ErrorCode::FacePreprocessingFailedResize, e.what());
	}

	if (aligned.empty()) {
		throw AppError(ErrorCode::FacePreprocessingFailedResize, "face region outside frame");
	}

	return embedder_->embed(aligned);
}
