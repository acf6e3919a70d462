#include "Embedder.hpp"
#include <cstring>
#include <filesystem>
#include <QDebug>
#include <QStringList>
#include <opencv2/core.hpp>
#include "error/AppError.hpp"

// #define DEBUG

namespace fs = std::filesystem;

// === OnnxEmbeddingModel ===

OnnxEmbeddingModel::OnnxEmbeddingModel(const std::string& path)
{
	qDebug() << "[Embedder] model path=" << QString::fromStdString(path);

	if (!fs::exists(path)) {
		throw AppError(ErrorCode::ModelFailedToLoad, "model file not found: " + path);
	}

	try {
		net_ = cv::dnn::readNetFromONNX(path);
		net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
		net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
	} catch (const cv::Exception& e) {
		throw AppError(ErrorCode::ModelFailedToLoad, std::string("readNetFromONNX failed: ") + e.what());
	}
	if (net_.empty()) {
		throw AppError(ErrorCode::ModelFailedToLoad, "empty network: " + path);
	}

	// 출력 레이어 로그
	QStringList qn;
	for (const auto& s : net_.getUnconnectedOutLayersNames())
		qn << QString::fromStdString(s);
	qDebug() << "[Embedder] out names =" << qn;
}

cv::Mat OnnxEmbeddingModel::forward(const cv::Mat& blob) const
{
	std::lock_guard<std::mutex> lk(mtx_);
	net_.setInput(blob);
	return net_.forward().clone();
}

// === Embedder ===

Embedder::Embedder(std::shared_ptr<const IEmbeddingModel> model, const Options& opt)
	: model_(std::move(model)), opt_(opt)
{
}

cv::Mat Embedder::preprocess(const cv::Mat& src) const
{
	// ── 0) 기본 유효성 검사 ──────────────────────────────────────────────
	if (src.empty() || src.type() != CV_8UC3) {
		qWarning() << "[preprocess] ERR: src empty or type invalid"
				   << " type=" << src.type() << " ch=" << src.channels();
		return cv::Mat();
	}

	// ── 1) blob 생성 ─────────────────────────────────────────────────────
	//   ArcFace 계열: (img-127.5)/127.5, RGB, 112x112
	const int S = opt_.inputSize;
	double scale;
	cv::Scalar mean;
	if (opt_.norm == Options::Norm::MinusOneToOne) {
		scale = 1.0 / 127.5;
		mean = cv::Scalar(127.5, 127.5, 127.5);
	} else {
		scale = 1.0 / 255.0;
		mean = cv::Scalar(0, 0, 0);
	}

	cv::Mat blob = cv::dnn::blobFromImage(src, scale, cv::Size(S, S), mean,
										  opt_.useRGB, /*crop=*/false, CV_32F);

	// ── 2) blob 형태 확인 (N,C,H,W) ──────────────────────────────────────
	if (blob.dims != 4 || blob.size[0] != 1 || blob.size[1] != 3
		|| blob.size[2] != S || blob.size[3] != S) {
		qWarning() << "[preprocess] ERR: unexpected blob shape dims=" << blob.dims;
		return cv::Mat();
	}

	return blob; // NCHW 1x3xSxS
}

std::vector<float> Embedder::runOnce(const cv::Mat& faceBgr) const
{
	cv::Mat blob;
	try {
		blob = preprocess(faceBgr);
	} catch (const cv::Exception& e) {
		throw AppError(ErrorCode::FacePreprocessingFailedRender, e.what());
	}
	if (blob.empty()) {
		throw AppError(ErrorCode::FacePreprocessingFailedRender, "blobFromImage produced no blob");
	}

	cv::Mat out;
	try {
		out = model_->forward(blob);
	} catch (const cv::Exception& e) {
		throw AppError(ErrorCode::ModelOutputMissing, std::string("forward failed: ") + e.what());
	} catch (const AppError&) {
		throw;
	} catch (const std::exception& e) {
		throw AppError(ErrorCode::ModelOutputMissing, std::string("forward failed: ") + e.what());
	}

	if (out.empty() || static_cast<int>(out.total()) != opt_.dim) {
		throw AppError(ErrorCode::ModelOutputMissing,
					   "unexpected output length " + std::to_string(out.total())
					   + " (expect " + std::to_string(opt_.dim) + ")");
	}

	// 1xD 로 평탄화 & dtype 보정
	cv::Mat row = out.reshape(1, 1).clone();
	if (row.type() != CV_32F) row.convertTo(row, CV_32F);

	std::vector<float> v(static_cast<size_t>(row.cols));
	std::memcpy(v.data(), row.ptr<float>(0), v.size() * sizeof(float));
	return v;
}

Embedding Embedder::embed(const cv::Mat& alignedBgr) const
{
	if (!model_) throw AppError(ErrorCode::ModelFailedToLoad, "no embedding model");

	std::vector<float> v = runOnce(alignedBgr);

	if (opt_.flipTTA) {
		// 좌우반전 이미지 추론 후 평균
		cv::Mat flipped;
		cv::flip(alignedBgr, flipped, 1);
		const std::vector<float> v2 = runOnce(flipped);
		for (size_t i = 0; i < v.size(); ++i) v[i] = 0.5f * (v[i] + v2[i]);
	}

#ifdef DEBUG
	qDebug() << "[Embedder] dim=" << v.size();
#endif

	return Embedding(std::move(v));
}
