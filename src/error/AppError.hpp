#pragma once
#include <stdexcept>
#include <string>

// 파이프라인 전체에서 쓰는 실패 코드 (백엔드 문자열과 1:1)
enum class ErrorCode {
	// Camera
	CameraUnavailable,
	CameraStartFailed,

	// Model
	ModelOutputMissing,
	ModelFailedToLoad,

	// Face
	FaceValidationFailed,

	// Image
	ImageFailedToLoad,

	// Preprocessing
	FacePreprocessingFailedResize,
	FacePreprocessingFailedRender,

	// Backend
	EmployeeNotFound,
	FaceConfidenceTooLow,
	DbError,

	// Network / Transport
	NetworkUnavailable,
	RequestTimedOut,
	BadUrl,
	InvalidResponse,
	DecodingFailed,

	// Misc
	Cancelled,			// 내부용: 사용자에게 노출하지 않음
	Unknown
};

std::string toBackendString(ErrorCode code);
ErrorCode   fromBackend(const std::string& code);
std::string userMessage(ErrorCode code);

class AppError : public std::runtime_error {
public:
	explicit AppError(ErrorCode code, const std::string& debugMessage = {});

	ErrorCode code() const noexcept { return code_; }
	const std::string& debugMessage() const noexcept { return debug_; }

private:
	ErrorCode   code_;
	std::string debug_;
};
