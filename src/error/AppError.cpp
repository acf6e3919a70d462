#include "error/AppError.hpp"
#include <unordered_map>

namespace {

const std::unordered_map<std::string, ErrorCode>& backendTable()
{
	static const std::unordered_map<std::string, ErrorCode> table = {
		{ "CAMERA_UNAVAILABLE",               ErrorCode::CameraUnavailable },
		{ "CAMERA_START_FAILED",              ErrorCode::CameraStartFailed },
		{ "MODEL_OUTPUT_MISSING",             ErrorCode::ModelOutputMissing },
		{ "MODEL_LOAD_FAILURE",               ErrorCode::ModelFailedToLoad },
		{ "FACE_VALIDATION_FAILED",           ErrorCode::FaceValidationFailed },
		{ "IMAGE_LOAD_FAILED",                ErrorCode::ImageFailedToLoad },
		{ "FACE_PREPROCESSING_RESIZE_FAILED", ErrorCode::FacePreprocessingFailedResize },
		{ "FACE_PREPROCESSING_RENDER_FAILED", ErrorCode::FacePreprocessingFailedRender },
		{ "EMPLOYEE_NOT_FOUND",               ErrorCode::EmployeeNotFound },
		{ "FACE_CONFIDENCE_TOO_LOW",          ErrorCode::FaceConfidenceTooLow },
		{ "DB_ERROR",                         ErrorCode::DbError },
		{ "NETWORK_UNAVAILABLE",              ErrorCode::NetworkUnavailable },
		{ "REQUEST_TIMED_OUT",                ErrorCode::RequestTimedOut },
		{ "BAD_URL",                          ErrorCode::BadUrl },
		{ "INVALID_RESPONSE",                 ErrorCode::InvalidResponse },
		{ "DECODING_FAILED",                  ErrorCode::DecodingFailed },
		{ "UNKNOWN",                          ErrorCode::Unknown },
	};
	return table;
}

} // namespace

std::string toBackendString(ErrorCode code)
{
	// 내부 코드: 로그용 이름만 있고 서버에서 받지 않는다
	if (code == ErrorCode::Cancelled) return "CANCELLED";

	for (const auto& kv : backendTable()) {
		if (kv.second == code) return kv.first;
	}
	return "UNKNOWN";
}

ErrorCode fromBackend(const std::string& code)
{
	const auto& t = backendTable();
	auto it = t.find(code);
	return (it == t.end()) ? ErrorCode::Unknown : it->second;
}

std::string userMessage(ErrorCode code)
{
	switch (code) {
		// Camera
		case ErrorCode::CameraUnavailable:
			return "The camera isn't available on this device.";
		case ErrorCode::CameraStartFailed:
			return "Failed to start the camera. Please try again.";

		// Model
		case ErrorCode::ModelOutputMissing:
		case ErrorCode::ModelFailedToLoad:
			return "The face recognition system had a problem starting. Please restart the app or try again.";

		// Face / Image
		case ErrorCode::FaceValidationFailed:
			return "Face was not recognized. Try again.";
		case ErrorCode::ImageFailedToLoad:
			return "Image failed to load.";

		// Preprocessing
		case ErrorCode::FacePreprocessingFailedResize:
		case ErrorCode::FacePreprocessingFailedRender:
			return "There was a problem processing the face image. Try again.";

		// Backend
		case ErrorCode::EmployeeNotFound:
			return "Employee not found. Please check the details.";
		case ErrorCode::FaceConfidenceTooLow:
			return "Face not recognized. Try again with better lighting and angle.";
		case ErrorCode::DbError:
			return "Server error. Please try again later.";

		// Network / Transport
		case ErrorCode::NetworkUnavailable:
			return "No network connection. Please check your network settings and try again.";
		case ErrorCode::RequestTimedOut:
			return "The request took too long. Please try again.";
		case ErrorCode::BadUrl:
			return "Invalid backend address. Please contact support.";
		case ErrorCode::InvalidResponse:
			return "Received an invalid response from the server. Please try again later.";
		case ErrorCode::DecodingFailed:
			return "The server returned unexpected data. Please try again later.";

		case ErrorCode::Cancelled:
			return "Cancelled.";
		case ErrorCode::Unknown:
			break;
	}
	return "Something went wrong. Please try again.";
}

static std::string composeWhat(ErrorCode code, const std::string& debug)
{
	std::string s = toBackendString(code);
	if (!debug.empty()) s += ": " + debug;
	return s;
}

AppError::AppError(ErrorCode code, const std::string& debugMessage)
	: std::runtime_error(composeWhat(code, debugMessage)), code_(code), debug_(debugMessage)
{
}
