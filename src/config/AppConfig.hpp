#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "include/common_path.hpp"
#include "include/verify_params.hpp"
#include "detect/FaceDetector.hpp"		// DetectorParams

struct CameraConfig {
	int index = 0;
	std::string device;			// 비어 있지 않으면 index 대신 사용 (예: /dev/video0)
	int width  = 640;
	int height = 480;
	double fps = 30.0;
	std::string fourcc;			// 예: "MJPG". 비어 있으면 드라이버 기본값
	bool v4l2 = true;
	int maxOpenAttempts = 10;	// 최초 오픈 재시도 횟수 (0: 무제한)
};

// faceVerifier.json. 모든 키는 선택, 모르는 키는 무시
struct AppConfig {
	std::string backendUrl    = DEFAULT_BACKEND_URL;
	int verifyTimeoutMs       = 0;		// 0: 타임아웃 없음
	std::string detectorModel = YNMODEL_PATH YNMODEL;
	std::string embedderModel = EMBEDDER_MODEL_PATH EMBEDDER_MODEL;
	int embeddingDim          = verify::EMBEDDING_DIM;

	CameraConfig     camera;
	CollectorParams  collector;
	ValidationParams validation;
	DetectorParams   detector;

	std::string logDir   = DEFAULT_LOG_DIR;
	std::string logRules;		// QLoggingCategory 필터 규칙 (추가)

	// 형식 오류 시 std::runtime_error
	static AppConfig fromJson(const nlohmann::json& j);

	// 파일이 없거나 파싱 실패 시 std::runtime_error
	static AppConfig load(const std::string& path);
};
