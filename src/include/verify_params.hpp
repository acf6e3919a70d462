#pragma once

// 튜닝 값 (설정 파일로 덮어쓸 수 있음)
namespace verify {
	inline constexpr int    WINDOW_MS        = 800;		// 수집 창
	inline constexpr float  HIGH_WATER_MARK  = 0.9f;	// 즉시 채택 품질
	inline constexpr float  MAX_ROLL_DEG     = 15.0f;
	inline constexpr float  MAX_YAW_DEG      = 15.0f;
	inline constexpr double MIN_BRIGHTNESS   = 0.25;
	inline constexpr double MAX_BRIGHTNESS   = 0.85;
	inline constexpr float  MIN_SHARPNESS    = 0.2f;
	inline constexpr double MIN_FACE_FRACTION = 0.0;	// 0: 크기 검사 안 함
	inline constexpr double SHARPNESS_REF_VAR = 300.0;	// Laplacian variance -> 1.0
	inline constexpr int    EMBEDDING_DIM    = 512;
	inline constexpr int    ALIGN_SIZE       = 112;
}

struct CollectorParams {
	int   windowMs      = verify::WINDOW_MS;
	float highWaterMark = verify::HIGH_WATER_MARK;
};

struct ValidationParams {
	float  maxRollDeg    = verify::MAX_ROLL_DEG;
	float  maxYawDeg     = verify::MAX_YAW_DEG;
	double minBrightness = verify::MIN_BRIGHTNESS;
	double maxBrightness = verify::MAX_BRIGHTNESS;
	float  minSharpness  = verify::MIN_SHARPNESS;
	double minFaceFraction = verify::MIN_FACE_FRACTION;	// min(boxW/W, boxH/H) 하한
};
