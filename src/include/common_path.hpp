#pragma once

// Common path
#ifndef FACEVERIFIER_ROOT
#define FACEVERIFIER_ROOT						"/opt/faceVerifier/"
#endif
#define ROOT									FACEVERIFIER_ROOT
#define ASSERT									ROOT "assert/"


// Face detection (YuNet)
#define YNMODEL_PATH							ASSERT "models/face/"
#define YNMODEL									"face_detection_yunet_2023mar.onnx"


// Embedding (ArcFace w600k_r50, 512-d)
#define EMBEDDER_MODEL_PATH						ASSERT "models/face/"
#define EMBEDDER_MODEL							"w600k_r50.onnx"


// Config / log
#define CONFIG_PATH								ROOT "config/"
#define CONFIG_FILE								"faceVerifier.json"

#define DEFAULT_LOG_DIR							"/var/log/face_verifier"


// Backend
#define DEFAULT_BACKEND_URL						"http://localhost:8000"
#define VERIFY_FACE_PATH						"/verify-face"
