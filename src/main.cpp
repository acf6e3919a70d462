#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTimer>
#include <QDebug>
#include <exception>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>
#include <opencv2/videoio.hpp>

#include "include/common_path.hpp"
#include "config/AppConfig.hpp"
#include "logger.hpp"
#include "log/SystemLogger.hpp"
#include "detect/FaceDetector.hpp"
#include "analyze/FaceAnalyzer.hpp"
#include "ai/Embedder.hpp"
#include "process/FaceProcessor.hpp"
#include "process/FaceEmbeddingExtractor.hpp"
#include "net/HttpClient.hpp"
#include "net/VerificationClient.hpp"
#include "error/ErrorReporter.hpp"
#include "services/VerificationService.hpp"
#include "capture/FrameCapture.hpp"
#include "presenter/VerificationPresenter.hpp"

namespace {

enum ExitCode { EXIT_MATCHED = 0, EXIT_STARTUP_FAILED = 1, EXIT_SESSION_TIMEOUT = 2 };

AppConfig loadConfig(const QString& explicitPath)
{
	if (!explicitPath.isEmpty()) return AppConfig::load(explicitPath.toStdString());

	const std::string def = CONFIG_PATH CONFIG_FILE;
	if (QFileInfo::exists(QString::fromStdString(def))) return AppConfig::load(def);

	qInfo() << "[main] no config file, using defaults";
	return AppConfig{};
}

std::shared_ptr<FaceDetector> makeDetector(const AppConfig& cfg)
{
	auto det = std::make_shared<FaceDetector>();
	if (!det->init(cfg.detectorModel, cfg.detector)) {
		throw AppError(ErrorCode::ModelFailedToLoad, "YuNet init failed: " + cfg.detectorModel);
	}
	return det;
}

std::shared_ptr<FaceProcessor> makeProcessor(const AppConfig& cfg)
{
	auto model = std::make_shared<OnnxEmbeddingModel>(cfg.embedderModel);
	Embedder::Options opt;
	opt.dim = cfg.embeddingDim;
	auto embedder = std::make_shared<Embedder>(model, opt);
	return std::make_shared<FaceProcessor>(embedder);
}

int runEmbedImage(const AppConfig& cfg, const QString& imagePath)
{
	auto analyzer  = std::make_shared<FaceAnalyzer>(makeDetector(cfg), FaceValidator(cfg.validation));
	auto processor = makeProcessor(cfg);
	FaceEmbeddingExtractor extractor(analyzer, processor);

	try {
		const Embedding emb = extractor.embeddingFromFile(imagePath.toStdString());
		nlohmann::json out;
		out["embedding"] = emb.values();
		std::cout << out.dump() << std::endl;
		return EXIT_MATCHED;
	} catch (const AppError& e) {
		qWarning() << "[main] embed failed:" << e.what();
		std::cerr << userMessage(e.code()) << std::endl;
		return EXIT_STARTUP_FAILED;
	}
}

} // namespace

int main(int argc, char *argv[])
{
	try {
		QCoreApplication app(argc, argv);
		QCoreApplication::setApplicationName(QStringLiteral("faceVerifier"));

		qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));
		QLoggingCategory::setFilterRules(
				"verify.gate.debug=false\n"
				"verify.collect.debug=false\n"
		);

		// === CLI ===
		QCommandLineParser parser;
		parser.setApplicationDescription(QStringLiteral("Live face verification against the backend"));
		parser.addHelpOption();
		QCommandLineOption employeeOpt(QStringList{"e", "employee"}, "Employee id to verify.", "id");
		QCommandLineOption configOpt(QStringList{"c", "config"}, "Config file (JSON).", "file");
		QCommandLineOption cameraOpt("camera", "Camera index or device path.", "index|device");
		QCommandLineOption sessionOpt("session-timeout", "Give up after <ms> without a match (exit 2).", "ms");
		QCommandLineOption embedOpt("embed-image", "Print the embedding of a still image and exit.", "image");
		parser.addOptions({ employeeOpt, configOpt, cameraOpt, sessionOpt, embedOpt });
		parser.process(app);

		// === 설정 / 로그 ===
		AppConfig cfg;
		try {
			cfg = loadConfig(parser.value(configOpt));
		} catch (const std::exception& e) {
			qCritical() << "[main] config error:" << e.what();
			return EXIT_STARTUP_FAILED;
		}
		if (!cfg.logRules.empty())
			QLoggingCategory::setFilterRules(QString::fromStdString(cfg.logRules));

		Logger::setLogDir(cfg.logDir);
		SystemLogger::init();
		SystemLogger::info("APP", "Logger initialized", QString::fromStdString(Logger::logFile()));
		QObject::connect(&app, &QCoreApplication::aboutToQuit, []{
			SystemLogger::info("APP", "aboutToQuit");
			SystemLogger::shutdown();
		});

		// === 정지 이미지 임베딩 모드 ===
		if (parser.isSet(embedOpt)) {
			int rc = EXIT_STARTUP_FAILED;
			try {
				rc = runEmbedImage(cfg, parser.value(embedOpt));
			} catch (const AppError& e) {
				qCritical() << "[main] startup failed:" << e.what();
				std::cerr << userMessage(e.code()) << std::endl;
			}
			SystemLogger::shutdown();
			return rc;
		}

		if (!parser.isSet(employeeOpt)) {
			qCritical() << "[main] --employee is required";
			parser.showHelp(EXIT_STARTUP_FAILED);
		}

		// === 파이프라인 구성 ===
		std::shared_ptr<FaceAnalyzer> analyzer;
		std::shared_ptr<FaceProcessor> processor;
		try {
			analyzer  = std::make_shared<FaceAnalyzer>(makeDetector(cfg), FaceValidator(cfg.validation));
			processor = makeProcessor(cfg);
		} catch (const AppError& e) {
			qCritical() << "[main] startup failed:" << e.what();
			SystemLogger::critical("APP", "startup failed", QString::fromStdString(e.what()));
			SystemLogger::shutdown();
			return EXIT_STARTUP_FAILED;
		}

		auto reporter = std::make_shared<ErrorReporter>();
		auto http     = std::make_shared<HttpClient>(QString::fromStdString(cfg.backendUrl), cfg.verifyTimeoutMs);
		auto verifier = std::make_shared<HttpVerificationClient>(http);

		VerificationService service({ analyzer, processor, verifier, reporter }, cfg.collector);
		service.setEmployeeId(parser.value(employeeOpt));

		ConsoleVerificationView view;
		VerificationPresenter presenter(&service, reporter.get(), &view);

		FrameCapture capture;
		const QString cam = parser.isSet(cameraOpt) ? parser.value(cameraOpt)
													: QString::fromStdString(cfg.camera.device);
		bool isIndex = false;
		const int camIndex = cam.toInt(&isIndex);
		if (cam.isEmpty())  capture.setCameraIndex(cfg.camera.index);
		else if (isIndex)   capture.setCameraIndex(camIndex);
		else                capture.setDevice(cam);
		capture.setResolution(cfg.camera.width, cfg.camera.height);
		capture.setFps(cfg.camera.fps);
		capture.setUseV4L2(cfg.camera.v4l2);
		capture.setMaxOpenAttempts(cfg.camera.maxOpenAttempts);
		if (!cfg.camera.fourcc.empty()) {
			const std::string& fc = cfg.camera.fourcc;
			capture.setFourcc(cv::VideoWriter::fourcc(fc[0], fc[1], fc[2], fc[3]));
		}

		// 카메라 스레드에서 바로 게이트로
		QObject::connect(&capture, &FrameCapture::frameReady, &service, &VerificationService::onFrame,
						 Qt::DirectConnection);
		QObject::connect(&capture, &FrameCapture::cameraError, &app, [](const QString& msg) {
			qWarning() << msg;
		});
		QObject::connect(&capture, &FrameCapture::cameraFailed, &app, [&](ErrorCode code, const QString& msg) {
			qCritical() << msg << QString::fromStdString(toBackendString(code));
			std::cerr << userMessage(code) << std::endl;
			app.exit(EXIT_STARTUP_FAILED);
		}, Qt::QueuedConnection);

		QObject::connect(&service, &VerificationService::matched, &app, [&](const QString& id) {
			qInfo() << "[main] matched" << id;
			capture.stop();
			service.stop();
			app.exit(EXIT_MATCHED);
		}, Qt::QueuedConnection);

		QTimer sessionTimer;
		if (parser.isSet(sessionOpt)) {
			const int ms = parser.value(sessionOpt).toInt();
			if (ms > 0) {
				sessionTimer.setSingleShot(true);
				QObject::connect(&sessionTimer, &QTimer::timeout, &app, [&] {
					qWarning() << "[main] session timeout after" << ms << "ms";
					capture.stop();
					service.stop();
					app.exit(EXIT_SESSION_TIMEOUT);
				});
				sessionTimer.start(ms);
			}
		}

		service.start();
		capture.start();

		const int rc = app.exec();
		capture.stop();
		service.stop();
		return rc;
	} catch (const std::exception& e) {
		qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
	}

	return EXIT_STARTUP_FAILED;
}
