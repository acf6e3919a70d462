#include "AppConfig.hpp"
#include <fstream>
#include <stdexcept>
#include <QDebug>

namespace {

template <typename T>
void read(const nlohmann::json& j, const char* key, T& out)
{
	auto it = j.find(key);
	if (it == j.end() || it->is_null()) return;
	out = it->get<T>();
}

const nlohmann::json* section(const nlohmann::json& j, const char* key)
{
	auto it = j.find(key);
	if (it == j.end() || it->is_null()) return nullptr;
	if (!it->is_object()) throw std::runtime_error(std::string("config: '") + key + "' must be an object");
	return &*it;
}

} // namespace

AppConfig AppConfig::fromJson(const nlohmann::json& j)
{
	if (!j.is_object()) throw std::runtime_error("config: top level must be an object");

	AppConfig c;
	try {
		read(j, "backendUrl",      c.backendUrl);
		read(j, "verifyTimeoutMs", c.verifyTimeoutMs);
		read(j, "detectorModel",   c.detectorModel);
		read(j, "embedderModel",   c.embedderModel);
		read(j, "embeddingDim",    c.embeddingDim);
		read(j, "logDir",          c.logDir);
		read(j, "logRules",        c.logRules);

		if (auto s = section(j, "camera")) {
			read(*s, "index",  c.camera.index);
			read(*s, "device", c.camera.device);
			read(*s, "width",  c.camera.width);
			read(*s, "height", c.camera.height);
			read(*s, "fps",    c.camera.fps);
			read(*s, "fourcc", c.camera.fourcc);
			read(*s, "v4l2",   c.camera.v4l2);
			read(*s, "maxOpenAttempts", c.camera.maxOpenAttempts);
		}
		if (auto s = section(j, "collector")) {
			read(*s, "windowMs",      c.collector.windowMs);
			read(*s, "highWaterMark", c.collector.highWaterMark);
		}
		if (auto s = section(j, "validation")) {
			read(*s, "maxRollDeg",      c.validation.maxRollDeg);
			read(*s, "maxYawDeg",       c.validation.maxYawDeg);
			read(*s, "minBrightness",   c.validation.minBrightness);
			read(*s, "maxBrightness",   c.validation.maxBrightness);
			read(*s, "minSharpness",    c.validation.minSharpness);
			read(*s, "minFaceFraction", c.validation.minFaceFraction);
			read(*s, "sharpnessRefVar", c.detector.sharpnessRefVar);
		}
		if (auto s = section(j, "detector")) {
			read(*s, "scoreThreshold", c.detector.scoreThr);
			read(*s, "nmsThreshold",   c.detector.nmsThr);
			read(*s, "topK",           c.detector.topK);
		}
	} catch (const nlohmann::json::exception& e) {
		throw std::runtime_error(std::string("config: ") + e.what());
	}

	if (c.collector.windowMs <= 0) throw std::runtime_error("config: collector.windowMs must be > 0");
	if (c.embeddingDim <= 0)       throw std::runtime_error("config: embeddingDim must be > 0");
	if (c.verifyTimeoutMs < 0)     c.verifyTimeoutMs = 0;
	if (c.validation.minFaceFraction < 0.0 || c.validation.minFaceFraction > 1.0)
		throw std::runtime_error("config: validation.minFaceFraction must be in [0, 1]");
	if (!c.camera.fourcc.empty() && c.camera.fourcc.size() != 4)
		throw std::runtime_error("config: camera.fourcc must be 4 characters");

	return c;
}

AppConfig AppConfig::load(const std::string& path)
{
	std::ifstream in(path);
	if (!in.is_open()) throw std::runtime_error("config: cannot open " + path);

	nlohmann::json j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
	if (j.is_discarded()) throw std::runtime_error("config: malformed JSON in " + path);

	qDebug() << "[AppConfig] loaded" << QString::fromStdString(path);
	return fromJson(j);
}
