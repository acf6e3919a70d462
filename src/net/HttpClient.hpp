#pragma once
#include <QByteArray>
#include <QString>
#include <QUrl>
#include <QNetworkReply>
#include <nlohmann/json.hpp>
#include "error/AppError.hpp"
#include "util/CancelToken.hpp"

// JSON 요청/응답 HTTP 클라이언트. 응답은 항상 {success, data, code, message} 봉투.
// 호출한 스레드에서 로컬 이벤트 루프로 완료를 기다린다 (워커 스레드 전용).
class HttpClient {
public:
	explicit HttpClient(const QString& baseUrl, int timeoutMs = 0);

	// 성공 시 data (없으면 null), 실패 시 AppError
	nlohmann::json post(const QString& path, const nlohmann::json& body,
						const CancelTokenPtr& token = nullptr) const;

	const QUrl& baseUrl() const { return base_; }
	int timeoutMs() const { return timeoutMs_; }

	// base + path. scheme/host 가 없으면 AppError(BadUrl)
	static QUrl makeUrl(const QUrl& base, const QString& path);

	// 봉투 디코드. JSON 아님/형식 불일치 -> DecodingFailed, success=false -> fromBackend(code)
	static nlohmann::json decodeEnvelope(const QByteArray& body);

	// 전송 계층 오류 -> ErrorCode
	static ErrorCode mapNetworkError(QNetworkReply::NetworkError e);

private:
	QUrl base_;
	int timeoutMs_ = 0;		// 0: 타임아웃 없음
};
