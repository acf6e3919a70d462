#include "HttpClient.hpp"
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QPointer>
#include <QTimer>
#include <memory>
#include "log/log_categories.hpp"

namespace {
constexpr int kCancelPollMs = 20;
}

HttpClient::HttpClient(const QString& baseUrl, int timeoutMs)
	: base_(QUrl(baseUrl)), timeoutMs_(timeoutMs < 0 ? 0 : timeoutMs)
{
}

QUrl HttpClient::makeUrl(const QUrl& base, const QString& path)
{
	if (!base.isValid() || base.scheme().isEmpty() || base.host().isEmpty()) {
		throw AppError(ErrorCode::BadUrl, "invalid base url: " + base.toString().toStdString());
	}

	QUrl url(base);
	QString p = url.path();
	if (p.endsWith('/')) p.chop(1);
	url.setPath(p + (path.startsWith('/') ? path : QStringLiteral("/") + path));

	if (!url.isValid()) {
		throw AppError(ErrorCode::BadUrl, "invalid url: " + url.toString().toStdString());
	}
	return url;
}

nlohmann::json HttpClient::decodeEnvelope(const QByteArray& body)
{
	nlohmann::json env = nlohmann::json::parse(body.constData(), body.constData() + body.size(),
											   /*cb=*/nullptr, /*allow_exceptions=*/false);
	if (env.is_discarded() || !env.is_object()) {
		throw AppError(ErrorCode::DecodingFailed, "response is not a JSON object");
	}

	auto it = env.find("success");
	if (it == env.end() || !it->is_boolean()) {
		throw AppError(ErrorCode::DecodingFailed, "envelope without boolean 'success'");
	}

	if (it->get<bool>()) {
		auto d = env.find("data");
		return (d == env.end()) ? nlohmann::json() : *d;
	}

	std::string code = "UNKNOWN";
	auto c = env.find("code");
	if (c != env.end() && c->is_string()) code = c->get<std::string>();

	std::string message;
	auto m = env.find("message");
	if (m != env.end() && m->is_string()) message = m->get<std::string>();

	throw AppError(fromBackend(code), message);
}

ErrorCode HttpClient::mapNetworkError(QNetworkReply::NetworkError e)
{
	switch (e) {
		case QNetworkReply::ConnectionRefusedError:
		case QNetworkReply::HostNotFoundError:
		case QNetworkReply::RemoteHostClosedError:
		case QNetworkReply::TemporaryNetworkFailureError:
		case QNetworkReply::UnknownNetworkError:
			return ErrorCode::NetworkUnavailable;
		case QNetworkReply::TimeoutError:
			return ErrorCode::RequestTimedOut;
		case QNetworkReply::ProtocolUnknownError:
		case QNetworkReply::ProtocolInvalidOperationError:
			return ErrorCode::BadUrl;
		case QNetworkReply::OperationCanceledError:
			return ErrorCode::Cancelled;
		default:
			return ErrorCode::Unknown;
	}
}

nlohmann::json HttpClient::post(const QString& path, const nlohmann::json& body,
								const CancelTokenPtr& token) const
{
	const QUrl url = makeUrl(base_, path);
	if (token) token->throwIfCancelled();

	QNetworkRequest req(url);
	req.setRawHeader("Accept", "application/json");
	req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

	const QByteArray payload = QByteArray::fromStdString(body.dump());

	// QNetworkAccessManager 는 사용하는 스레드에서 생성해야 한다
	QNetworkAccessManager nam;
	std::unique_ptr<QNetworkReply> reply(nam.post(req, payload));
	if (!reply) throw AppError(ErrorCode::InvalidResponse, "no reply object");

	qCDebug(LC_NET) << "[POST]" << url.toString() << "bytes=" << payload.size();

	QEventLoop loop;
	QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

	bool timedOut = false;
	bool cancelled = false;

	QTimer timeout;
	timeout.setSingleShot(true);
	if (timeoutMs_ > 0) {
		QObject::connect(&timeout, &QTimer::timeout, &loop, [&] {
			timedOut = true;
			reply->abort();
		});
		timeout.start(timeoutMs_);
	}

	QTimer poll;
	if (token) {
		QObject::connect(&poll, &QTimer::timeout, &loop, [&] {
			if (token->isCancelled() && !cancelled) {
				cancelled = true;
				reply->abort();
			}
		});
		poll.start(kCancelPollMs);
	}

	if (!reply->isFinished()) loop.exec();
	timeout.stop();
	poll.stop();

	if (cancelled) throw AppError(ErrorCode::Cancelled);
	if (timedOut) {
		qCWarning(LC_NET) << "[TIMEOUT]" << url.toString() << "after" << timeoutMs_ << "ms";
		throw AppError(ErrorCode::RequestTimedOut, "no response within " + std::to_string(timeoutMs_) + " ms");
	}

	// 서버가 응답했으면 (상태 코드 무관) 봉투로 판단
	const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
	if (status.isValid()) {
		const QByteArray data = reply->readAll();
		qCDebug(LC_NET) << "[REPLY] status=" << status.toInt() << "bytes=" << data.size();
		return decodeEnvelope(data);
	}

	const auto err = reply->error();
	if (err == QNetworkReply::NoError) {
		throw AppError(ErrorCode::InvalidResponse, "reply without HTTP status");
	}

	qCWarning(LC_NET) << "[ERROR]" << url.toString() << reply->errorString();
	throw AppError(mapNetworkError(err), reply->errorString().toStdString());
}
