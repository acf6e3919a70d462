#include "VerificationClient.hpp"
#include <vector>
#include "include/common_path.hpp"
#include "log/log_categories.hpp"

HttpVerificationClient::HttpVerificationClient(std::shared_ptr<const HttpClient> http)
	: http_(std::move(http))
{
}

nlohmann::json HttpVerificationClient::makeRequestBody(const QString& employeeId, const Embedding& embedding)
{
	std::vector<double> values(embedding.values().begin(), embedding.values().end());

	nlohmann::json body;
	body["employee_id"] = employeeId.toStdString();
	body["embedding"]   = values;
	return body;
}

void HttpVerificationClient::verify(const QString& employeeId, const Embedding& embedding,
									const CancelTokenPtr& token)
{
	if (!http_) throw AppError(ErrorCode::BadUrl, "no http client");

	qCDebug(LC_NET) << "[VERIFY] employee=" << employeeId << "dim=" << embedding.size();
	http_->post(QStringLiteral(VERIFY_FACE_PATH), makeRequestBody(employeeId, embedding), token);
	qCDebug(LC_NET) << "[VERIFY] ok employee=" << employeeId;
}
