#pragma once
#include <memory>
#include <QString>
#include <nlohmann/json.hpp>
#include "ai/Embedding.hpp"
#include "net/HttpClient.hpp"
#include "util/CancelToken.hpp"

// (직원 ID, 임베딩) 서버 검증. 성공 시 반환, 실패 시 AppError. 재시도 없음.
class IVerificationClient {
public:
	virtual ~IVerificationClient() = default;
	virtual void verify(const QString& employeeId, const Embedding& embedding,
						const CancelTokenPtr& token) = 0;
};

class HttpVerificationClient : public IVerificationClient {
public:
	explicit HttpVerificationClient(std::shared_ptr<const HttpClient> http);

	void verify(const QString& employeeId, const Embedding& embedding,
				const CancelTokenPtr& token) override;

	// {"employee_id": "...", "embedding": [doubles]}
	static nlohmann::json makeRequestBody(const QString& employeeId, const Embedding& embedding);

private:
	std::shared_ptr<const HttpClient> http_;
};
