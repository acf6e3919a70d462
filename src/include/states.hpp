#pragma once
#include <QObject>
#include <QString>
#include "error/AppError.hpp"

enum class VerificationStateKind {
	DETECTING = 0,		// 0 얼굴 탐색/수집 중
	PROCESSING,			// 1 임베딩 + 서버 검증 중
	MATCHED,			// 2 검증 성공 (세션 종료)
	TIMED_OUT,			// 3 검증 요청 타임아웃
	ERROR				// 4 하드 실패
};

struct VerificationState {
	VerificationStateKind kind = VerificationStateKind::DETECTING;
	QString   name;								// MATCHED 일 때 직원 ID
	ErrorCode reason = ErrorCode::Unknown;		// ERROR 일 때 실패 사유

	static VerificationState detecting()  { return {}; }
	static VerificationState processing() { return { VerificationStateKind::PROCESSING, {}, ErrorCode::Unknown }; }
	static VerificationState matched(const QString& n) { return { VerificationStateKind::MATCHED, n, ErrorCode::Unknown }; }
	static VerificationState timedOut()   { return { VerificationStateKind::TIMED_OUT, {}, ErrorCode::RequestTimedOut }; }
	static VerificationState error(ErrorCode c) { return { VerificationStateKind::ERROR, {}, c }; }

	bool operator==(const VerificationState& o) const {
		if (kind != o.kind) return false;
		if (kind == VerificationStateKind::MATCHED) return name == o.name;
		if (kind == VerificationStateKind::ERROR)   return reason == o.reason;
		return true;
	}
	bool operator!=(const VerificationState& o) const { return !(*this == o); }

	QString toString() const;
};

inline const char* stateKindName(VerificationStateKind k)
{
	switch (k) {
		case VerificationStateKind::DETECTING:  return "DETECTING";
		case VerificationStateKind::PROCESSING: return "PROCESSING";
		case VerificationStateKind::MATCHED:    return "MATCHED";
		case VerificationStateKind::TIMED_OUT:  return "TIMED_OUT";
		case VerificationStateKind::ERROR:      return "ERROR";
	}
	return "UNKNOWN";
}

inline QString VerificationState::toString() const
{
	switch (kind) {
		case VerificationStateKind::MATCHED:
			return QStringLiteral("MATCHED(%1)").arg(name);
		case VerificationStateKind::ERROR:
			return QStringLiteral("ERROR(%1)").arg(QString::fromStdString(toBackendString(reason)));
		default:
			return QString::fromLatin1(stateKindName(kind));
	}
}

Q_DECLARE_METATYPE(VerificationStateKind)
Q_DECLARE_METATYPE(VerificationState)
