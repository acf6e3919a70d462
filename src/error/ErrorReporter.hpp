#pragma once
#include <QObject>
#include <QString>
#include <QMetaType>
#include "error/AppError.hpp"

// 표면화된 하드 실패를 받는 곳 (fire-and-forget)
class IErrorReporter {
public:
	virtual ~IErrorReporter() = default;
	virtual void report(const AppError& error) = 0;
};

// SystemLogger 에 기록하고 사용자 메시지와 함께 시그널로 알림
class ErrorReporter : public QObject, public IErrorReporter {
	Q_OBJECT
public:
	explicit ErrorReporter(QObject* parent = nullptr);

	void report(const AppError& error) override;

signals:
	void errorRaised(ErrorCode code, const QString& userMessage);
};

Q_DECLARE_METATYPE(ErrorCode)
