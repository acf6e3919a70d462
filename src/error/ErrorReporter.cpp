#include "ErrorReporter.hpp"
#include <QDebug>
#include "log/SystemLogger.hpp"

ErrorReporter::ErrorReporter(QObject* parent) : QObject(parent)
{
	qRegisterMetaType<ErrorCode>("ErrorCode");
}

void ErrorReporter::report(const AppError& error)
{
	// 취소는 사용자에게 알리지 않는다
	if (error.code() == ErrorCode::Cancelled) return;

	const QString code = QString::fromStdString(toBackendString(error.code()));
	const QString msg  = QString::fromStdString(userMessage(error.code()));

	qWarning() << "[ErrorReporter]" << code << "-" << QString::fromStdString(error.debugMessage());
	SystemLogger::error("ERR", code, QString::fromStdString(error.debugMessage()));

	emit errorRaised(error.code(), msg);
}
