// logger.hpp
#pragma once
#include <string>
#include <QString>
#include <QDebug>
#include <QtGlobal>
#include "include/common_path.hpp"

#define LOG_FILE_NAME	"log.txt"

class Logger {
public:
	// 기본값은 DEFAULT_LOG_DIR, 설정 파일의 logDir 로 변경
	static void setLogDir(const std::string& dir);
	static std::string logDir();
	static std::string logFile();

	static void write(const std::string& message);
	static void writef(const char* format, ...);
};

namespace GlobalLogger {

inline void logMessage(QtMsgType type, const QString& functionName, const QString& message)
{
	QString fullMsg = QString("[%1] %2").arg(functionName, message);

	switch (type) {
		case QtDebugMsg:
			qDebug().noquote() << fullMsg;
			break;
		case QtInfoMsg:
			qInfo().noquote() << fullMsg;
			break;
		case QtWarningMsg:
			qWarning().noquote() << fullMsg;
			break;
		case QtCriticalMsg:
			qCritical().noquote() << fullMsg;
			break;
		case QtFatalMsg:
			qFatal("%s", fullMsg.toUtf8().constData());
			break;
	}
}

}		// namespace GlobalLogger

#define LOG_DEBUG(msg)		GlobalLogger::logMessage(QtDebugMsg, __FUNCTION__, msg)
#define LOG_INFO(msg)		GlobalLogger::logMessage(QtInfoMsg, __FUNCTION__, msg)
#define LOG_WARN(msg)		GlobalLogger::logMessage(QtWarningMsg, __FUNCTION__, msg)
#define LOG_CRITICAL(msg)	GlobalLogger::logMessage(QtCriticalMsg, __FUNCTION__, msg)
