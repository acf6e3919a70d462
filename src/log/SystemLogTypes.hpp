#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

inline const char* sysLogLevelName(SysLogLevel lv)
{
	switch (lv) {
		case SysLogLevel::Debug:    return "DEBUG";
		case SysLogLevel::Info:     return "INFO";
		case SysLogLevel::Warn:     return "WARN";
		case SysLogLevel::Error:    return "ERROR";
		case SysLogLevel::Critical: return "CRITICAL";
	}
	return "?";
}

struct SystemLogEntry {
	SysLogLevel level = SysLogLevel::Info;
	QString tag;        // 예: "APP", "VRS", "FSM", "NET"
	QString message;
	QDateTime ts;
	QString extra;
};

// 한 줄 포맷: "<ts> <LEVEL> [tag] message | extra"
QString formatSystemLogLine(const SystemLogEntry& e);

Q_DECLARE_METATYPE(SystemLogEntry)
