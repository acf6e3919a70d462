#include "SystemLogger.hpp"
#include <QThread>
#include <QDebug>
#include "logger.hpp"
#include "log/SystemLogTypes.hpp"

QString formatSystemLogLine(const SystemLogEntry& e)
{
	const QDateTime ts = e.ts.isValid() ? e.ts : QDateTime::currentDateTime();
	QString line = QStringLiteral("%1 %2 [%3] %4")
		.arg(ts.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz")),
			 QString::fromLatin1(sysLogLevelName(e.level)),
			 e.tag, e.message);
	if (!e.extra.isEmpty()) line += QStringLiteral(" | ") + e.extra;
	return line;
}

namespace syslog_detail {
class SystemLogWriter : public QObject {
	Q_OBJECT
public slots:
	void append(const SystemLogEntry& e) {
		Logger::write(formatSystemLogLine(e).toStdString());
	}
};
} // namespace

SystemLogger& SystemLogger::instance() {
	static SystemLogger inst;
	return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init()
{
	auto& inst = instance();
	if (inst.th) return;

	qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	inst.th = new QThread;
	inst.th->setObjectName(QStringLiteral("SystemLogWriter"));
	inst.wr = new syslog_detail::SystemLogWriter;
	inst.wr->moveToThread(inst.th);

	QObject::connect(&inst, &SystemLogger::appendRequested,
					 inst.wr, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
	QObject::connect(inst.th, &QThread::finished, inst.wr, &QObject::deleteLater);
	inst.th->start();
}

bool SystemLogger::isInitialized() {
	return instance().th != nullptr;
}

void SystemLogger::shutdown() {
	auto& inst = instance();
	if (!inst.th) return;

	inst.th->quit();
	if (!inst.th->wait(3000)) {
		qWarning() << "[SystemLogger] writer thread did not stop, terminating";
		inst.th->terminate();
		inst.th->wait();
	}

	delete inst.th;
	inst.th = nullptr;
	inst.wr = nullptr;
}

static void post(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra) {
	SystemLogEntry e{lv, tag, msg, QDateTime::currentDateTime(), extra};
	// init 전이면 콘솔로만
	if (!SystemLogger::isInitialized()) {
		qDebug().noquote() << formatSystemLogLine(e);
		return;
	}
	emit SystemLogger::instance().appendRequested(e);
}
void SystemLogger::debug(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Debug, tag, msg, extra); }
void SystemLogger::info (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Info , tag, msg, extra); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Warn , tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Error, tag, msg, extra); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& extra){ post(SysLogLevel::Critical, tag, msg, extra); }

#include "SystemLogger.moc"
