#include "VerificationPresenter.hpp"
#include <QDebug>
#include <cmath>
#include "services/VerificationService.hpp"
#include "error/ErrorReporter.hpp"

// === ConsoleVerificationView ===

void ConsoleVerificationView::showStatusMessage(const QString& msg)
{
	qInfo().noquote() << "[Status]" << msg;
}

void ConsoleVerificationView::showProgress(double progress)
{
	const int pct = static_cast<int>(std::lround(progress * 100.0));
	if (pct == lastPct_) return;
	lastPct_ = pct;
	if (pct > 0) qInfo().noquote() << "[Progress]" << pct << "%";
}

void ConsoleVerificationView::showError(const QString& msg)
{
	qWarning().noquote() << "[Error]" << msg;
}

// === VerificationPresenter ===

VerificationPresenter::VerificationPresenter(VerificationService* service, ErrorReporter* reporter,
											 IVerificationView* view, QObject* parent)
	: QObject(parent), service_(service), view_(view)
{
	if (service) {
		connect(service, &VerificationService::stateChanged, this, &VerificationPresenter::onStateChanged);
		connect(service, &VerificationService::progressChanged, this, &VerificationPresenter::onProgressChanged);
	}
	if (reporter) {
		connect(reporter, &ErrorReporter::errorRaised, this, &VerificationPresenter::onErrorRaised);
	}
}

QString VerificationPresenter::statusMessage(const VerificationState& s)
{
	switch (s.kind) {
		case VerificationStateKind::DETECTING:
			return QStringLiteral("얼굴을 카메라에 맞춰 주세요...");
		case VerificationStateKind::PROCESSING:
			return QStringLiteral("확인 중...");
		case VerificationStateKind::MATCHED:
			return QStringLiteral("인증 성공: %1").arg(s.name);
		case VerificationStateKind::TIMED_OUT:
			return QStringLiteral("서버 응답 시간 초과");
		case VerificationStateKind::ERROR:
			return QStringLiteral("인증 실패 (%1)").arg(QString::fromStdString(toBackendString(s.reason)));
	}
	return QStringLiteral("현재 상태를 알 수 없습니다...");
}

void VerificationPresenter::onStateChanged(const VerificationState& s)
{
	if (!view_) return;
	view_->showStatusMessage(statusMessage(s));
}

void VerificationPresenter::onProgressChanged(double p)
{
	if (!view_) return;
	view_->showProgress(p);
}

void VerificationPresenter::onErrorRaised(ErrorCode code, const QString& msg)
{
	Q_UNUSED(code);
	if (!view_) return;
	view_->showError(msg);
}
