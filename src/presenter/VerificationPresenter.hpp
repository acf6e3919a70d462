#pragma once
#include <QObject>
#include <QPointer>
#include <QString>
#include "include/states.hpp"
#include "error/AppError.hpp"

class VerificationService;
class ErrorReporter;

// 화면(또는 콘솔) 추상화
class IVerificationView {
public:
	virtual ~IVerificationView() = default;
	virtual void showStatusMessage(const QString& msg) = 0;
	virtual void showProgress(double progress) = 0;		// [0,1]
	virtual void showError(const QString& msg) = 0;
};

// 콘솔 출력 뷰 (qInfo)
class ConsoleVerificationView : public IVerificationView {
public:
	void showStatusMessage(const QString& msg) override;
	void showProgress(double progress) override;
	void showError(const QString& msg) override;

private:
	int lastPct_ = -1;
};

class VerificationPresenter : public QObject {
	Q_OBJECT
public:
	VerificationPresenter(VerificationService* service, ErrorReporter* reporter,
						  IVerificationView* view, QObject* parent = nullptr);

	static QString statusMessage(const VerificationState& s);

private:
	void onStateChanged(const VerificationState& s);
	void onProgressChanged(double p);
	void onErrorRaised(ErrorCode code, const QString& msg);

	QPointer<VerificationService> service_;
	IVerificationView* view_;
};
