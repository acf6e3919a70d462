#pragma once

// Qt
#include <QObject>
#include <QMutex>
#include <QString>
#include <QThread>

// STL
#include <atomic>
#include <memory>

#include "include/types.hpp"
#include "include/states.hpp"
#include "include/verify_params.hpp"
#include "analyze/FaceAnalyzer.hpp"
#include "collect/FrameCollector.hpp"
#include "process/FaceProcessor.hpp"
#include "net/VerificationClient.hpp"
#include "error/ErrorReporter.hpp"
#include "fsm/verification_fsm.hpp"
#include "util/CancelToken.hpp"

// 프레임 게이트 + 1-슬롯 워커 + 상태 머신.
//   onFrame()      : 카메라 스레드. 원자 게이트만 통과시키고 즉시 반환
//   runUnit()      : 워커 스레드. analyze -> collect -> (embed -> verify)
//   apply*/finish  : 서비스(UI) 스레드. 상태/진행률 변경은 여기서만
class VerificationService : public QObject {
	Q_OBJECT
public:
	struct Deps {
		std::shared_ptr<const IFaceAnalyzer>  analyzer;
		std::shared_ptr<const IFaceProcessor> processor;
		std::shared_ptr<IVerificationClient>  verifier;
		std::shared_ptr<IErrorReporter>       reporter;
	};

	explicit VerificationService(Deps deps,
								 const CollectorParams& params = {},
								 FrameCollector::Clock clock = {},
								 QObject* parent = nullptr);
	~VerificationService() override;

	// 검증 대상 직원 ID (비어 있으면 EMPLOYEE_NOT_FOUND). 세션 사이에 변경 가능
	void setEmployeeId(const QString& id);
	QString employeeId() const;

	// 세션 시작: 매칭 래치 해제 후 프레임 수신
	void start();

	// 진행 중인 작업 취소, 수집기 리셋, 진행률 0, Detecting
	void stop();

	// 카메라 스레드에서 호출 (스레드 안전, 블로킹 없음)
	void onFrame(const Frame& frame);

	// 서비스 스레드에서 읽기
	const VerificationState& state() const { return fsm_.current(); }
	double progress() const { return progress_; }

	bool isRunning() const { return running_.load(); }
	bool isBusy() const { return busy_.load() != kFree; }
	bool isMatched() const { return matched_.load(); }
	quint64 admittedFrames() const { return admitted_.load(); }
	quint64 droppedFrames() const { return dropped_.load(); }

signals:
	void stateChanged(const VerificationState& s);
	void progressChanged(double progress);
	void matched(const QString& employeeId);

private:
	// 워커 스레드
	void runUnit(const Frame& frame, quint64 gen, const CancelTokenPtr& token, const QString& employeeId);
	void failUnit(quint64 gen, const AppError& e);

	// 서비스 스레드로 전달 (세대가 바뀌었으면 버림)
	template <typename F>
	void postToService(quint64 gen, F&& fn);

	bool isStale(quint64 gen) const { return gen != generation_.load(); }
	void publish(const VerificationState& s);
	void setProgress(double p);
	void finishUnit();

private:
	Deps deps_;

	QThread worker_;
	std::unique_ptr<QObject> workerCtx_;		// worker_ 스레드 소속, invokeMethod 컨텍스트

	FrameCollector collector_;
	QMutex collectMtx_;							// 토큰 확인 + 수집기 조작을 stop() 과 직렬화

	VerificationFsm fsm_;
	double progress_ = 0.0;

	// 게이트 / 세션
	// busy_ : kFree 또는 (점유한 세대 + 1)
	static constexpr quint64 kFree = 0;
	std::atomic<quint64> busy_{kFree};
	std::atomic<bool> running_{false};
	std::atomic<bool> matched_{false};
	std::atomic<quint64> generation_{0};
	std::atomic<quint64> admitted_{0};
	std::atomic<quint64> dropped_{0};

	mutable QMutex unitMtx_;					// currentToken_, employeeId_, 세션 플래그 변경
	CancelTokenPtr currentToken_;
	QString employeeId_;
};
