#include "VerificationService.hpp"
#include <QDebug>
#include <QMetaObject>
#include <QMutexLocker>
#include "log/log_categories.hpp"
#include "log/SystemLogger.hpp"

namespace {
constexpr quint64 kDropLogEvery = 30;		// 드롭 로그 간격(프레임)
}

VerificationService::VerificationService(Deps deps,
										 const CollectorParams& params,
										 FrameCollector::Clock clock,
										 QObject* parent)
	: QObject(parent),
	  deps_(std::move(deps)),
	  workerCtx_(std::make_unique<QObject>()),
	  collector_(params, std::move(clock))
{
	qRegisterMetaType<VerificationState>("VerificationState");
	qRegisterMetaType<Frame>("Frame");

	setupVerificationFsm(fsm_);
	connect(&fsm_, &VerificationFsm::stateChanged, this, &VerificationService::stateChanged);

	worker_.setObjectName(QStringLiteral("VerificationWorker"));
	workerCtx_->moveToThread(&worker_);
	worker_.start();

	qDebug() << "[VerificationService] ctor, window=" << collector_.params().windowMs << "ms"
			 << "highWater=" << collector_.params().highWaterMark;
}

VerificationService::~VerificationService()
{
	stop();
	worker_.quit();
	worker_.wait();
	workerCtx_.reset();
}

void VerificationService::setEmployeeId(const QString& id)
{
	QMutexLocker lk(&unitMtx_);
	employeeId_ = id;
}

QString VerificationService::employeeId() const
{
	QMutexLocker lk(&unitMtx_);
	return employeeId_;
}

// ============================================================
// === 세션 제어 (서비스 스레드) ===
// ============================================================

void VerificationService::start()
{
	{
		QMutexLocker lk(&unitMtx_);
		matched_.store(false);
		running_.store(true);
	}
	fsm_.reset(VerificationState::detecting());
	setProgress(0.0);

	qInfo() << "[VerificationService] start, employee=" << employeeId();
	SystemLogger::info("VRS", "session started", employeeId());
}

void VerificationService::stop()
{
	{
		QMutexLocker lk(&unitMtx_);
		running_.store(false);
		generation_.fetch_add(1);				// 진행 중 작업의 결과는 모두 stale
		if (currentToken_) {
			currentToken_->cancel();
			currentToken_.reset();
		}
		busy_.store(kFree);
	}
	{
		QMutexLocker lk(&collectMtx_);
		collector_.reset();
	}

	setProgress(0.0);
	fsm_.reset(VerificationState::detecting());

	qDebug() << "[VerificationService] stop, admitted=" << admitted_.load()
			 << "dropped=" << dropped_.load();
}

// ============================================================
// === 프레임 게이트 (카메라 스레드) ===
// ============================================================

void VerificationService::onFrame(const Frame& frame)
{
	if (!running_.load() || matched_.load()) return;

	const quint64 seen = generation_.load();
	quint64 expected = kFree;
	if (!busy_.compare_exchange_strong(expected, seen + 1)) {
		const quint64 n = dropped_.fetch_add(1) + 1;
		if (n % kDropLogEvery == 0)
			qCDebug(LC_GATE) << "[DROP] busy, total dropped=" << n;
		return;
	}

	const quint64 gen = seen;
	CancelTokenPtr token;
	QString employeeId;
	{
		QMutexLocker lk(&unitMtx_);
		// 점유와 잠금 사이에 stop() (+ start()) 이 끼어든 경우: 우리 표식일 때만 해제
		if (generation_.load() != seen) {
			quint64 mine = seen + 1;
			busy_.compare_exchange_strong(mine, kFree);
			return;
		}
		if (!running_.load() || matched_.load()) {
			busy_.store(kFree);
			return;
		}
		token = std::make_shared<CancelToken>();
		currentToken_ = token;
		employeeId = employeeId_;
	}

	admitted_.fetch_add(1);
	qCDebug(LC_GATE) << "[ADMIT] seq=" << frame.seq << "gen=" << gen;

	Frame f = frame;		// cv::Mat 은 참조 카운트 복사
	QMetaObject::invokeMethod(workerCtx_.get(), [this, f, gen, token, employeeId] {
		runUnit(f, gen, token, employeeId);
	}, Qt::QueuedConnection);
}

// ============================================================
// === 작업 단위 (워커 스레드) ===
// ============================================================

template <typename F>
void VerificationService::postToService(quint64 gen, F&& fn)
{
	QMetaObject::invokeMethod(this, [this, gen, fn = std::forward<F>(fn)]() mutable {
		if (isStale(gen)) {
			qCDebug(LC_GATE) << "[STALE] result of gen" << gen << "discarded";
			return;
		}
		fn();
	}, Qt::QueuedConnection);
}

void VerificationService::runUnit(const Frame& frame, quint64 gen, const CancelTokenPtr& token,
								  const QString& employeeId)
{
	if (token->isCancelled()) return;

	// === 1) Analyze ===
	std::optional<AnalysisResult> analysis;
	try {
		analysis = deps_.analyzer->analyze(frame);
	} catch (const std::exception& e) {
		qWarning() << "[VerificationService] analyzer threw:" << e.what();
		analysis.reset();
	}

	if (!analysis) {
		{
			QMutexLocker lk(&collectMtx_);
			if (token->isCancelled()) return;
			collector_.reset();
		}
		postToService(gen, [this] {
			setProgress(0.0);
			publish(VerificationState::detecting());
			finishUnit();
		});
		return;
	}

	// === 2) Collect ===
	CollectResult cr;
	{
		QMutexLocker lk(&collectMtx_);
		if (token->isCancelled()) return;
		cr = collector_.process(FaceCandidate{ analysis->face, frame, analysis->quality });
	}

	if (!cr.winner) {
		const double p = cr.progress;
		postToService(gen, [this, p] {
			setProgress(p);
			publish(VerificationState::detecting());
			finishUnit();
		});
		return;
	}

	// === 3) Winner -> Processing ===
	postToService(gen, [this] {
		setProgress(0.0);
		publish(VerificationState::processing());
	});

	try {
		if (employeeId.isEmpty()) {
			throw AppError(ErrorCode::EmployeeNotFound, "no target employee id");
		}

		token->throwIfCancelled();
		const Embedding embedding = deps_.processor->process(cr.winner->image, cr.winner->face);

		token->throwIfCancelled();
		deps_.verifier->verify(employeeId, embedding, token);

		token->throwIfCancelled();
	} catch (const AppError& e) {
		// stop() 으로 취소된 단위만 조용히 끝낸다 (busy_ 는 stop() 이 해제)
		if (token->isCancelled() || isStale(gen)) {
			qDebug() << "[VerificationService] unit gen" << gen << "cancelled";
			return;
		}
		if (e.code() == ErrorCode::Cancelled) {
			failUnit(gen, AppError(ErrorCode::Unknown, "unexpected cancel: " + e.debugMessage()));
			return;
		}
		failUnit(gen, e);
		return;
	} catch (const cv::Exception& e) {
		failUnit(gen, AppError(ErrorCode::Unknown, e.what()));
		return;
	} catch (const std::exception& e) {
		failUnit(gen, AppError(ErrorCode::Unknown, e.what()));
		return;
	}

	// === 4) Matched ===
	postToService(gen, [this, employeeId] {
		matched_.store(true);
		publish(VerificationState::matched(employeeId));
		SystemLogger::info("VRS", "matched", employeeId);
		emit matched(employeeId);
		finishUnit();
	});
}

void VerificationService::failUnit(quint64 gen, const AppError& e)
{
	qWarning() << "[VerificationService] unit failed:" << e.what();

	postToService(gen, [this, e] {
		if (deps_.reporter) deps_.reporter->report(e);

		if (e.code() == ErrorCode::RequestTimedOut)
			publish(VerificationState::timedOut());
		else
			publish(VerificationState::error(e.code()));

		publish(VerificationState::detecting());
		finishUnit();
	});
}

// ============================================================
// === 상태 반영 (서비스 스레드) ===
// ============================================================

void VerificationService::publish(const VerificationState& s)
{
	if (!fsm_.transition(s)) {
		qWarning() << "[VerificationService] transition rejected:"
				   << fsm_.current().toString() << "->" << s.toString();
	}
}

void VerificationService::setProgress(double p)
{
	if (p == progress_) return;
	progress_ = p;
	emit progressChanged(progress_);
}

void VerificationService::finishUnit()
{
	{
		QMutexLocker lk(&unitMtx_);
		currentToken_.reset();
	}
	busy_.store(kFree);
}
