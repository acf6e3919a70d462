#include "FrameCollector.hpp"
#include <algorithm>
#include <QElapsedTimer>
#include <QMutexLocker>
#include "log/log_categories.hpp"

qint64 FrameCollector::monotonicMs()
{
	static QElapsedTimer t = [] { QElapsedTimer e; e.start(); return e; }();
	return t.elapsed();
}

FrameCollector::FrameCollector(const CollectorParams& p, Clock clock)
	: p_(p), clock_(clock ? std::move(clock) : Clock(&FrameCollector::monotonicMs))
{
	if (p_.windowMs <= 0) p_.windowMs = verify::WINDOW_MS;
}

CollectResult FrameCollector::process(const FaceCandidate& candidate)
{
	QMutexLocker lk(&mtx_);
	const qint64 now = clock_();

	// 1) 창 열기 / 2) 더 좋은 후보만 교체 (동점은 유지)
	if (!startTime_) {
		startTime_ = now;
		best_ = candidate;
		qCDebug(LC_COLLECT) << "[OPEN] q=" << candidate.quality << "seq=" << candidate.image.seq;
	} else if (candidate.quality > best_->quality) {
		qCDebug(LC_COLLECT) << "[BEST]" << best_->quality << "->" << candidate.quality;
		best_ = candidate;
	}

	const qint64 elapsed = now - *startTime_;

	// 3) 즉시 채택 / 4) 창 만료
	const bool early   = candidate.quality >= p_.highWaterMark;
	const bool expired = elapsed >= p_.windowMs;
	if (early || expired) {
		CollectResult r;
		r.winner   = std::move(best_);
		r.progress = 1.0;
		qCDebug(LC_COLLECT) << "[WINNER]" << (early ? "high-water" : "window expired")
			<< "q=" << r.winner->quality << "elapsed=" << elapsed << "ms";
		resetLocked();
		return r;
	}

	// 5) 진행 중
	CollectResult r;
	r.progress = std::clamp(static_cast<double>(elapsed) / p_.windowMs, 0.0, 1.0);
	return r;
}

void FrameCollector::reset()
{
	QMutexLocker lk(&mtx_);
	resetLocked();
}

void FrameCollector::resetLocked()
{
	startTime_.reset();
	best_.reset();
}

bool FrameCollector::isCollecting() const
{
	QMutexLocker lk(&mtx_);
	return startTime_.has_value();
}

double FrameCollector::progress() const
{
	QMutexLocker lk(&mtx_);
	if (!startTime_) return 0.0;
	const qint64 elapsed = clock_() - *startTime_;
	return std::clamp(static_cast<double>(elapsed) / p_.windowMs, 0.0, 0.999);
}
