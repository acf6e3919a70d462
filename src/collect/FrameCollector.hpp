#pragma once
#include <functional>
#include <optional>
#include <QMutex>
#include <QtGlobal>
#include "include/types.hpp"
#include "include/verify_params.hpp"

// 짧은 시간 창 동안 후보를 모아 가장 품질 좋은 1개를 고른다.
//   - 창이 없으면 첫 후보로 창을 연다
//   - quality >= highWaterMark 이면 즉시 채택
//   - 경과 >= windowMs 이면 지금까지의 best 채택
// startTime 과 best 는 항상 같이 있거나 같이 없다.
class FrameCollector {
public:
	using Clock = std::function<qint64()>;		// 단조 시간(ms)

	explicit FrameCollector(const CollectorParams& p = {}, Clock clock = {});

	CollectResult process(const FaceCandidate& candidate);
	void reset();

	bool isCollecting() const;
	double progress() const;		// 현재 창 진행률 [0,1), 창이 없으면 0

	const CollectorParams& params() const { return p_; }

	// 기본 시계: QElapsedTimer 기준 단조 ms
	static qint64 monotonicMs();

private:
	void resetLocked();

	CollectorParams p_;
	Clock clock_;

	mutable QMutex mtx_;
	std::optional<qint64> startTime_;
	std::optional<FaceCandidate> best_;
};
