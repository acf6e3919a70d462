#pragma once
#include <QObject>
#include <QElapsedTimer>
#include <vector>
#include "include/states.hpp"

struct Transition {
	const char* name = "unnamed";			// 전환 식별용 이름
	VerificationStateKind from;
	VerificationStateKind to;
};

// 허용 전환 테이블 + 현재 상태 1개. 서비스(UI) 스레드에서만 사용.
class VerificationFsm : public QObject {
	Q_OBJECT
public:
	explicit VerificationFsm(QObject* parent = nullptr);

	void addTransition(const Transition& t);
	bool canTransition(VerificationStateKind from, VerificationStateKind to) const;

	// 허용된 전환이면 적용 후 stateChanged, 아니면 false (로그만)
	bool transition(const VerificationState& next);

	// 테이블 검사 없이 강제 설정 (stop/start 시 Detecting 복귀)
	void reset(const VerificationState& s = VerificationState::detecting());

	const VerificationState& current() const { return current_; }

signals:
	void stateChanged(const VerificationState& s);

private:
	VerificationState current_;
	QElapsedTimer enterTime_;
	std::vector<Transition> trans_;
};

// Detecting -> Processing -> {Matched | TimedOut | Error} -> Detecting
void setupVerificationFsm(VerificationFsm& fsm);
