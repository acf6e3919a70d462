#include "verification_fsm.hpp"
#include "log/log_categories.hpp"

using K = VerificationStateKind;

VerificationFsm::VerificationFsm(QObject* parent) : QObject(parent)
{
	enterTime_.start();
}

void VerificationFsm::addTransition(const Transition& t)
{
	trans_.push_back(t);
}

bool VerificationFsm::canTransition(K from, K to) const
{
	for (const auto& t : trans_) {
		if (t.from == from && t.to == to) return true;
	}
	return false;
}

bool VerificationFsm::transition(const VerificationState& next)
{
	if (next == current_) return true;	// 동일 상태 재발행은 무시

	const Transition* hit = nullptr;
	for (const auto& t : trans_) {
		if (t.from == current_.kind && t.to == next.kind) { hit = &t; break; }
	}

	if (!hit) {
		qCWarning(LC_FSM) << "[REJECT]" << current_.toString() << "->" << next.toString();
		return false;
	}

	qCDebug(LC_FSM) << "[EXIT]" << current_.toString()
		<< "after dwell=" << enterTime_.elapsed() << "ms";

	current_ = next;
	enterTime_.restart();

	qCDebug(LC_FSM) << "[ENTER]" << current_.toString() << "via" << hit->name;

	emit stateChanged(current_);
	return true;
}

void VerificationFsm::reset(const VerificationState& s)
{
	if (s == current_) return;

	qCDebug(LC_FSM) << "[RESET]" << current_.toString() << "->" << s.toString();
	current_ = s;
	enterTime_.restart();
	emit stateChanged(current_);
}

void setupVerificationFsm(VerificationFsm& fsm)
{
	fsm.addTransition({ "detect->process",  K::DETECTING,  K::PROCESSING });
	fsm.addTransition({ "process->matched", K::PROCESSING, K::MATCHED });
	fsm.addTransition({ "process->timeout", K::PROCESSING, K::TIMED_OUT });
	fsm.addTransition({ "process->error",   K::PROCESSING, K::ERROR });
	fsm.addTransition({ "timeout->detect",  K::TIMED_OUT,  K::DETECTING });
	fsm.addTransition({ "error->detect",    K::ERROR,      K::DETECTING });
	fsm.addTransition({ "matched->detect",  K::MATCHED,    K::DETECTING });	// 다음 세션 시작
}
