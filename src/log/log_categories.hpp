#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(LC_GATE)		// verify.gate    : 프레임 게이트 (admit/drop)
Q_DECLARE_LOGGING_CATEGORY(LC_COLLECT)	// verify.collect : 수집 창
Q_DECLARE_LOGGING_CATEGORY(LC_FSM)		// verify.fsm     : 상태 전환
Q_DECLARE_LOGGING_CATEGORY(LC_NET)		// verify.net     : 서버 검증 요청
