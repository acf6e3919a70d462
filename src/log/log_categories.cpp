#include "log/log_categories.hpp"

Q_LOGGING_CATEGORY(LC_GATE,    "verify.gate")
Q_LOGGING_CATEGORY(LC_COLLECT, "verify.collect")
Q_LOGGING_CATEGORY(LC_FSM,     "verify.fsm")
Q_LOGGING_CATEGORY(LC_NET,     "verify.net")
