#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(LC_FSM)
Q_DECLARE_LOGGING_CATEGORY(LC_STORE)
Q_DECLARE_LOGGING_CATEGORY(LC_SYNC)
Q_DECLARE_LOGGING_CATEGORY(LC_NET)
Q_DECLARE_LOGGING_CATEGORY(LC_PIPELINE)
Q_DECLARE_LOGGING_CATEGORY(LC_CONFIG)
