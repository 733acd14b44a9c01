#include "log/log_categories.hpp"

Q_LOGGING_CATEGORY(LC_FSM,		"kiosk.fsm")
Q_LOGGING_CATEGORY(LC_STORE,	"kiosk.store")
Q_LOGGING_CATEGORY(LC_SYNC,		"kiosk.sync")
Q_LOGGING_CATEGORY(LC_NET,		"kiosk.net")
Q_LOGGING_CATEGORY(LC_PIPELINE,	"kiosk.pipeline")
Q_LOGGING_CATEGORY(LC_CONFIG,	"kiosk.config")
