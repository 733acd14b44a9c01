#pragma once

// Default locations, relative to the working directory unless overridden by config
#define KIOSK_DATA_DIR							"data/"
#define KIOSK_DB								KIOSK_DATA_DIR "attendance.db"

#define KIOSK_LOG_DIR							"logs/"
#define KIOSK_LOG_FILE							"kiosk.log"

#define KIOSK_CONFIG_ENV						"KIOSK_CONFIG"
