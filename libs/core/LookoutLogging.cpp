#include "LookoutLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "lookout.app")         // Application: lifecycle, config, credentials
Q_LOGGING_CATEGORY(logData, "lookout.data")       // Data: WebSocket, codec, projection updates
Q_LOGGING_CATEGORY(logDebug, "lookout.debug", QtWarningMsg)   // Debug: off unless enabled by rules
