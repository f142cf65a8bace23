#include "VantageLogging.hpp"

Q_LOGGING_CATEGORY(logApp, "vantage.app")
Q_LOGGING_CATEGORY(logData, "vantage.data")
Q_LOGGING_CATEGORY(logRender, "vantage.render")
Q_LOGGING_CATEGORY(logDebug, "vantage.debug", QtWarningMsg)
