#include "parking/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcEngine, "parking.engine")
Q_LOGGING_CATEGORY(lcCore, "parking.core")
Q_LOGGING_CATEGORY(lcData, "parking.data")
