#include "lanwatch_logging.hpp"

Q_LOGGING_CATEGORY(LC_SCAN,   "lanwatch.scan")
Q_LOGGING_CATEGORY(LC_ENGINE, "lanwatch.engine")
Q_LOGGING_CATEGORY(LC_STORE,  "lanwatch.store")
Q_LOGGING_CATEGORY(LC_HUB,    "lanwatch.hub")
Q_LOGGING_CATEGORY(LC_NET,    "lanwatch.net")
