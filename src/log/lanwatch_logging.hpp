#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(LC_SCAN)		// scan cycle / orchestrator
Q_DECLARE_LOGGING_CATEGORY(LC_ENGINE)	// reconciliation decisions
Q_DECLARE_LOGGING_CATEGORY(LC_STORE)	// sqlite history store
Q_DECLARE_LOGGING_CATEGORY(LC_HUB)		// broadcast + subscriber transport
Q_DECLARE_LOGGING_CATEGORY(LC_NET)		// discovery + port probing
