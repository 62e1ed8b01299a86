#pragma once
#include <QObject>
#include <QString>

namespace States {
	enum class ScanTrigger { Scheduled, Manual };
}

// Per-cycle badge of a tracked device
enum class DeviceStatus {
	New,			// not in the previous tracked set
	Existing,		// tracked before (including devices inside the grace window)
	Offline			// missed grace_scans cycles or more
};

// Familiarity derived from history
enum class DeviceCategory {
	New = 0,
	Regular,
	Occasional,
	Rare,
	Offline
};

inline QString deviceStatusName(DeviceStatus s)
{
	switch (s) {
		case DeviceStatus::New:			return QStringLiteral("new");
		case DeviceStatus::Existing:	return QStringLiteral("existing");
		case DeviceStatus::Offline:		return QStringLiteral("offline");
	}
	return QStringLiteral("existing");
}

inline QString deviceCategoryName(DeviceCategory c)
{
	switch (c) {
		case DeviceCategory::New:			return QStringLiteral("new");
		case DeviceCategory::Regular:		return QStringLiteral("regular");
		case DeviceCategory::Occasional:	return QStringLiteral("occasional");
		case DeviceCategory::Rare:			return QStringLiteral("rare");
		case DeviceCategory::Offline:		return QStringLiteral("offline");
	}
	return QStringLiteral("new");
}

inline DeviceCategory deviceCategoryFromName(const QString& s)
{
	if (s == QLatin1String("regular"))		return DeviceCategory::Regular;
	if (s == QLatin1String("occasional"))	return DeviceCategory::Occasional;
	if (s == QLatin1String("rare"))			return DeviceCategory::Rare;
	if (s == QLatin1String("offline"))		return DeviceCategory::Offline;
	return DeviceCategory::New;
}

inline QString scanTriggerName(States::ScanTrigger t)
{
	return t == States::ScanTrigger::Manual ? QStringLiteral("manual") : QStringLiteral("scheduled");
}

Q_DECLARE_METATYPE(States::ScanTrigger)
Q_DECLARE_METATYPE(DeviceStatus)
Q_DECLARE_METATYPE(DeviceCategory)
