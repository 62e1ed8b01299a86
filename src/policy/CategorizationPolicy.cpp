#include "policy/CategorizationPolicy.hpp"
#include <QtCore/QDebug>

#include "log/lanwatch_logging.hpp"

double CategorizationPolicy::appearanceRate(int totalScans, int scansSeenOnline)
{
	if (totalScans <= 0) return 0.0;
	return static_cast<double>(scansSeenOnline) / static_cast<double>(totalScans);
}

int CategorizationPolicy::ratePercent(double rate)
{
	return qRound(rate * 100.0);
}

CategoryDecision CategorizationPolicy::classify(int totalScans, int scansSeenOnline, int consecutiveOffline,
												bool online, int recentStreak) const
{
	const double rate = appearanceRate(totalScans, scansSeenOnline);
	const int pct = ratePercent(rate);

	if (!online) {
		if (totalScans == 0)
			return { DeviceCategory::Offline, QStringLiteral("offline with no history") };

		qCDebug(LC_ENGINE) << "[classify] offline total=" << totalScans
						   << "rate=" << rate << "missedStreak=" << consecutiveOffline;
		return { DeviceCategory::Offline,
				 QStringLiteral("offline (historically %1% appearance)").arg(pct) };
	}

	// 최우선: 관측 횟수가 적으면 무조건 new
	if (totalScans <= p_.newDeviceMaxScans)
		return { DeviceCategory::New, QStringLiteral("new device (seen %1 times)").arg(totalScans) };

	// 최근 연속 온라인 보너스
	if (recentStreak >= p_.streakMinScans && totalScans >= p_.streakMinTotal && rate >= p_.streakMinRate)
		return { DeviceCategory::Regular,
				 QStringLiteral("regular device (recent streak: %1 scans, %2% historical)").arg(recentStreak).arg(pct) };

	if (rate >= p_.regularRate)
		return { DeviceCategory::Regular, QStringLiteral("regular device (%1% appearance)").arg(pct) };

	if (rate >= p_.occasionalRate)
		return { DeviceCategory::Occasional, QStringLiteral("occasional device (%1% appearance)").arg(pct) };

	return { DeviceCategory::Rare, QStringLiteral("rare device (%1% appearance)").arg(pct) };
}

CategoryDecision CategorizationPolicy::classify(const std::optional<Device>& history, bool online) const
{
	if (!history)
		return { DeviceCategory::New, QStringLiteral("new device (no history)") };

	return classify(history->totalScans, history->scansSeenOnline, history->consecutiveOffline,
					online, online ? history->consecutiveOnline : 0);
}
