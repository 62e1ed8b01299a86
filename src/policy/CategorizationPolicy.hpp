#pragma once
#include <optional>
#include <QString>
#include "include/types.hpp"
#include "include/scan_params.hpp"

// 분류 임계값(필요시 setParams로 변경 가능)
struct CategorizationParams {
	int		newDeviceMaxScans = scan::NEW_DEVICE_MAX_SCANS;	// 이 이하면 new
	int		streakMinScans    = scan::STREAK_MIN_SCANS;		// 연속 온라인 보너스 조건
	int		streakMinTotal    = scan::STREAK_MIN_TOTAL;
	double	streakMinRate     = scan::STREAK_MIN_RATE;
	double	regularRate       = scan::REGULAR_RATE;
	double	occasionalRate    = scan::OCCASIONAL_RATE;
};

struct CategoryDecision {
	DeviceCategory	category = DeviceCategory::New;
	QString			reason;
};

class CategorizationPolicy {
public:
	CategorizationPolicy() = default;
	explicit CategorizationPolicy(const CategorizationParams& p): p_(p) {}

	// recentStreak is ignored when offline
	CategoryDecision classify(int totalScans, int scansSeenOnline, int consecutiveOffline,
							  bool online, int recentStreak = 0) const;

	// Absent history is a new device, never an error
	CategoryDecision classify(const std::optional<Device>& history, bool online) const;

	static double appearanceRate(int totalScans, int scansSeenOnline);
	static int ratePercent(double rate);

	const CategorizationParams& params() const { return p_; }
	void setParams(const CategorizationParams& p) { p_ = p; }

private:
	CategorizationParams p_;
};
