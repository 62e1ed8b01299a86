#pragma once

namespace scan {
	inline constexpr int	NEW_DEVICE_MAX_SCANS	= 3;
	inline constexpr int	STREAK_MIN_SCANS		= 15;
	inline constexpr int	STREAK_MIN_TOTAL		= 20;
	inline constexpr double	STREAK_MIN_RATE			= 0.40;
	inline constexpr double	REGULAR_RATE			= 0.65;
	inline constexpr double	OCCASIONAL_RATE			= 0.30;

	inline constexpr int	LOG_LIMIT_DEFAULT		= 100;
	inline constexpr int	LOG_LIMIT_MAX			= 1000;
	inline constexpr int	ACTIVE_WINDOW_SEC		= 24 * 60 * 60;

	// QTimer takes milliseconds in an int
	inline constexpr int	SCAN_INTERVAL_MAX_SEC	= 24 * 60 * 60;

	// request lines longer than this drop the client
	inline constexpr int	MAX_REQUEST_LINE_BYTES	= 64 * 1024;
}
