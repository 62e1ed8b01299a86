#pragma once
#include <QDateTime>
#include <QMutex>
#include <QVector>

#include "include/types.hpp"

// Copy of the scanner state handed to readers
struct ScanSnapshot {
	QVector<TrackedDevice>	devices;
	QDateTime				lastScan;
	QDateTime				nextScan;
	bool					scanning = false;
	int						scanInterval = 0;		// seconds
};

// Scanner state shared between the scan path and the query paths.
// Readers get copies; writers hold the lock only for the swap.
class ScannerContext {
public:
	explicit ScannerContext(int scanIntervalSec);

	ScanSnapshot snapshot() const;
	QVector<TrackedDevice> previous() const;

	bool isScanning() const;
	int scanInterval() const;
	QDateTime nextScan() const;

	// false when a cycle is already marked in flight
	bool beginScan();

	// Replaces previous/current with the cycle output. advanceSchedule sets
	// next_scan = now + scan_interval (scheduled cycles only).
	void commitScan(const QVector<TrackedDevice>& devices, const QDateTime& now, bool advanceSchedule);

	// Failed cycle: tracked state is left as it was
	void abortScan(const QDateTime& now, bool advanceSchedule);

	void seedPrevious(const QVector<TrackedDevice>& devices);
	void setScanInterval(int sec);
	void setNextScan(const QDateTime& t);

private:
	mutable QMutex			mutex_;
	QVector<TrackedDevice>	previous_;
	QVector<TrackedDevice>	current_;
	QDateTime				lastScan_;
	QDateTime				nextScan_;
	bool					scanning_ = false;
	int						scanInterval_;
};
