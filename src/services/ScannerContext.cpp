#include "services/ScannerContext.hpp"
#include <QMutexLocker>

ScannerContext::ScannerContext(int scanIntervalSec)
	: scanInterval_(scanIntervalSec)
{}

ScanSnapshot ScannerContext::snapshot() const
{
	QMutexLocker lk(&mutex_);
	ScanSnapshot s;
	s.devices      = current_;
	s.lastScan     = lastScan_;
	s.nextScan     = nextScan_;
	s.scanning     = scanning_;
	s.scanInterval = scanInterval_;
	return s;
}

QVector<TrackedDevice> ScannerContext::previous() const
{
	QMutexLocker lk(&mutex_);
	return previous_;
}

bool ScannerContext::isScanning() const
{
	QMutexLocker lk(&mutex_);
	return scanning_;
}

int ScannerContext::scanInterval() const
{
	QMutexLocker lk(&mutex_);
	return scanInterval_;
}

QDateTime ScannerContext::nextScan() const
{
	QMutexLocker lk(&mutex_);
	return nextScan_;
}

bool ScannerContext::beginScan()
{
	QMutexLocker lk(&mutex_);
	if (scanning_) return false;
	scanning_ = true;
	return true;
}

void ScannerContext::commitScan(const QVector<TrackedDevice>& devices, const QDateTime& now, bool advanceSchedule)
{
	QMutexLocker lk(&mutex_);
	previous_ = devices;
	current_  = devices;
	lastScan_ = now;
	if (advanceSchedule) nextScan_ = now.addSecs(scanInterval_);
	scanning_ = false;
}

void ScannerContext::abortScan(const QDateTime& now, bool advanceSchedule)
{
	QMutexLocker lk(&mutex_);
	if (advanceSchedule) nextScan_ = now.addSecs(scanInterval_);
	scanning_ = false;
}

void ScannerContext::seedPrevious(const QVector<TrackedDevice>& devices)
{
	QMutexLocker lk(&mutex_);
	previous_ = devices;
}

void ScannerContext::setScanInterval(int sec)
{
	QMutexLocker lk(&mutex_);
	scanInterval_ = sec;
}

void ScannerContext::setNextScan(const QDateTime& t)
{
	QMutexLocker lk(&mutex_);
	nextScan_ = t;
}
