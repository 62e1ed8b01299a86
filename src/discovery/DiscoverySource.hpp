#pragma once
#include <QString>
#include <QVector>

#include "include/types.hpp"

struct DiscoveryReport {
	QVector<DiscoveredDevice>	devices;
	QString						method;		// stored as scans.scan_method
};

// Produces the set of hosts currently visible on the segment
class DiscoverySource {
public:
	virtual ~DiscoverySource() = default;

	// false (with *error) when the source could not be read at all
	virtual bool scan(DiscoveryReport* out, QString* error) = 0;
};
