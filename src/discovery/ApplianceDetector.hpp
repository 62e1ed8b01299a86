#pragma once
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

// Whether a host is a DNS filtering appliance (ad-blocking resolver with
// a web admin page). Open ports only make a candidate; the admin page
// has to answer before the hint counts as confirmed.
struct ApplianceHint {
	bool	detected = false;
	QString	kind;				// "dns_filter"
	double	confidence = 0.0;	// 0..1
	QString	reason;

	bool	confirmed = false;
	QString	protocol;			// "https" | "http" once confirmed
	QString	adminUrl;
	QString	apiUrl;				// endpoint that answered

	QJsonObject toJson() const;
};

class ApplianceDetector {
public:
	explicit ApplianceDetector(int timeoutMs = 5000);

	// DNS plus HTTP and/or HTTPS open, nothing else counts
	ApplianceHint fromPorts(const QVector<int>& openPorts) const;

	// fromPorts() followed by the admin page check. Blocks for up to
	// timeoutMs per endpoint, so call it off the main thread.
	ApplianceHint detect(const QString& address, const QVector<int>& openPorts) const;

	void setTimeoutMs(int ms) { timeoutMs_ = ms; }
	int timeoutMs() const { return timeoutMs_; }

	// Where the web admin is looked for (80/443 unless overridden)
	void setWebPorts(int httpPort, int httpsPort) { httpPort_ = httpPort; httpsPort_ = httpsPort; }

	static QStringList endpoints();

private:
	bool confirmOver(const QString& scheme, const QString& address, int port, ApplianceHint* h) const;

	int timeoutMs_;
	int httpPort_  = 80;
	int httpsPort_ = 443;
};
