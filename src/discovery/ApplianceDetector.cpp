#include "discovery/ApplianceDetector.hpp"
#include <QEventLoop>
#include <QHostAddress>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#if QT_CONFIG(ssl)
#include <QSslError>
#endif
#include <QTimer>
#include <QUrl>
#include <QDebug>

#include "log/lanwatch_logging.hpp"

namespace {

// 관리 API가 돌려주는 JSON 키
const char* const kJsonIndicators[] = {
	"gravity_last_updated", "domains_being_blocked", "dns_queries_today", "ads_blocked_today", "status"
};

const char* const kHtmlMarkers[] = { "pi-hole", "pihole", "pi.hole" };

bool fetch(QNetworkAccessManager& nam, const QUrl& url, int timeoutMs, QByteArray* body, QString* contentType)
{
	QNetworkRequest req(url);
	req.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("lanwatch/1.0"));
	req.setTransferTimeout(timeoutMs);

	QNetworkReply* reply = nam.get(req);
#if QT_CONFIG(ssl)
	// appliances ship self-signed certificates
	QObject::connect(reply, &QNetworkReply::sslErrors, reply,
					 [reply](const QList<QSslError>&) { reply->ignoreSslErrors(); });
#endif

	QEventLoop loop;
	QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
	QTimer::singleShot(timeoutMs, reply, &QNetworkReply::abort);
	if (!reply->isFinished()) loop.exec();

	const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
	const bool ok = reply->error() == QNetworkReply::NoError && status == 200;
	if (ok) {
		*body        = reply->readAll();
		*contentType = reply->header(QNetworkRequest::ContentTypeHeader).toString().toLower();
	} else {
		qCDebug(LC_NET).noquote() << "[fetch]" << url.toString() << "status" << status << reply->errorString();
	}
	delete reply;
	return ok;
}

bool looksLikeAdmin(const QByteArray& body, const QString& contentType)
{
	if (contentType.contains(QLatin1String("application/json"))) {
		const QJsonObject o = QJsonDocument::fromJson(body).object();
		for (const char* key : kJsonIndicators) {
			if (o.contains(QLatin1String(key))) return true;
		}
		return false;
	}
	if (contentType.contains(QLatin1String("text/html"))) {
		const QByteArray lower = body.toLower();
		for (const char* marker : kHtmlMarkers) {
			if (lower.contains(marker)) return true;
		}
	}
	return false;
}

QString baseUrl(const QString& scheme, const QString& address, int port)
{
	QUrl u;
	u.setScheme(scheme);
	u.setHost(address);
	const int standard = scheme == QLatin1String("https") ? 443 : 80;
	if (port != standard) u.setPort(port);
	return u.toString();
}

} // namespace

ApplianceDetector::ApplianceDetector(int timeoutMs)
	: timeoutMs_(timeoutMs)
{}

QStringList ApplianceDetector::endpoints()
{
	return {
		QStringLiteral("/admin/api.php"),
		QStringLiteral("/admin/api.php?summary"),
		QStringLiteral("/admin/api.php?status"),
		QStringLiteral("/api/stats"),
		QStringLiteral("/api/summary"),
		QStringLiteral("/admin/")
	};
}

ApplianceHint ApplianceDetector::fromPorts(const QVector<int>& openPorts) const
{
	const bool dns   = openPorts.contains(53);
	const bool http  = openPorts.contains(httpPort_);
	const bool https = openPorts.contains(httpsPort_);

	ApplianceHint h;
	if (!dns || (!http && !https)) return h;

	h.detected   = true;
	h.kind       = QStringLiteral("dns_filter");
	h.confidence = (http && https) ? 0.5 : 0.4;
	h.reason     = QStringLiteral("DNS with web admin (%1), not confirmed")
					   .arg(http && https ? QStringLiteral("HTTP+HTTPS")
										  : http ? QStringLiteral("HTTP") : QStringLiteral("HTTPS"));
	return h;
}

ApplianceHint ApplianceDetector::detect(const QString& address, const QVector<int>& openPorts) const
{
	ApplianceHint h = fromPorts(openPorts);
	if (!h.detected || QHostAddress(address).isNull()) return h;

	if (openPorts.contains(httpsPort_) && confirmOver(QStringLiteral("https"), address, httpsPort_, &h))
		return h;
	if (openPorts.contains(httpPort_))
		confirmOver(QStringLiteral("http"), address, httpPort_, &h);
	return h;
}

bool ApplianceDetector::confirmOver(const QString& scheme, const QString& address, int port,
									ApplianceHint* h) const
{
	QNetworkAccessManager nam;
	nam.setProxy(QNetworkProxy::NoProxy);		// LAN host
	const QString base = baseUrl(scheme, address, port);

	for (const QString& path : endpoints()) {
		QByteArray body;
		QString contentType;
		if (!fetch(nam, QUrl(base + path), timeoutMs_, &body, &contentType)) continue;
		if (!looksLikeAdmin(body, contentType)) continue;

		h->confirmed  = true;
		h->confidence = 0.95;
		h->protocol   = scheme;
		h->adminUrl   = base + QStringLiteral("/admin");
		h->apiUrl     = base + path;
		h->reason     = QStringLiteral("admin endpoint %1 answered over %2").arg(path, scheme.toUpper());
		qCInfo(LC_NET).noquote() << "[confirmOver]" << address << "confirmed via" << h->apiUrl;
		return true;
	}
	return false;
}

QJsonObject ApplianceHint::toJson() const
{
	QJsonObject j;
	j["detected"] = detected;
	if (detected) {
		j["kind"]       = kind;
		j["confidence"] = confidence;
		j["reason"]     = reason;
		j["confirmed"]  = confirmed;
		if (confirmed) {
			j["protocol"]  = protocol;
			j["admin_url"] = adminUrl;
			j["api_url"]   = apiUrl;
		}
	}
	return j;
}
