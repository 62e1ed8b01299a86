#pragma once
#include <memory>
#include <QJsonObject>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QVector>

// One live consumer of broadcast events
class Subscriber {
public:
	virtual ~Subscriber() = default;

	// false (or a thrown exception) drops the subscriber from the hub
	virtual bool deliver(const QJsonObject& event) = 0;
	virtual QString describe() const { return QStringLiteral("subscriber"); }
};

// Fans events out to every subscriber; a failing subscriber never affects
// the others
class BroadcastHub : public QObject {
	Q_OBJECT
public:
	explicit BroadcastHub(QObject* parent = nullptr);

	void subscribe(std::shared_ptr<Subscriber> s);
	bool unsubscribe(const Subscriber* s);
	int subscriberCount() const;

	// Returns how many subscribers accepted the event
	int publish(const QJsonObject& event);

public slots:
	// scan_now from any subscriber
	void requestScanNow();

signals:
	void scanNowRequested();
	void subscriberDropped(const QString& who);

private:
	mutable QMutex mutex_;
	QVector<std::shared_ptr<Subscriber>> subs_;
};
