#include "hub/BroadcastHub.hpp"
#include <exception>
#include <QMutexLocker>
#include <QDebug>

#include "log/lanwatch_logging.hpp"

BroadcastHub::BroadcastHub(QObject* parent) : QObject(parent) {}

void BroadcastHub::subscribe(std::shared_ptr<Subscriber> s)
{
	if (!s) return;
	int total = 0;
	const QString who = s->describe();
	{
		QMutexLocker lk(&mutex_);
		subs_.push_back(std::move(s));
		total = subs_.size();
	}
	qCInfo(LC_HUB).noquote() << "[subscribe]" << who << "(total:" << total << ")";
}

bool BroadcastHub::unsubscribe(const Subscriber* s)
{
	QMutexLocker lk(&mutex_);
	for (int i = 0; i < subs_.size(); ++i) {
		if (subs_[i].get() == s) {
			subs_.removeAt(i);
			qCInfo(LC_HUB) << "[unsubscribe] remaining:" << subs_.size();
			return true;
		}
	}
	return false;
}

int BroadcastHub::subscriberCount() const
{
	QMutexLocker lk(&mutex_);
	return subs_.size();
}

int BroadcastHub::publish(const QJsonObject& event)
{
	QVector<std::shared_ptr<Subscriber>> targets;
	{
		QMutexLocker lk(&mutex_);
		targets = subs_;
	}

	int delivered = 0;
	QVector<std::shared_ptr<Subscriber>> failed;

	for (const auto& s : targets) {
		bool ok = false;
		try {
			ok = s->deliver(event);
		} catch (const std::exception& e) {
			qCWarning(LC_HUB).noquote() << "[publish]" << s->describe() << "threw:" << e.what();
			ok = false;
		}
		if (ok) ++delivered;
		else    failed.push_back(s);
	}

	for (const auto& s : failed) {
		qCWarning(LC_HUB).noquote() << "[publish] dropping" << s->describe()
									<< "after failed" << event.value("type").toString();
		unsubscribe(s.get());
		emit subscriberDropped(s->describe());
	}
	return delivered;
}

void BroadcastHub::requestScanNow()
{
	qCInfo(LC_HUB) << "[requestScanNow] client requested immediate scan";
	emit scanNowRequested();
}
