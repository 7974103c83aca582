#include "EventBus.hpp"
#include <QMetaObject>

namespace hush {

namespace {
const QString kWildcard = QStringLiteral("*");
}

EventBus::EventBus(QObject* parent) : QObject(parent) {}

int EventBus::subscribe(const QString& topic, Callback callback)
{
    QMutexLocker lock(&mutex_);
    int id = nextId_++;
    subscriptions_[id] = {topic, std::move(callback)};
    topicIndex_.insert(topic, id);
    return id;
}

void EventBus::unsubscribe(int subscriptionId)
{
    QMutexLocker lock(&mutex_);
    auto it = subscriptions_.find(subscriptionId);
    if (it == subscriptions_.end()) return;
    topicIndex_.remove(it->topic, subscriptionId);
    subscriptions_.erase(it);
}

void EventBus::publish(const QString& topic, const QVariant& payload)
{
    QMutexLocker lock(&mutex_);
    auto ids = topicIndex_.values(topic) + topicIndex_.values(kWildcard);
    for (int id : ids) {
        auto it = subscriptions_.find(id);
        if (it == subscriptions_.end()) continue;
        auto cb = it->callback;  // copy while holding the lock
        QMetaObject::invokeMethod(this, [cb, topic, payload]() {
            cb(topic, payload);
        }, Qt::QueuedConnection);
    }
}

void EventBus::publishCoalesced(const QString& topic, const QVariant& payload)
{
    QMutexLocker lock(&mutex_);
    if (!pending_.contains(topic))
        pendingOrder_.append(topic);
    pending_.insert(topic, payload);
    if (flushScheduled_)
        return;
    flushScheduled_ = true;
    QMetaObject::invokeMethod(this, &EventBus::flushCoalesced, Qt::QueuedConnection);
}

void EventBus::flushCoalesced()
{
    QHash<QString, QVariant> batch;
    QStringList order;
    {
        QMutexLocker lock(&mutex_);
        batch.swap(pending_);
        order.swap(pendingOrder_);
        flushScheduled_ = false;
    }
    for (const QString& topic : order)
        publish(topic, batch.value(topic));
}

} // namespace hush
