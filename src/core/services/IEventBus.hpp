#pragma once

#include <QString>
#include <QVariant>
#include <functional>

namespace hush {

/// String-keyed publish/subscribe feed for state changes.
/// Payloads are QVariant (usually a QVariantMap). Subscribers are invoked
/// on the bus's thread via Qt::QueuedConnection.
class IEventBus {
public:
    virtual ~IEventBus() = default;

    using Callback = std::function<void(const QString& topic, const QVariant& payload)>;

    /// Subscribe to a topic, or to every topic with "*". Returns an id for
    /// unsubscribe. Thread-safe.
    virtual int subscribe(const QString& topic, Callback callback) = 0;

    virtual void unsubscribe(int subscriptionId) = 0;

    /// Delivers payload to every subscriber of the topic. Thread-safe.
    virtual void publish(const QString& topic, const QVariant& payload = {}) = 0;

    /// Like publish(), but repeated calls for the same topic before the
    /// event loop next runs collapse into one delivery of the last payload.
    virtual void publishCoalesced(const QString& topic, const QVariant& payload = {}) = 0;
};

} // namespace hush
