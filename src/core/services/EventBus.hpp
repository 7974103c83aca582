#pragma once

#include "IEventBus.hpp"
#include <QHash>
#include <QMultiHash>
#include <QMutex>
#include <QObject>
#include <QStringList>

namespace hush {

namespace topics {
inline const QString HistoryChanged = QStringLiteral("history/changed");
inline const QString DndChanged = QStringLiteral("dnd/changed");
inline const QString WatchersUpdated = QStringLiteral("watchers/updated");
inline const QString ConfigReloaded = QStringLiteral("config/reloaded");
inline const QString ConfigFailed = QStringLiteral("config/failed");
inline const QString ThemeReloaded = QStringLiteral("theme/reloaded");
inline const QString PanelRequested = QStringLiteral("panel/requested");
} // namespace topics

class EventBus : public QObject, public IEventBus {
    Q_OBJECT
public:
    explicit EventBus(QObject* parent = nullptr);

    int subscribe(const QString& topic, Callback callback) override;
    void unsubscribe(int subscriptionId) override;
    void publish(const QString& topic, const QVariant& payload = {}) override;
    void publishCoalesced(const QString& topic, const QVariant& payload = {}) override;

private:
    struct Subscription {
        QString topic;
        Callback callback;
    };

    void flushCoalesced();

    QMutex mutex_;
    int nextId_ = 1;
    QHash<int, Subscription> subscriptions_;
    QMultiHash<QString, int> topicIndex_;
    QHash<QString, QVariant> pending_;
    QStringList pendingOrder_;
    bool flushScheduled_ = false;
};

} // namespace hush
