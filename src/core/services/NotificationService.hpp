#pragma once

#include "core/ConfigSnapshot.hpp"
#include "core/Notification.hpp"
#include <QObject>
#include <QStringList>

namespace hush {

class ConfigStore;
class DndScheduler;
class ExpiryScheduler;
class HistoryStore;
class IconCache;
class SoundPlayer;

struct ServerInformation {
    QString name;
    QString vendor;
    QString version;
    QString specVersion;
};

/**
 * NotificationService: the notification front door.
 *
 * notify() normalizes the request, runs the rules, applies do-not-disturb,
 * writes the history entry and arms its expiry. Suppressed and DND-blocked
 * notifications still get an id but leave no trace in history.
 *
 * Every close path (expiry, request, dismissal, eviction, the active cap)
 * emits notificationClosed exactly once per entry. Closures caused by
 * history eviction are delivered from the event loop.
 */
class NotificationService : public QObject {
    Q_OBJECT
public:
    NotificationService(ConfigStore& config, HistoryStore& history, DndScheduler& dnd,
                        ExpiryScheduler& expiry, QObject* parent = nullptr);
    ~NotificationService() override;

    /// Optional collaborators: icon prefetch and sound playback.
    void setIconCache(IconCache* cache) { icons_ = cache; }
    void setSoundPlayer(SoundPlayer* player) { sound_ = player; }

    /// Throws ProtocolError on a malformed request; no state changes then.
    quint32 notify(const NotifyRequest& request);

    /// Unknown or already closed ids are ignored (returns false).
    bool closeNotification(quint32 id);

    QStringList capabilities() const;
    ServerInformation serverInformation() const;

    bool dismiss(quint32 id);
    bool invokeAction(quint32 id, const QString& actionKey);

    /// Closes every open entry as Dismissed and empties the history.
    /// Returns the number of entries removed.
    int clearHistory();

    /// Milliseconds until the notification expires, 0 for never.
    static int expiryFor(const Notification& n, const ConfigSnapshot& config);

signals:
    void notificationShown(const hush::Notification& notification);
    void notificationClosed(quint32 id, hush::CloseReason reason);
    void actionInvoked(quint32 id, const QString& actionKey);
    void historyCleared();

private:
    bool closeEntry(quint32 id, CloseReason reason);
    void enforceActiveCap(const ConfigSnapshot& config);
    void prefetchIcon(const Notification& n);

    ConfigStore& config_;
    HistoryStore& history_;
    DndScheduler& dnd_;
    ExpiryScheduler& expiry_;
    IconCache* icons_ = nullptr;
    SoundPlayer* sound_ = nullptr;
};

} // namespace hush
