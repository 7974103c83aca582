#pragma once

#include "core/Notification.hpp"
#include <QDBusContext>
#include <QObject>
#include <QStringList>
#include <QVariantMap>

class QDBusArgument;

namespace hush {

class NotificationService;

/// org.freedesktop.Notifications on the session bus. Registered with
/// ExportAllSlots | ExportAllSignals at /org/freedesktop/Notifications.
///
/// A malformed Notify is answered with InvalidArgs on that call only.
class NotificationsAdaptor : public QObject, protected QDBusContext {
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.freedesktop.Notifications")
public:
    static constexpr const char* kServiceName = "org.freedesktop.Notifications";
    static constexpr const char* kObjectPath = "/org/freedesktop/Notifications";

    explicit NotificationsAdaptor(NotificationService& service, QObject* parent = nullptr);

    /// Replaces image-data structs received as QDBusArgument with RawImage
    /// values and drops other structured hints. Throws ProtocolError.
    static QVariantMap normalizeHints(const QVariantMap& hints);
    static RawImage readImage(const QDBusArgument& argument);

public slots:
    quint32 Notify(const QString& app_name, quint32 replaces_id, const QString& app_icon,
                   const QString& summary, const QString& body, const QStringList& actions,
                   const QVariantMap& hints, qint32 expire_timeout);
    void CloseNotification(quint32 id);
    QStringList GetCapabilities();
    QString GetServerInformation(QString& vendor, QString& version, QString& spec_version);

signals:
    void NotificationClosed(quint32 id, quint32 reason);
    void ActionInvoked(quint32 id, const QString& action_key);

private:
    NotificationService& service_;
};

} // namespace hush
