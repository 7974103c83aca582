#include "NotificationsAdaptor.hpp"
#include "NotificationService.hpp"
#include <QDBusArgument>
#include <QDBusError>
#include <boost/log/trivial.hpp>

namespace hush {

namespace {
const QStringList kImageHints = {QStringLiteral("image-data"), QStringLiteral("image_data"),
                                 QStringLiteral("icon_data")};
}

NotificationsAdaptor::NotificationsAdaptor(NotificationService& service, QObject* parent)
    : QObject(parent)
    , service_(service)
{
    connect(&service_, &NotificationService::notificationClosed, this,
            [this](quint32 id, CloseReason reason) {
        emit NotificationClosed(id, static_cast<quint32>(reason));
    });
    connect(&service_, &NotificationService::actionInvoked, this,
            &NotificationsAdaptor::ActionInvoked);
}

RawImage NotificationsAdaptor::readImage(const QDBusArgument& argument)
{
    if (argument.currentSignature() != QLatin1String("(iiibiiay)"))
        throw ProtocolError("image-data must be (iiibiiay), got "
                            + argument.currentSignature().toStdString());

    RawImage image;
    argument.beginStructure();
    argument >> image.width >> image.height >> image.rowstride >> image.hasAlpha
             >> image.bitsPerSample >> image.channels >> image.data;
    argument.endStructure();
    return image;
}

QVariantMap NotificationsAdaptor::normalizeHints(const QVariantMap& hints)
{
    QVariantMap normalized;
    for (auto it = hints.constBegin(); it != hints.constEnd(); ++it) {
        if (it.value().userType() != qMetaTypeId<QDBusArgument>()) {
            normalized.insert(it.key(), it.value());
            continue;
        }
        const QDBusArgument argument = it.value().value<QDBusArgument>();
        if (kImageHints.contains(it.key())) {
            normalized.insert(it.key(), QVariant::fromValue(readImage(argument)));
        } else {
            BOOST_LOG_TRIVIAL(debug) << "[NotificationsAdaptor] Ignoring structured hint "
                                     << it.key().toStdString();
        }
    }
    return normalized;
}

quint32 NotificationsAdaptor::Notify(const QString& app_name, quint32 replaces_id,
                                     const QString& app_icon, const QString& summary,
                                     const QString& body, const QStringList& actions,
                                     const QVariantMap& hints, qint32 expire_timeout)
{
    try {
        NotifyRequest request;
        request.appName = app_name;
        request.replacesId = replaces_id;
        request.appIcon = app_icon;
        request.summary = summary;
        request.body = body;
        request.actions = actions;
        request.hints = normalizeHints(hints);
        request.expireTimeout = expire_timeout;
        return service_.notify(request);
    } catch (const ProtocolError& e) {
        BOOST_LOG_TRIVIAL(warning) << "[NotificationsAdaptor] Rejected Notify from "
                                   << app_name.toStdString() << ": " << e.what();
        if (calledFromDBus())
            sendErrorReply(QDBusError::InvalidArgs, QString::fromStdString(e.what()));
        return 0;
    }
}

void NotificationsAdaptor::CloseNotification(quint32 id)
{
    if (!service_.closeNotification(id))
        BOOST_LOG_TRIVIAL(debug) << "[NotificationsAdaptor] CloseNotification: #" << id
                                 << " unknown or already closed";
}

QStringList NotificationsAdaptor::GetCapabilities()
{
    return service_.capabilities();
}

QString NotificationsAdaptor::GetServerInformation(QString& vendor, QString& version,
                                                   QString& spec_version)
{
    const ServerInformation info = service_.serverInformation();
    vendor = info.vendor;
    version = info.version;
    spec_version = info.specVersion;
    return info.name;
}

} // namespace hush
