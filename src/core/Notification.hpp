#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <optional>
#include <stdexcept>

namespace hush {

enum class Urgency : quint8 {
    Low = 0,
    Normal = 1,
    Critical = 2
};

/// Values match the NotificationClosed reason codes on the wire.
enum class CloseReason : quint32 {
    Expired = 1,
    Dismissed = 2,
    ClosedByRequest = 3,
    Undefined = 4
};

QString urgencyName(Urgency urgency);
std::optional<Urgency> urgencyFromName(const QString& name);
QString closeReasonName(CloseReason reason);

struct NotificationAction {
    QString key;
    QString label;
};

/// Inline pixel data from the image-data hint (iiibiiay).
struct RawImage {
    int width = 0;
    int height = 0;
    int rowstride = 0;
    bool hasAlpha = false;
    int bitsPerSample = 8;
    int channels = 4;
    QByteArray data;

    /// Layout is self-consistent (positive size, buffer covers every row).
    bool isConsistent() const;
    /// Small enough to decode and keep (<= 512px per side, <= 1 MiB).
    bool isUsable() const;
};

struct ExpireTimeout {
    enum class Kind { Default, Never, Explicit };

    Kind kind = Kind::Default;
    int ms = 0;

    /// -1 = server default, 0 = never, > 0 = explicit milliseconds.
    static ExpireTimeout fromProtocol(qint32 value);
    static ExpireTimeout explicitMs(int ms) { return {Kind::Explicit, ms}; }
    static ExpireTimeout never() { return {Kind::Never, 0}; }
};

struct Notification {
    quint32 id = 0;
    QString appName;
    QString appIcon;
    QString summary;
    QString body;
    Urgency urgency = Urgency::Normal;
    QString category;
    QString desktopEntry;
    QString imagePath;
    std::optional<RawImage> imageData;
    QList<NotificationAction> actions;
    QVariantMap hints;
    ExpireTimeout expireTimeout;
    QDateTime createdAt;

    bool closed = false;
    CloseReason closeReason = CloseReason::Undefined;
    int repeatCount = 1;
    bool read = false;

    bool transient = false;
    bool resident = false;
    bool hidePopup = false;
    bool muteSound = false;

    bool isOpen() const { return !closed; }
    bool hasAction(const QString& key) const;

    /// Hint value as bool, accepting bool, integer and string encodings.
    bool hintFlag(const QString& key) const;

    /// Listing/persistence form. Bodies are only included when full is set.
    QJsonObject toJson(bool full) const;
    static std::optional<Notification> fromJson(const QJsonObject& obj);
};

/// Raw Notify arguments as received on the bus.
struct NotifyRequest {
    QString appName;
    quint32 replacesId = 0;
    QString appIcon;
    QString summary;
    QString body;
    QStringList actions;
    QVariantMap hints;
    qint32 expireTimeout = -1;
};

/// Malformed protocol request. Answered on the offending call only.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Normalizes a Notify request into a Notification (id left at 0).
/// Throws ProtocolError for an invalid timeout or inconsistent image data.
Notification notificationFromRequest(const NotifyRequest& request);

} // namespace hush

Q_DECLARE_METATYPE(hush::RawImage)
Q_DECLARE_METATYPE(hush::Notification)
Q_DECLARE_METATYPE(hush::CloseReason)
