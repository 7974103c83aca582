#include "core/Notification.hpp"
#include <QJsonArray>

namespace hush {

namespace {

constexpr int kMaxImageDimension = 512;
constexpr int kMaxImageBytes = 1024 * 1024;

QString hintString(const QVariantMap& hints, const QString& key)
{
    auto it = hints.constFind(key);
    if (it == hints.constEnd())
        return {};
    return it->toString().trimmed();
}

Urgency urgencyFromHint(const QVariant& value)
{
    bool ok = false;
    int raw = value.toInt(&ok);
    if (!ok)
        return Urgency::Normal;
    if (raw <= 0) return Urgency::Low;
    if (raw >= 2) return Urgency::Critical;
    return Urgency::Normal;
}

std::optional<RawImage> imageFromHints(const QVariantMap& hints)
{
    // Older senders use the pre-1.2 key names.
    static const char* const keys[] = {"image-data", "image_data", "icon_data"};
    for (const char* key : keys) {
        auto it = hints.constFind(QLatin1String(key));
        if (it == hints.constEnd() || !it->canConvert<RawImage>())
            continue;
        RawImage image = it->value<RawImage>();
        if (!image.isConsistent())
            throw ProtocolError("inconsistent image-data hint");
        if (!image.isUsable())
            return std::nullopt;
        return image;
    }
    return std::nullopt;
}

QString stripDesktopSuffix(const QString& value)
{
    if (value.endsWith(QLatin1String(".desktop")))
        return value.chopped(8);
    return value;
}

} // namespace

QString urgencyName(Urgency urgency)
{
    switch (urgency) {
    case Urgency::Low: return QStringLiteral("low");
    case Urgency::Normal: return QStringLiteral("normal");
    case Urgency::Critical: return QStringLiteral("critical");
    }
    return QStringLiteral("normal");
}

std::optional<Urgency> urgencyFromName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == "low" || n == "0") return Urgency::Low;
    if (n == "normal" || n == "1") return Urgency::Normal;
    if (n == "critical" || n == "2") return Urgency::Critical;
    return std::nullopt;
}

QString closeReasonName(CloseReason reason)
{
    switch (reason) {
    case CloseReason::Expired: return QStringLiteral("expired");
    case CloseReason::Dismissed: return QStringLiteral("dismissed");
    case CloseReason::ClosedByRequest: return QStringLiteral("closed");
    case CloseReason::Undefined: return QStringLiteral("undefined");
    }
    return QStringLiteral("undefined");
}

bool RawImage::isConsistent() const
{
    if (width <= 0 || height <= 0 || rowstride <= 0)
        return false;
    if (bitsPerSample != 8 || (channels != 3 && channels != 4))
        return false;
    const qint64 rowBytes = qint64(width) * channels;
    if (rowstride < rowBytes)
        return false;
    const qint64 needed = qint64(rowstride) * (height - 1) + rowBytes;
    return data.size() >= needed;
}

bool RawImage::isUsable() const
{
    return width <= kMaxImageDimension && height <= kMaxImageDimension
        && data.size() <= kMaxImageBytes;
}

ExpireTimeout ExpireTimeout::fromProtocol(qint32 value)
{
    if (value < 0)
        return {};
    if (value == 0)
        return never();
    return explicitMs(value);
}

bool Notification::hasAction(const QString& key) const
{
    for (const auto& action : actions) {
        if (action.key == key)
            return true;
    }
    return false;
}

bool Notification::hintFlag(const QString& key) const
{
    auto it = hints.constFind(key);
    if (it == hints.constEnd())
        return false;
    if (it->typeId() == QMetaType::QString) {
        const QString s = it->toString().trimmed().toLower();
        return s == "true" || s == "1" || s == "yes";
    }
    return it->toBool();
}

QJsonObject Notification::toJson(bool full) const
{
    QJsonObject obj;
    obj["id"] = static_cast<qint64>(id);
    obj["app"] = appName;
    obj["app_icon"] = appIcon;
    obj["summary"] = summary;
    if (full)
        obj["body"] = body;
    obj["urgency"] = static_cast<int>(urgency);
    obj["category"] = category;
    obj["desktop_entry"] = desktopEntry;
    obj["image_path"] = imagePath;
    obj["has_image_data"] = imageData.has_value();

    QJsonArray actionList;
    for (const auto& action : actions)
        actionList.append(QJsonObject{{"key", action.key}, {"label", action.label}});
    obj["actions"] = actionList;

    obj["created_at_ms"] = createdAt.toMSecsSinceEpoch();
    obj["closed"] = closed;
    if (closed)
        obj["close_reason"] = closeReasonName(closeReason);
    obj["repeat_count"] = repeatCount;
    obj["read"] = read;
    obj["transient"] = transient;
    obj["resident"] = resident;
    return obj;
}

std::optional<Notification> Notification::fromJson(const QJsonObject& obj)
{
    const qint64 rawId = obj.value("id").toInteger();
    if (rawId <= 0 || rawId > 0xffffffffLL)
        return std::nullopt;

    Notification n;
    n.id = static_cast<quint32>(rawId);
    n.appName = obj.value("app").toString();
    n.appIcon = obj.value("app_icon").toString();
    n.summary = obj.value("summary").toString();
    n.body = obj.value("body").toString();
    n.urgency = urgencyFromHint(obj.value("urgency").toInt(1));
    n.category = obj.value("category").toString();
    n.desktopEntry = obj.value("desktop_entry").toString();
    n.imagePath = obj.value("image_path").toString();
    for (const auto& value : obj.value("actions").toArray()) {
        const QJsonObject a = value.toObject();
        n.actions.append({a.value("key").toString(), a.value("label").toString()});
    }
    n.createdAt = QDateTime::fromMSecsSinceEpoch(obj.value("created_at_ms").toInteger());
    n.closed = true;
    n.closeReason = CloseReason::Undefined;
    const QString reason = obj.value("close_reason").toString();
    for (auto r : {CloseReason::Expired, CloseReason::Dismissed, CloseReason::ClosedByRequest}) {
        if (reason == closeReasonName(r))
            n.closeReason = r;
    }
    n.repeatCount = qMax(1, obj.value("repeat_count").toInt(1));
    n.read = obj.value("read").toBool(true);
    n.transient = obj.value("transient").toBool();
    n.resident = obj.value("resident").toBool();
    n.expireTimeout = ExpireTimeout::never();
    return n;
}

Notification notificationFromRequest(const NotifyRequest& request)
{
    if (request.expireTimeout < -1)
        throw ProtocolError("expire_timeout must be -1, 0 or positive");

    Notification n;
    n.appName = request.appName.trimmed().isEmpty()
        ? QStringLiteral("Unknown") : request.appName;
    n.appIcon = request.appIcon;
    n.summary = request.summary;
    n.body = request.body;
    n.expireTimeout = ExpireTimeout::fromProtocol(request.expireTimeout);
    n.createdAt = QDateTime::currentDateTime();

    // Actions come as flat key/label pairs; a trailing key without label is dropped.
    for (int i = 0; i + 1 < request.actions.size(); i += 2)
        n.actions.append({request.actions.at(i), request.actions.at(i + 1)});

    n.hints = request.hints;
    n.hints.remove(QStringLiteral("image-data"));
    n.hints.remove(QStringLiteral("image_data"));
    n.hints.remove(QStringLiteral("icon_data"));

    auto urgency = request.hints.constFind(QStringLiteral("urgency"));
    if (urgency != request.hints.constEnd())
        n.urgency = urgencyFromHint(*urgency);

    n.category = hintString(request.hints, QStringLiteral("category"));
    n.desktopEntry = stripDesktopSuffix(hintString(request.hints, QStringLiteral("desktop-entry")));
    n.imagePath = hintString(request.hints, QStringLiteral("image-path"));
    if (n.imagePath.isEmpty())
        n.imagePath = hintString(request.hints, QStringLiteral("image_path"));
    n.imageData = imageFromHints(request.hints);

    n.transient = n.hintFlag(QStringLiteral("transient"));
    n.resident = n.hintFlag(QStringLiteral("resident"));
    return n;
}

} // namespace hush
