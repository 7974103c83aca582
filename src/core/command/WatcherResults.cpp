#include "core/command/WatcherResults.hpp"
#include <algorithm>

namespace hush {

QJsonObject WatcherResult::toJson() const
{
    QJsonObject obj{
        {"id", id},
        {"stale", stale},
        {"has_value", hasValue},
    };
    if (hasValue) {
        obj["value"] = value;
        obj["updated_at_ms"] = updatedAt.toMSecsSinceEpoch();
    }
    if (!lastError.isEmpty())
        obj["error"] = lastError;
    return obj;
}

void WatcherResults::recordSuccess(const QString& id, const QString& value)
{
    QWriteLocker lock(&lock_);
    WatcherResult& r = results_[id];
    r.id = id;
    r.value = value;
    r.updatedAt = QDateTime::currentDateTime();
    r.hasValue = true;
    r.stale = false;
    r.lastError.clear();
}

void WatcherResults::recordFailure(const QString& id, const QString& error)
{
    QWriteLocker lock(&lock_);
    WatcherResult& r = results_[id];
    r.id = id;
    r.stale = true;
    r.lastError = error;
}

void WatcherResults::retain(const QStringList& ids)
{
    QWriteLocker lock(&lock_);
    for (auto it = results_.begin(); it != results_.end();) {
        if (ids.contains(it.key()))
            ++it;
        else
            it = results_.erase(it);
    }
}

std::optional<WatcherResult> WatcherResults::get(const QString& id) const
{
    QReadLocker lock(&lock_);
    auto it = results_.constFind(id);
    if (it == results_.constEnd())
        return std::nullopt;
    return *it;
}

QList<WatcherResult> WatcherResults::snapshot() const
{
    QReadLocker lock(&lock_);
    QList<WatcherResult> list = results_.values();
    std::sort(list.begin(), list.end(), [](const WatcherResult& a, const WatcherResult& b) {
        return a.id < b.id;
    });
    return list;
}

} // namespace hush
