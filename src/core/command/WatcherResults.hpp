#pragma once

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>
#include <optional>

namespace hush {

struct WatcherResult {
    QString id;
    QString value;         // last known good output, trimmed
    QDateTime updatedAt;   // time of the last successful probe
    bool hasValue = false;
    bool stale = true;
    QString lastError;

    QJsonObject toJson() const;
};

/// Latest probe outcome per watcher. WatcherService is the only writer;
/// everything else reads through a const reference.
class WatcherResults {
public:
    void recordSuccess(const QString& id, const QString& value);
    /// Keeps the previous value and marks it stale.
    void recordFailure(const QString& id, const QString& error);
    /// Drops results for watchers that no longer exist.
    void retain(const QStringList& ids);

    std::optional<WatcherResult> get(const QString& id) const;
    QList<WatcherResult> snapshot() const;

private:
    mutable QReadWriteLock lock_;
    QHash<QString, WatcherResult> results_;
};

} // namespace hush
