#include "core/history/HistoryStore.hpp"
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QFile>
#include <boost/log/trivial.hpp>

namespace hush {

HistoryStore::HistoryStore(int capacity, QObject* parent)
    : QObject(parent)
    , capacity_(qMax(1, capacity))
{
}

int HistoryStore::indexOfLocked(quint32 id) const
{
    for (int i = 0; i < entries_.size(); ++i) {
        if (entries_.at(i).id == id)
            return i;
    }
    return -1;
}

quint32 HistoryStore::allocateId()
{
    QWriteLocker lock(&lock_);
    for (;;) {
        const quint32 id = nextId_++;
        if (nextId_ == 0)
            nextId_ = 1;
        if (id != 0 && indexOfLocked(id) < 0)
            return id;
    }
}

InsertOutcome HistoryStore::insertOrReplace(Notification n, int dedupWindowMs)
{
    InsertOutcome outcome;
    {
        QWriteLocker lock(&lock_);
        const QDateTime now = QDateTime::currentDateTime();

        const int existing = indexOfLocked(n.id);
        if (existing >= 0) {
            n.repeatCount = entries_.at(existing).repeatCount;
            n.closed = false;
            n.read = false;
            entries_.removeAt(existing);
            entries_.append(n);
            outcome.id = n.id;
            outcome.replaced = true;
        } else {
            int duplicate = -1;
            if (dedupWindowMs > 0) {
                for (int i = entries_.size() - 1; i >= 0; --i) {
                    const Notification& e = entries_.at(i);
                    if (e.isOpen() && e.appName == n.appName && e.summary == n.summary
                        && e.body == n.body && e.createdAt.msecsTo(now) <= dedupWindowMs) {
                        duplicate = i;
                        break;
                    }
                }
            }

            if (duplicate >= 0) {
                Notification merged = entries_.takeAt(duplicate);
                ++merged.repeatCount;
                merged.createdAt = now;
                merged.read = false;
                entries_.append(merged);
                outcome.id = merged.id;
                outcome.deduplicated = true;
            } else {
                entries_.append(n);
                outcome.id = n.id;
            }
        }
        outcome.evicted = evictLocked();
    }
    emit changed();
    return outcome;
}

bool HistoryStore::close(quint32 id, CloseReason reason, bool retain)
{
    {
        QWriteLocker lock(&lock_);
        const int index = indexOfLocked(id);
        if (index < 0 || entries_.at(index).closed)
            return false;
        if (retain) {
            entries_[index].closed = true;
            entries_[index].closeReason = reason;
        } else {
            entries_.removeAt(index);
        }
    }
    emit changed();
    return true;
}

std::optional<Notification> HistoryStore::find(quint32 id) const
{
    QReadLocker lock(&lock_);
    const int index = indexOfLocked(id);
    if (index < 0)
        return std::nullopt;
    return entries_.at(index);
}

bool HistoryStore::isOpen(quint32 id) const
{
    QReadLocker lock(&lock_);
    const int index = indexOfLocked(id);
    return index >= 0 && entries_.at(index).isOpen();
}

QList<Notification> HistoryStore::list(HistoryFilter filter) const
{
    QReadLocker lock(&lock_);
    QList<Notification> result;
    result.reserve(entries_.size());
    for (auto it = entries_.crbegin(); it != entries_.crend(); ++it) {
        if (filter == HistoryFilter::Active && it->closed) continue;
        if (filter == HistoryFilter::Closed && !it->closed) continue;
        result.append(*it);
    }
    return result;
}

QList<Notification> HistoryStore::clear(const Predicate& predicate)
{
    QList<Notification> removed;
    {
        QWriteLocker lock(&lock_);
        for (int i = entries_.size() - 1; i >= 0; --i) {
            if (predicate(entries_.at(i)))
                removed.prepend(entries_.takeAt(i));
        }
    }
    if (!removed.isEmpty())
        emit changed();
    return removed;
}

QList<EvictedEntry> HistoryStore::evictLocked()
{
    QList<EvictedEntry> evicted;
    while (entries_.size() > capacity_) {
        int victim = -1;
        for (int i = 0; i < entries_.size(); ++i) {
            if (entries_.at(i).closed) {
                victim = i;
                break;
            }
        }

        if (victim < 0) {
            victim = 0;
            // Cancel the expiry timer before the entry disappears.
            if (evictionHook_)
                evictionHook_(entries_.at(victim).id);
        }

        const Notification& e = entries_.at(victim);
        evicted.append({e.id, e.isOpen()});
        BOOST_LOG_TRIVIAL(debug) << "[HistoryStore] Evicted id " << e.id
                                 << (e.isOpen() ? " (open)" : " (closed)");
        entries_.removeAt(victim);
    }
    return evicted;
}

QList<EvictedEntry> HistoryStore::evictIfOverCapacity()
{
    QList<EvictedEntry> evicted;
    {
        QWriteLocker lock(&lock_);
        evicted = evictLocked();
    }
    if (!evicted.isEmpty())
        emit changed();
    return evicted;
}

std::optional<quint32> HistoryStore::oldestOpenId() const
{
    QReadLocker lock(&lock_);
    for (const Notification& e : entries_) {
        if (e.isOpen())
            return e.id;
    }
    return std::nullopt;
}

void HistoryStore::setCapacity(int capacity)
{
    {
        QWriteLocker lock(&lock_);
        capacity_ = qMax(1, capacity);
    }
    evictIfOverCapacity();
}

int HistoryStore::capacity() const
{
    QReadLocker lock(&lock_);
    return capacity_;
}

int HistoryStore::size() const
{
    QReadLocker lock(&lock_);
    return entries_.size();
}

int HistoryStore::activeCount() const
{
    QReadLocker lock(&lock_);
    int count = 0;
    for (const Notification& e : entries_)
        count += e.isOpen() ? 1 : 0;
    return count;
}

int HistoryStore::unreadCount() const
{
    QReadLocker lock(&lock_);
    int count = 0;
    for (const Notification& e : entries_)
        count += e.read ? 0 : 1;
    return count;
}

int HistoryStore::criticalActiveCount() const
{
    QReadLocker lock(&lock_);
    int count = 0;
    for (const Notification& e : entries_)
        count += (e.isOpen() && e.urgency == Urgency::Critical) ? 1 : 0;
    return count;
}

void HistoryStore::markAllRead()
{
    bool touched = false;
    {
        QWriteLocker lock(&lock_);
        for (Notification& e : entries_) {
            if (!e.read) {
                e.read = true;
                touched = true;
            }
        }
    }
    if (touched)
        emit changed();
}

void HistoryStore::setEvictionHook(EvictionHook hook)
{
    QWriteLocker lock(&lock_);
    evictionHook_ = std::move(hook);
}

bool HistoryStore::save(const QString& path) const
{
    QJsonArray list;
    {
        QReadLocker lock(&lock_);
        for (const Notification& e : entries_)
            list.append(e.toJson(true));
    }

    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        BOOST_LOG_TRIVIAL(warning) << "[HistoryStore] Cannot create " << dir.toStdString();
        return false;
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "[HistoryStore] Cannot write " << path.toStdString()
                                   << ": " << file.errorString().toStdString();
        return false;
    }
    QJsonObject root{{"version", 1}, {"entries", list}};
    if (file.write(QJsonDocument(root).toJson(QJsonDocument::Compact)) < 0) {
        BOOST_LOG_TRIVIAL(warning) << "[HistoryStore] Write failed for " << path.toStdString()
                                   << ": " << file.errorString().toStdString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        BOOST_LOG_TRIVIAL(warning) << "[HistoryStore] Commit failed for " << path.toStdString();
        return false;
    }
    return true;
}

int HistoryStore::load(const QString& path)
{
    QFile file(path);
    if (!file.exists())
        return 0;
    if (!file.open(QIODevice::ReadOnly)) {
        BOOST_LOG_TRIVIAL(warning) << "[HistoryStore] Cannot read " << path.toStdString();
        return 0;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (!doc.isObject()) {
        BOOST_LOG_TRIVIAL(warning) << "[HistoryStore] Ignoring corrupt history file "
                                   << path.toStdString() << ": " << error.errorString().toStdString();
        return 0;
    }

    int loaded = 0;
    {
        QWriteLocker lock(&lock_);
        for (const auto& value : doc.object().value("entries").toArray()) {
            auto n = Notification::fromJson(value.toObject());
            if (!n || indexOfLocked(n->id) >= 0)
                continue;
            entries_.append(*n);
            if (n->id >= nextId_)
                nextId_ = n->id + 1 == 0 ? 1 : n->id + 1;
            ++loaded;
        }
        evictLocked();
    }
    if (loaded > 0)
        emit changed();
    BOOST_LOG_TRIVIAL(info) << "[HistoryStore] Restored " << loaded << " entries";
    return loaded;
}

} // namespace hush
