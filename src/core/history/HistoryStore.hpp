#pragma once

#include "core/Notification.hpp"
#include <QList>
#include <QObject>
#include <QReadWriteLock>
#include <functional>
#include <optional>

namespace hush {

enum class HistoryFilter {
    Active,
    Closed,
    All
};

struct EvictedEntry {
    quint32 id = 0;
    bool wasOpen = false;
};

struct InsertOutcome {
    quint32 id = 0;
    bool replaced = false;
    bool deduplicated = false;
    QList<EvictedEntry> evicted;
};

/**
 * HistoryStore: the single owner of notification entries.
 *
 * Entries are kept oldest-first by recency (insert, replace and dedup
 * refresh move an entry to the newest end). Size never exceeds capacity:
 * the oldest closed entry goes first, the oldest open entry only when
 * nothing is closed.
 *
 * Writers are serialized by a write lock; readers get copies under a read
 * lock. Each logical operation emits changed() once, after the lock is
 * released.
 */
class HistoryStore : public QObject {
    Q_OBJECT
public:
    /// Called with the write lock held, before an open entry is dropped by
    /// eviction. Must not call back into the store.
    using EvictionHook = std::function<void(quint32 id)>;
    using Predicate = std::function<bool(const Notification&)>;

    explicit HistoryStore(int capacity = 200, QObject* parent = nullptr);

    /// Next identifier: wraps past 0xffffffff, never 0, never an id
    /// currently held by any entry.
    quint32 allocateId();

    /// n.id must be set. An existing entry with that id is replaced in
    /// place (its repeat count survives). Otherwise an open entry with the
    /// same app/summary/body refreshed within dedupWindowMs absorbs the
    /// notification. Eviction runs afterwards.
    InsertOutcome insertOrReplace(Notification n, int dedupWindowMs = 0);

    /// Marks the entry closed. Returns false for unknown or already closed
    /// ids. With retain=false the entry is removed instead of kept.
    bool close(quint32 id, CloseReason reason, bool retain = true);

    std::optional<Notification> find(quint32 id) const;
    bool isOpen(quint32 id) const;

    /// Newest first.
    QList<Notification> list(HistoryFilter filter) const;

    /// Removes every entry the predicate accepts; returns the removed entries.
    QList<Notification> clear(const Predicate& predicate);

    QList<EvictedEntry> evictIfOverCapacity();

    std::optional<quint32> oldestOpenId() const;

    void setCapacity(int capacity);
    int capacity() const;
    int size() const;
    int activeCount() const;
    int unreadCount() const;
    int criticalActiveCount() const;
    void markAllRead();

    void setEvictionHook(EvictionHook hook);

    /// JSON persistence. Loaded entries are always closed and their ids
    /// stay reserved.
    bool save(const QString& path) const;
    int load(const QString& path);

signals:
    void changed();

private:
    int indexOfLocked(quint32 id) const;
    QList<EvictedEntry> evictLocked();

    mutable QReadWriteLock lock_;
    QList<Notification> entries_;
    int capacity_;
    quint32 nextId_ = 1;
    EvictionHook evictionHook_;
};

} // namespace hush
