#pragma once

#include <QHash>
#include <QObject>

class QTimer;

namespace hush {

/// One single-shot timer per notification id. Scheduling an id again
/// replaces its timer; cancel() is a direct lookup.
class ExpiryScheduler : public QObject {
    Q_OBJECT
public:
    explicit ExpiryScheduler(QObject* parent = nullptr);
    ~ExpiryScheduler() override;

    void schedule(quint32 id, int ms);
    bool cancel(quint32 id);
    void cancelAll();

    bool isScheduled(quint32 id) const { return timers_.contains(id); }
    int pendingCount() const { return timers_.size(); }

signals:
    void expired(quint32 id);

private:
    QHash<quint32, QTimer*> timers_;
};

} // namespace hush
