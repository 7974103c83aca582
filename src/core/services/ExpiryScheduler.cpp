#include "ExpiryScheduler.hpp"
#include <QTimer>
#include <utility>

namespace hush {

ExpiryScheduler::ExpiryScheduler(QObject* parent)
    : QObject(parent)
{
}

ExpiryScheduler::~ExpiryScheduler()
{
    cancelAll();
}

void ExpiryScheduler::schedule(quint32 id, int ms)
{
    cancel(id);

    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, id, timer]() {
        // The timer may have been replaced between firing and delivery.
        if (timers_.value(id) != timer)
            return;
        timers_.remove(id);
        timer->deleteLater();
        emit expired(id);
    });
    timers_.insert(id, timer);
    timer->start(ms);
}

bool ExpiryScheduler::cancel(quint32 id)
{
    QTimer* timer = timers_.take(id);
    if (!timer)
        return false;
    timer->stop();
    timer->deleteLater();
    return true;
}

void ExpiryScheduler::cancelAll()
{
    for (QTimer* timer : std::as_const(timers_)) {
        timer->stop();
        timer->deleteLater();
    }
    timers_.clear();
}

} // namespace hush
