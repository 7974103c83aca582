#include "core/dnd/DndScheduler.hpp"
#include "core/services/ConfigStore.hpp"
#include <boost/log/trivial.hpp>

namespace hush {

QString dndStateName(DndState state)
{
    switch (state) {
    case DndState::Off: return QStringLiteral("off");
    case DndState::ManualOn: return QStringLiteral("manual");
    case DndState::ScheduledOn: return QStringLiteral("scheduled");
    }
    return QStringLiteral("off");
}

DndScheduler::DndScheduler(ConfigStore& config, QObject* parent)
    : QObject(parent)
    , config_(config)
    , clock_([] { return QDateTime::currentDateTime(); })
    , manual_(config.snapshot()->general.dndDefault)
{
    connect(&timer_, &QTimer::timeout, this, &DndScheduler::evaluate);
    connect(&config_, &ConfigStore::configReloaded, this, &DndScheduler::onConfigReloaded);
    evaluate();
}

void DndScheduler::start()
{
    const int tickMs = config_.snapshot()->dnd.tickMs;
    BOOST_LOG_TRIVIAL(info) << "[DndScheduler] Starting, "
                            << config_.snapshot()->dnd.windows.size() << " window(s), tick "
                            << tickMs << "ms";
    evaluate();
    timer_.start(tickMs);
}

void DndScheduler::stop()
{
    timer_.stop();
}

void DndScheduler::setClock(Clock clock)
{
    clock_ = std::move(clock);
}

bool DndScheduler::insideWindow() const
{
    const QDateTime now = clock_();
    for (const DndWindow& window : config_.snapshot()->dnd.windows) {
        if (window.contains(now))
            return true;
    }
    return false;
}

void DndScheduler::evaluate()
{
    const bool inWindow = insideWindow();
    if (!lastInWindow_ || *lastInWindow_ != inWindow) {
        // A boundary crossing ends any snooze of the previous window.
        if (lastInWindow_)
            snoozed_ = false;
        lastInWindow_ = inWindow;
    }

    DndState next = DndState::Off;
    if (manual_)
        next = DndState::ManualOn;
    else if (inWindow && !snoozed_)
        next = DndState::ScheduledOn;

    const DndState previous = state_.exchange(next);
    if (previous != next) {
        BOOST_LOG_TRIVIAL(info) << "[DndScheduler] " << dndStateName(previous).toStdString()
                                << " -> " << dndStateName(next).toStdString();
        emit stateChanged(next);
    }
}

void DndScheduler::setManual(bool enabled)
{
    if (!enabled && state_ == DndState::ScheduledOn)
        snoozed_ = true;
    manual_ = enabled;
    evaluate();
}

void DndScheduler::toggle()
{
    setManual(state_ == DndState::Off);
}

void DndScheduler::onConfigReloaded()
{
    if (timer_.isActive())
        timer_.setInterval(config_.snapshot()->dnd.tickMs);
    evaluate();
}

} // namespace hush
