#include "core/command/WatcherService.hpp"
#include "core/services/ConfigStore.hpp"
#include <QRandomGenerator>
#include <boost/log/trivial.hpp>

namespace hush {

namespace {

int jitterFor(const WatcherSpec& spec)
{
    return spec.jitterMs > 0
        ? static_cast<int>(QRandomGenerator::global()->bounded(spec.jitterMs + 1))
        : 0;
}

} // namespace

WatcherService::WatcherService(ConfigStore& config, CommandRunner& runner,
                               WatcherResults& results, QObject* parent)
    : QObject(parent)
    , config_(config)
    , runner_(runner)
    , results_(results)
{
    connect(&config_, &ConfigStore::configReloaded, this, &WatcherService::reconfigure);
    reconfigure();
}

WatcherService::~WatcherService()
{
    for (auto& entry : watchers_)
        deactivate(*entry.second);
}

void WatcherService::reconfigure()
{
    auto snapshot = config_.snapshot();
    runner_.setMaxConcurrent(snapshot->widgets.maxConcurrent);
    runner_.setMaxStreams(snapshot->widgets.maxStreams);

    for (auto& entry : watchers_)
        deactivate(*entry.second);
    watchers_.clear();
    ++generation_;

    QStringList ids;
    for (const WatcherSpec& spec : snapshot->widgets.watchers) {
        if (!spec.enabled)
            continue;
        auto w = std::make_shared<Watcher>();
        w->spec = spec;
        w->pollTimer.setSingleShot(true);
        w->debounce.setSingleShot(true);
        w->debounce.setInterval(kStreamDebounceMs);

        std::weak_ptr<Watcher> weak = w;
        connect(&w->pollTimer, &QTimer::timeout, this, [this, weak]() {
            if (auto locked = weak.lock())
                probe(locked);
        });
        connect(&w->debounce, &QTimer::timeout, this, [this, weak]() {
            if (auto locked = weak.lock())
                probe(locked);
        });

        watchers_[spec.id] = w;
        ids << spec.id;
    }
    results_.retain(ids);

    BOOST_LOG_TRIVIAL(info) << "[WatcherService] " << watchers_.size() << " watcher(s) configured"
                            << (paused_ ? " (paused)" : "");
    if (!paused_) {
        for (auto& entry : watchers_)
            activate(*entry.second);
    }
}

void WatcherService::pause()
{
    if (paused_)
        return;
    paused_ = true;
    ++generation_;
    for (auto& entry : watchers_)
        deactivate(*entry.second);
    BOOST_LOG_TRIVIAL(debug) << "[WatcherService] Paused";
}

void WatcherService::resume()
{
    if (!paused_)
        return;
    paused_ = false;
    for (auto& entry : watchers_)
        activate(*entry.second);
    BOOST_LOG_TRIVIAL(debug) << "[WatcherService] Resumed";
}

void WatcherService::activate(Watcher& w)
{
    auto it = watchers_.find(w.spec.id);
    if (it == watchers_.end())
        return;
    const std::shared_ptr<Watcher>& shared = it->second;

    if (!w.spec.watchCommand.isEmpty()) {
        w.streamFailed = false;
        startStream(shared);
    }
    // Watchers beyond the budget start staggered instead of being rejected.
    if (runner_.hasCapacity())
        probe(shared);
    else
        scheduleRetry(w);
}

void WatcherService::deactivate(Watcher& w)
{
    w.pollTimer.stop();
    w.debounce.stop();
    if (w.stream) {
        w.stream->disconnect(this);
        w.stream->stop();
        w.stream->deleteLater();
        w.stream = nullptr;
    }
}

void WatcherService::startStream(const std::shared_ptr<Watcher>& w)
{
    if (w->stream || w->streamFailed)
        return;

    w->stream = runner_.startStream(w->spec.watchCommand);
    if (!w->stream) {
        w->streamFailed = true;
        return;
    }

    std::weak_ptr<Watcher> weak = w;
    connect(w->stream, &CommandStream::lineReceived, this, [weak](const QString&) {
        if (auto locked = weak.lock())
            locked->debounce.start();
    });
    connect(w->stream, &CommandStream::finished, this, [this, weak](int exitCode) {
        auto locked = weak.lock();
        if (!locked || !locked->stream)
            return;
        BOOST_LOG_TRIVIAL(info) << "[WatcherService] Event stream for "
                                << locked->spec.id.toStdString() << " exited (" << exitCode
                                << "), falling back to polling";
        locked->stream->deleteLater();
        locked->stream = nullptr;
        locked->streamFailed = true;
        if (!paused_ && !locked->inFlight)
            schedulePoll(*locked);
    });
}

void WatcherService::schedulePoll(Watcher& w)
{
    if (paused_ || w.stream)
        return;
    w.pollTimer.start(w.spec.intervalMs + jitterFor(w.spec));
}

void WatcherService::scheduleRetry(Watcher& w)
{
    if (paused_)
        return;
    w.pollTimer.start(kBusyRetryMs + jitterFor(w.spec));
}

void WatcherService::refresh(const QString& id)
{
    auto it = watchers_.find(id);
    if (it != watchers_.end())
        probe(it->second);
}

void WatcherService::probe(const std::shared_ptr<Watcher>& w)
{
    if (paused_)
        return;
    if (w->inFlight) {
        w->refreshPending = true;
        return;
    }

    w->pollTimer.stop();
    w->refreshPending = false;
    w->inFlight = true;
    const quint64 generation = generation_;
    std::weak_ptr<Watcher> weak = w;

    runner_.run({w->spec.command, w->spec.timeoutMs},
                [this, weak, generation](const CommandResult& result) {
        if (auto locked = weak.lock())
            onProbeFinished(locked, generation, result);
    });
}

void WatcherService::onProbeFinished(const std::shared_ptr<Watcher>& w, quint64 generation,
                                     const CommandResult& result)
{
    w->inFlight = false;

    if (generation != generation_) {
        // Paused or reconfigured while running; the result is dropped.
        if (!paused_ && w->refreshPending)
            probe(w);
        else if (!paused_)
            schedulePoll(*w);
        return;
    }

    if (result.succeeded()) {
        results_.recordSuccess(w->spec.id, QString::fromUtf8(result.stdoutData).trimmed());
    } else {
        QString reason = commandStatusName(result.status);
        if (result.status == CommandResult::Status::Completed)
            reason = QStringLiteral("exit code %1").arg(result.exitCode);
        BOOST_LOG_TRIVIAL(debug) << "[WatcherService] " << w->spec.id.toStdString()
                                 << " probe failed: " << reason.toStdString();
        results_.recordFailure(w->spec.id, reason);
    }
    emit resultUpdated(w->spec.id);

    if (result.status == CommandResult::Status::ConcurrencyRejected) {
        // Also for streaming watchers: the stream may stay quiet for a long time.
        w->refreshPending = false;
        scheduleRetry(*w);
    } else if (w->refreshPending) {
        probe(w);
    } else {
        schedulePoll(*w);
    }
}

QStringList WatcherService::watcherIds() const
{
    QStringList ids;
    for (const auto& entry : watchers_)
        ids << entry.first;
    return ids;
}

int WatcherService::armedTimerCount() const
{
    int count = 0;
    for (const auto& entry : watchers_) {
        count += entry.second->pollTimer.isActive() ? 1 : 0;
        count += entry.second->debounce.isActive() ? 1 : 0;
    }
    return count;
}

bool WatcherService::isStreaming(const QString& id) const
{
    auto it = watchers_.find(id);
    return it != watchers_.end() && it->second->stream != nullptr;
}

} // namespace hush
