#pragma once

#include "core/ConfigSnapshot.hpp"
#include "core/command/CommandRunner.hpp"
#include "core/command/WatcherResults.hpp"
#include <QObject>
#include <QTimer>
#include <map>
#include <memory>

namespace hush {

class ConfigStore;

/**
 * WatcherService: keeps the status widgets' Watcher Results current.
 *
 * A watcher with a watch_command follows that event stream: each line is
 * debounced and triggers one probe, and no poll timer runs. If the stream
 * cannot start or exits, the watcher falls back to polling at its interval
 * plus a random jitter.
 *
 * A probe rejected by the concurrency budget is retried after
 * kBusyRetryMs plus jitter, streaming or not. On activation, watchers that
 * find the budget full are started the same way rather than rejected.
 *
 * The service starts paused. While paused no timer is armed and no stream
 * runs; results of probes that were in flight when pause() was called are
 * discarded.
 */
class WatcherService : public QObject {
    Q_OBJECT
public:
    static constexpr int kStreamDebounceMs = 120;
    static constexpr int kBusyRetryMs = 250;

    WatcherService(ConfigStore& config, CommandRunner& runner, WatcherResults& results,
                   QObject* parent = nullptr);
    ~WatcherService() override;

    void pause();
    void resume();
    bool isPaused() const { return paused_; }

    /// Probes now. A probe already in flight is followed by another one.
    void refresh(const QString& id);

    QStringList watcherIds() const;
    int armedTimerCount() const;
    bool isStreaming(const QString& id) const;

    const WatcherResults& results() const { return results_; }

signals:
    void resultUpdated(const QString& id);

private:
    struct Watcher {
        WatcherSpec spec;
        QTimer pollTimer;
        QTimer debounce;
        CommandStream* stream = nullptr;
        bool inFlight = false;
        bool refreshPending = false;
        bool streamFailed = false;
    };

    void reconfigure();
    void activate(Watcher& w);
    void deactivate(Watcher& w);
    void schedulePoll(Watcher& w);
    void scheduleRetry(Watcher& w);
    void probe(const std::shared_ptr<Watcher>& w);
    void startStream(const std::shared_ptr<Watcher>& w);
    void onProbeFinished(const std::shared_ptr<Watcher>& w, quint64 generation,
                         const CommandResult& result);

    ConfigStore& config_;
    CommandRunner& runner_;
    WatcherResults& results_;
    std::map<QString, std::shared_ptr<Watcher>> watchers_;
    quint64 generation_ = 0;
    bool paused_ = true;
};

} // namespace hush
