#pragma once

#include "core/ConfigSnapshot.hpp"
#include "core/Notification.hpp"
#include <QElapsedTimer>
#include <QObject>
#include <functional>

namespace hush {

class CommandRunner;
class ConfigStore;

/// Plays notification sounds through the command runner.
/// A sound-file hint (or sound.default_file) is played with pw-play, or
/// paplay when PipeWire's player is absent; a sound-name hint (or
/// sound.default_name) goes to canberra-gtk-play. Sounds closer together
/// than sound.min_interval_ms are dropped. When the command budget is full
/// the sound is retried once after kRetryDelayMs.
class SoundPlayer : public QObject {
    Q_OBJECT
public:
    /// Returns the full path of an executable, or empty when not found.
    using ExecutableLookup = std::function<QString(const QString& name)>;

    SoundPlayer(ConfigStore& config, CommandRunner& runner, QObject* parent = nullptr);

    static constexpr int kRetryDelayMs = 150;

    /// Returns the command line that was started or deferred, empty when
    /// nothing will play.
    QString play(const Notification& n);

    QString commandFor(const Notification& n, const SoundSettings& settings) const;

    void setExecutableLookup(ExecutableLookup lookup) { lookup_ = std::move(lookup); }

signals:
    void played(const QString& command);

private:
    void start(quint32 id, const QString& command, int timeoutMs, bool mayRetry);

    ConfigStore& config_;
    CommandRunner& runner_;
    ExecutableLookup lookup_;
    QElapsedTimer lastPlayed_;
    bool retryPending_ = false;
};

} // namespace hush
