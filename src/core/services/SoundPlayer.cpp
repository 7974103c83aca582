#include "SoundPlayer.hpp"
#include "ConfigStore.hpp"
#include "core/Logging.hpp"
#include "core/command/CommandRunner.hpp"
#include <QStandardPaths>
#include <QTimer>
#include <boost/log/trivial.hpp>

namespace hush {

namespace {

QString shellQuote(const QString& arg)
{
    if (!CommandRunner::needsShell(arg) && !arg.contains(QLatin1Char(' ')))
        return arg;
    QString quoted = arg;
    quoted.replace(QLatin1Char('\''), QStringLiteral("'\\''"));
    return QLatin1Char('\'') + quoted + QLatin1Char('\'');
}

} // namespace

SoundPlayer::SoundPlayer(ConfigStore& config, CommandRunner& runner, QObject* parent)
    : QObject(parent)
    , config_(config)
    , runner_(runner)
    , lookup_([](const QString& name) { return QStandardPaths::findExecutable(name); })
{
}

QString SoundPlayer::commandFor(const Notification& n, const SoundSettings& settings) const
{
    QString file = n.hints.value(QStringLiteral("sound-file")).toString();
    QString name = n.hints.value(QStringLiteral("sound-name")).toString();
    if (file.isEmpty() && name.isEmpty()) {
        file = settings.defaultFile;
        name = settings.defaultName;
    }

    if (!file.isEmpty()) {
        const QString player = !lookup_(QStringLiteral("pw-play")).isEmpty()
            ? QStringLiteral("pw-play")
            : QStringLiteral("paplay");
        return player + QLatin1Char(' ') + shellQuote(file);
    }
    if (!name.isEmpty())
        return QStringLiteral("canberra-gtk-play -i ") + shellQuote(name);
    return {};
}

QString SoundPlayer::play(const Notification& n)
{
    auto config = config_.snapshot();
    const SoundSettings& settings = config->sound;
    if (!settings.enabled || n.muteSound || n.hintFlag(QStringLiteral("suppress-sound")))
        return {};

    if (retryPending_
        || (lastPlayed_.isValid() && lastPlayed_.elapsed() < settings.minIntervalMs)) {
        BOOST_LOG_TRIVIAL(debug) << "[SoundPlayer] Rate limited sound for notification " << n.id;
        return {};
    }

    const QString command = commandFor(n, settings);
    if (command.isEmpty())
        return {};

    start(n.id, command, settings.timeoutMs, true);
    return command;
}

void SoundPlayer::start(quint32 id, const QString& command, int timeoutMs, bool mayRetry)
{
    if (!runner_.hasCapacity()) {
        if (!mayRetry) {
            BOOST_LOG_TRIVIAL(info) << "[SoundPlayer] Command budget still busy, dropping sound for notification "
                                    << id;
            return;
        }
        BOOST_LOG_TRIVIAL(debug) << "[SoundPlayer] Command budget busy, retrying sound for notification "
                                 << id << " in " << kRetryDelayMs << " ms";
        retryPending_ = true;
        QTimer::singleShot(kRetryDelayMs, this, [this, id, command, timeoutMs]() {
            retryPending_ = false;
            start(id, command, timeoutMs, false);
        });
        return;
    }

    lastPlayed_.start();
    runner_.run({command, timeoutMs}, [command](const CommandResult& result) {
        if (!result.succeeded()) {
            BOOST_LOG_TRIVIAL(debug) << "[SoundPlayer] " << logSnippet(command) << ": "
                                     << commandStatusName(result.status).toStdString()
                                     << " (exit " << result.exitCode << ")";
        }
    });
    emit played(command);
}

} // namespace hush
