#include "HotReloadWatcher.hpp"
#include "ConfigStore.hpp"
#include "ThemeStore.hpp"
#include <QDateTime>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace hush {

HotReloadWatcher::HotReloadWatcher(ConfigStore& config, ThemeStore& theme, QObject* parent)
    : QObject(parent)
    , config_(config)
    , theme_(theme)
{
    debounce_.setSingleShot(true);
    debounce_.setInterval(kDefaultDebounceMs);
    connect(&debounce_, &QTimer::timeout, this, &HotReloadWatcher::applyPending);
    connect(&watcher_, &QFileSystemWatcher::fileChanged, this, &HotReloadWatcher::onPathChanged);
    connect(&watcher_, &QFileSystemWatcher::directoryChanged, this, &HotReloadWatcher::onPathChanged);
}

void HotReloadWatcher::start()
{
    rememberFingerprints();
    rewatch();
    BOOST_LOG_TRIVIAL(info) << "[HotReload] Watching " << watcher_.files().size() << " files, "
                            << watcher_.directories().size() << " directories";
}

void HotReloadWatcher::stop()
{
    debounce_.stop();
    const QStringList watched = watcher_.files() + watcher_.directories();
    if (!watched.isEmpty())
        watcher_.removePaths(watched);
}

QString HotReloadWatcher::fingerprint(const QString& path)
{
    const QFileInfo info(path);
    if (!info.exists())
        return QStringLiteral("missing");
    return QStringLiteral("%1:%2").arg(info.lastModified().toMSecsSinceEpoch()).arg(info.size());
}

void HotReloadWatcher::rememberFingerprints()
{
    fingerprints_.clear();
    fingerprints_.insert(config_.configPath(), fingerprint(config_.configPath()));
    for (const QString& path : theme_.paths())
        fingerprints_.insert(path, fingerprint(path));
}

void HotReloadWatcher::rewatch()
{
    QStringList wanted;
    wanted << config_.configPath();
    wanted << theme_.paths();

    QStringList files;
    QStringList dirs;
    for (const QString& path : wanted) {
        const QFileInfo info(path);
        if (info.exists() && !watcher_.files().contains(info.absoluteFilePath()))
            files << info.absoluteFilePath();
        const QString dir = info.absolutePath();
        if (QFileInfo::exists(dir) && !watcher_.directories().contains(dir) && !dirs.contains(dir))
            dirs << dir;
    }
    if (!files.isEmpty())
        watcher_.addPaths(files);
    if (!dirs.isEmpty())
        watcher_.addPaths(dirs);
}

void HotReloadWatcher::onPathChanged(const QString& path)
{
    BOOST_LOG_TRIVIAL(debug) << "[HotReload] Change on " << path.toStdString();
    debounce_.start();
}

void HotReloadWatcher::applyPending()
{
    const QString configPath = config_.configPath();
    const bool configChanged = fingerprint(configPath) != fingerprints_.value(configPath);

    bool themeChanged = false;
    if (configChanged) {
        // Theme file names may have moved with the config; the reload
        // below decides which paths count.
        if (!config_.reload())
            BOOST_LOG_TRIVIAL(info) << "[HotReload] Config change rejected, rechecking theme anyway";
        themeChanged = true;
    } else {
        for (const QString& path : theme_.paths()) {
            if (fingerprint(path) != fingerprints_.value(path))
                themeChanged = true;
        }
    }

    if (themeChanged && !theme_.reload())
        BOOST_LOG_TRIVIAL(info) << "[HotReload] Theme change rejected";

    rememberFingerprints();
    rewatch();

    if (configChanged || themeChanged)
        emit reloadAttempted(configChanged, themeChanged);
}

} // namespace hush
