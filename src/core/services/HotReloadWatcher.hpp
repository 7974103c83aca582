#pragma once

#include <QFileSystemWatcher>
#include <QHash>
#include <QObject>
#include <QTimer>

namespace hush {

class ConfigStore;
class ThemeStore;

/// Watches the config file, the four stylesheets and the config directory
/// (editors that save by rename replace the watched inode). Change events
/// are debounced, then only the documents whose mtime/size changed are
/// reloaded.
class HotReloadWatcher : public QObject {
    Q_OBJECT
public:
    static constexpr int kDefaultDebounceMs = 250;

    HotReloadWatcher(ConfigStore& config, ThemeStore& theme, QObject* parent = nullptr);

    void start();
    void stop();
    void setDebounceMs(int ms) { debounce_.setInterval(ms); }

signals:
    void reloadAttempted(bool configChanged, bool themeChanged);

private slots:
    void onPathChanged(const QString& path);
    void applyPending();

private:
    static QString fingerprint(const QString& path);
    void rewatch();
    void rememberFingerprints();

    ConfigStore& config_;
    ThemeStore& theme_;
    QFileSystemWatcher watcher_;
    QTimer debounce_;
    QHash<QString, QString> fingerprints_;
};

} // namespace hush
