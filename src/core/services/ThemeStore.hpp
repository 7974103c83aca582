#pragma once

#include "core/cache/ThemeAssetCache.hpp"
#include <QJsonObject>
#include <QObject>
#include <QReadWriteLock>
#include <QStringList>

namespace hush {

class ConfigStore;

struct ThemeSet {
    ThemeAsset base;
    ThemeAsset popup;
    ThemeAsset panel;
    ThemeAsset widgets;
    bool loaded = false;

    QJsonObject toJson(bool withCss) const;
};

/// The four stylesheets the panel and popups render with, resolved
/// relative to the config directory using the file names from config.
class ThemeStore : public QObject {
    Q_OBJECT
public:
    ThemeStore(ConfigStore& config, ThemeAssetCache& cache, QObject* parent = nullptr);

    /// Loads all four files. If any present file fails validation the
    /// previous set stays current and themeReloadFailed is emitted.
    bool reload();

    ThemeSet current() const;
    QStringList paths() const;

signals:
    void themeReloaded();
    void themeReloadFailed(const QString& error);

private:
    ConfigStore& config_;
    ThemeAssetCache& cache_;
    mutable QReadWriteLock lock_;
    ThemeSet current_;
};

} // namespace hush
