#include "ThemeStore.hpp"
#include "ConfigStore.hpp"
#include <QDir>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace hush {

namespace {

QJsonObject assetJson(const ThemeAsset& asset, bool withCss)
{
    QJsonObject obj{
        {"path", asset.path},
        {"valid", asset.valid},
        {"missing", asset.missing},
    };
    if (withCss)
        obj["css"] = asset.css;
    return obj;
}

} // namespace

QJsonObject ThemeSet::toJson(bool withCss) const
{
    return {
        {"base", assetJson(base, withCss)},
        {"popup", assetJson(popup, withCss)},
        {"panel", assetJson(panel, withCss)},
        {"widgets", assetJson(widgets, withCss)},
    };
}

ThemeStore::ThemeStore(ConfigStore& config, ThemeAssetCache& cache, QObject* parent)
    : QObject(parent)
    , config_(config)
    , cache_(cache)
{
}

QStringList ThemeStore::paths() const
{
    auto snapshot = config_.snapshot();
    const QDir dir(snapshot->configDir.isEmpty() ? QDir::currentPath() : snapshot->configDir);
    return {
        dir.absoluteFilePath(snapshot->theme.base),
        dir.absoluteFilePath(snapshot->theme.popup),
        dir.absoluteFilePath(snapshot->theme.panel),
        dir.absoluteFilePath(snapshot->theme.widgets),
    };
}

bool ThemeStore::reload()
{
    const QStringList files = paths();

    ThemeSet next;
    ThemeAsset* targets[] = {&next.base, &next.popup, &next.panel, &next.widgets};
    for (int i = 0; i < 4; ++i) {
        *targets[i] = cache_.load(files.at(i));
        if (!targets[i]->valid) {
            const QString error = QStringLiteral("stylesheet %1 failed validation").arg(files.at(i));
            BOOST_LOG_TRIVIAL(warning) << "[ThemeStore] " << error.toStdString()
                                       << ", keeping previous theme";
            emit themeReloadFailed(error);
            return false;
        }
    }
    next.loaded = true;

    {
        QWriteLocker lock(&lock_);
        current_ = next;
    }
    BOOST_LOG_TRIVIAL(info) << "[ThemeStore] Theme loaded from "
                            << QFileInfo(files.first()).absolutePath().toStdString();
    emit themeReloaded();
    return true;
}

ThemeSet ThemeStore::current() const
{
    QReadLocker lock(&lock_);
    return current_;
}

} // namespace hush
