#include "core/cache/ThemeAssetCache.hpp"
#include <QFile>
#include <QFileInfo>

namespace hush {

ThemeAssetCache::ThemeAssetCache(qint64 budgetBytes)
    : cache_("ThemeAssetCache", budgetBytes, [](const ThemeAsset& asset) {
          return static_cast<qint64>(asset.css.size() * sizeof(QChar) + asset.path.size() * sizeof(QChar));
      })
{
}

void ThemeAssetCache::validateStylesheet(const QString& css)
{
    int depth = 0;
    int line = 1;
    QChar quote;
    for (int i = 0; i < css.size(); ++i) {
        const QChar c = css.at(i);
        if (c == '\n') ++line;

        if (!quote.isNull()) {
            if (c == '\\') ++i;
            else if (c == quote) quote = QChar();
            continue;
        }
        if (c == '/' && i + 1 < css.size() && css.at(i + 1) == '*') {
            const int end = css.indexOf(QLatin1String("*/"), i + 2);
            if (end < 0)
                throw CacheComputeError("unterminated comment starting on line " + std::to_string(line));
            line += css.mid(i, end - i).count('\n');
            i = end + 1;
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth < 0)
                throw CacheComputeError("unexpected '}' on line " + std::to_string(line));
        }
    }
    if (!quote.isNull())
        throw CacheComputeError("unterminated string");
    if (depth != 0)
        throw CacheComputeError("unclosed '{' at end of file");
}

ThemeAsset ThemeAssetCache::load(const QString& path)
{
    const QFileInfo info(path);
    if (!info.exists()) {
        ThemeAsset asset;
        asset.path = info.absoluteFilePath();
        asset.valid = true;
        asset.missing = true;
        return asset;
    }

    const QString key = QStringLiteral("%1@%2:%3")
        .arg(info.absoluteFilePath())
        .arg(info.lastModified().toMSecsSinceEpoch())
        .arg(info.size());

    ThemeAsset asset = cache_.getOrCompute(key, [this, path = info.absoluteFilePath()]() {
        ++loads_;
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
            throw CacheComputeError(file.errorString().toStdString());

        ThemeAsset loaded;
        loaded.path = path;
        loaded.css = QString::fromUtf8(file.readAll());
        validateStylesheet(loaded.css);
        loaded.valid = true;
        return loaded;
    });
    if (!asset.valid)
        asset.path = info.absoluteFilePath();
    return asset;
}

} // namespace hush
