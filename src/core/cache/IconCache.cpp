#include "core/cache/IconCache.hpp"
#include <QCryptographicHash>
#include <QFileInfo>
#include <QImageReader>
#include <QUrl>

namespace hush {

namespace {

QString localPath(const QString& reference)
{
    if (reference.startsWith(QLatin1String("file://")))
        return QUrl(reference).toLocalFile();
    return reference;
}

QImage boundedCopy(const QImage& image)
{
    if (image.width() <= IconCache::kMaxIconSize && image.height() <= IconCache::kMaxIconSize)
        return image;
    return image.scaled(IconCache::kMaxIconSize, IconCache::kMaxIconSize,
                        Qt::KeepAspectRatio, Qt::SmoothTransformation);
}

} // namespace

IconCache::IconCache(qint64 budgetBytes)
    : cache_("IconCache", budgetBytes, [](const QImage& image) {
          return static_cast<qint64>(image.sizeInBytes());
      })
{
}

QString IconCache::fingerprintForPath(const QString& path)
{
    const QFileInfo info(localPath(path));
    if (!info.exists() || !info.isFile())
        return {};
    return QStringLiteral("path:%1@%2:%3")
        .arg(info.absoluteFilePath())
        .arg(info.lastModified().toMSecsSinceEpoch())
        .arg(info.size());
}

QString IconCache::fingerprintForImage(const RawImage& image)
{
    const QByteArray digest = QCryptographicHash::hash(image.data, QCryptographicHash::Sha1).toHex();
    return QStringLiteral("data:%1:%2x%3:%4")
        .arg(QString::fromLatin1(digest))
        .arg(image.width)
        .arg(image.height)
        .arg(image.channels);
}

QImage IconCache::decodeImage(const RawImage& image)
{
    if (!image.isConsistent())
        throw CacheComputeError("inconsistent image data");
    if (!image.isUsable())
        throw CacheComputeError("image data over size limits");

    QImage::Format format = QImage::Format_RGB888;
    if (image.channels == 4)
        format = image.hasAlpha ? QImage::Format_RGBA8888 : QImage::Format_RGBX8888;

    const QImage view(reinterpret_cast<const uchar*>(image.data.constData()),
                      image.width, image.height, image.rowstride, format);
    if (view.isNull())
        throw CacheComputeError("unsupported image layout");
    // view borrows image.data; copy() detaches before it goes away
    return boundedCopy(view.copy());
}

QImage IconCache::decodeFile(const QString& path)
{
    QImageReader reader(localPath(path));
    reader.setAutoTransform(true);
    const QSize size = reader.size();
    if (size.isValid() && (size.width() > kMaxIconSize || size.height() > kMaxIconSize))
        reader.setScaledSize(size.scaled(kMaxIconSize, kMaxIconSize, Qt::KeepAspectRatio));

    QImage image = reader.read();
    if (image.isNull())
        throw CacheComputeError(reader.errorString().toStdString());
    return boundedCopy(image);
}

QImage IconCache::iconForPath(const QString& path)
{
    const QString key = fingerprintForPath(path);
    if (key.isEmpty())
        return {};
    return cache_.getOrCompute(key, [this, path]() {
        ++decodes_;
        return decodeFile(path);
    });
}

QImage IconCache::iconForImage(const RawImage& image)
{
    return cache_.getOrCompute(fingerprintForImage(image), [this, image]() {
        ++decodes_;
        return decodeImage(image);
    });
}

QImage IconCache::iconFor(const Notification& n)
{
    if (n.imageData)
        return iconForImage(*n.imageData);
    if (!n.imagePath.isEmpty())
        return iconForPath(n.imagePath);
    if (n.appIcon.startsWith('/') || n.appIcon.startsWith(QLatin1String("file://")))
        return iconForPath(n.appIcon);
    return {};
}

} // namespace hush
