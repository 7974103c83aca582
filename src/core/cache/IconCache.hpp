#pragma once

#include "core/Notification.hpp"
#include "core/cache/LruCache.hpp"
#include <QImage>
#include <atomic>

namespace hush {

/// Decoded notification icons keyed by content fingerprint.
/// A failed decode is remembered as a null QImage with retry backoff.
class IconCache {
public:
    static constexpr int kMaxIconSize = 512;

    explicit IconCache(qint64 budgetBytes);

    /// "path:<abs>@<mtime ms>:<size>", or empty when the file is missing.
    static QString fingerprintForPath(const QString& path);
    /// "data:<sha1>:<w>x<h>:<channels>"
    static QString fingerprintForImage(const RawImage& image);

    QImage iconForPath(const QString& path);
    QImage iconForImage(const RawImage& image);

    /// Inline image data wins, then image-path, then a file-path app icon.
    QImage iconFor(const Notification& n);

    static QImage decodeImage(const RawImage& image);
    static QImage decodeFile(const QString& path);

    void setBudget(qint64 budgetBytes) { cache_.setBudget(budgetBytes); }
    int decodeCount() const { return decodes_.load(); }
    LruCache<QImage>& cache() { return cache_; }

private:
    LruCache<QImage> cache_;
    std::atomic<int> decodes_{0};
};

} // namespace hush
