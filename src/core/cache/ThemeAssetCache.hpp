#pragma once

#include "core/cache/LruCache.hpp"
#include <QString>
#include <atomic>

namespace hush {

struct ThemeAsset {
    QString path;
    QString css;
    bool valid = false;    // false for placeholders of failed loads
    bool missing = false;  // file absent; css is empty and the asset is valid
};

/// Stylesheets read from disk and structurally checked, keyed by
/// path + mtime + size so an edited file is a different key.
class ThemeAssetCache {
public:
    explicit ThemeAssetCache(qint64 budgetBytes);

    /// Returns an invalid placeholder when the file cannot be read or its
    /// braces/comments do not balance.
    ThemeAsset load(const QString& path);

    /// Throws CacheComputeError with the first structural problem found.
    static void validateStylesheet(const QString& css);

    void setBudget(qint64 budgetBytes) { cache_.setBudget(budgetBytes); }
    int loadCount() const { return loads_.load(); }

private:
    LruCache<ThemeAsset> cache_;
    std::atomic<int> loads_{0};
};

} // namespace hush
