#pragma once

#include "core/ConfigSnapshot.hpp"
#include <QObject>
#include <memory>

namespace hush {

/// Owner of the live configuration snapshot.
///
/// snapshot() never blocks and never returns null: it starts with the
/// built-in defaults. reload() swaps the pointer atomically; readers that
/// still hold the previous snapshot keep a valid object until they drop it.
class ConfigStore : public QObject {
    Q_OBJECT
public:
    explicit ConfigStore(const QString& configPath, QObject* parent = nullptr);

    std::shared_ptr<const ConfigSnapshot> snapshot() const;

    /// Parses the file and publishes the result. On failure the current
    /// snapshot stays live, lastError() is set and reloadFailed is emitted.
    bool reload();

    /// Publishes an already-built snapshot (used for in-memory setups).
    void replace(ConfigSnapshot snapshot);

    QString configPath() const { return configPath_; }
    QString lastError() const { return lastError_; }
    int generation() const { return generation_; }

signals:
    void configReloaded();
    void reloadFailed(const QString& error);

private:
    QString configPath_;
    std::shared_ptr<const ConfigSnapshot> current_;
    QString lastError_;
    int generation_ = 0;
};

} // namespace hush
