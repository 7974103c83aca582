#include "ConfigStore.hpp"
#include "core/ConfigError.hpp"
#include <boost/log/trivial.hpp>

namespace hush {

ConfigStore::ConfigStore(const QString& configPath, QObject* parent)
    : QObject(parent)
    , configPath_(configPath)
    , current_(std::make_shared<const ConfigSnapshot>(ConfigSnapshot::defaults()))
{
}

std::shared_ptr<const ConfigSnapshot> ConfigStore::snapshot() const
{
    return std::atomic_load(&current_);
}

bool ConfigStore::reload()
{
    try {
        auto next = std::make_shared<const ConfigSnapshot>(ConfigSnapshot::loadFile(configPath_));
        std::atomic_store(&current_, next);
    } catch (const ConfigError& e) {
        lastError_ = QString::fromStdString(e.what());
        BOOST_LOG_TRIVIAL(warning) << "[ConfigStore] Reload rejected, keeping previous config: " << e.what();
        emit reloadFailed(lastError_);
        return false;
    }

    lastError_.clear();
    ++generation_;
    BOOST_LOG_TRIVIAL(info) << "[ConfigStore] Loaded " << configPath_.toStdString()
                            << " (generation " << generation_ << ")";
    emit configReloaded();
    return true;
}

void ConfigStore::replace(ConfigSnapshot snapshot)
{
    std::atomic_store(&current_, std::make_shared<const ConfigSnapshot>(std::move(snapshot)));
    lastError_.clear();
    ++generation_;
    emit configReloaded();
}

} // namespace hush
