#pragma once

#include "core/rules/Rule.hpp"
#include <QDateTime>
#include <QList>
#include <QSet>
#include <QString>
#include <QTime>
#include <yaml-cpp/yaml.h>

namespace hush {

struct GeneralSettings {
    QString logLevel = "info";
    bool dndDefault = false;
};

struct PopupSettings {
    int defaultTimeoutMs = 5000;
    int criticalTimeoutMs = 0;  // 0 = critical notifications never expire
};

struct HistorySettings {
    int maxEntries = 200;
    int maxActive = 500;
    bool transientToHistory = false;
    int dedupWindowMs = 2000;
    bool persist = false;
};

/// A recurring quiet window. A window that wraps past midnight belongs to
/// the day it starts on.
struct DndWindow {
    QTime start;
    QTime end;
    QSet<int> days;  // Qt::DayOfWeek values, 1 = Monday

    bool contains(const QDateTime& at) const;
};

struct DndSettings {
    bool allowCritical = true;
    int tickMs = 30000;
    QList<DndWindow> windows;
};

struct WatcherSpec {
    QString id;
    QString command;
    QString watchCommand;
    int intervalMs = 1000;
    int timeoutMs = 350;
    int jitterMs = 200;
    bool enabled = true;
};

struct WidgetSettings {
    int maxConcurrent = 2;
    int maxStreams = 4;
    int refreshIntervalMs = 1000;
    int refreshIntervalSlowMs = 3000;
    QList<WatcherSpec> watchers;
};

struct SoundSettings {
    bool enabled = false;
    QString defaultName = "message-new-instant";
    QString defaultFile;
    int minIntervalMs = 250;
    int timeoutMs = 1200;
};

struct ThemeSettings {
    QString base = "base.css";
    QString popup = "popup.css";
    QString panel = "panel.css";
    QString widgets = "widgets.css";
};

struct CacheSettings {
    qint64 iconBudgetBytes = 8 * 1024 * 1024;
    qint64 themeBudgetBytes = 1024 * 1024;
};

/// Immutable, fully validated configuration. Shared between readers as
/// std::shared_ptr<const ConfigSnapshot>.
struct ConfigSnapshot {
    GeneralSettings general;
    PopupSettings popups;
    HistorySettings history;
    DndSettings dnd;
    WidgetSettings widgets;
    SoundSettings sound;
    ThemeSettings theme;
    CacheSettings cache;
    std::vector<Rule> rules;

    QString sourcePath;
    QString configDir;

    /// Built-in document every user file is merged over.
    static YAML::Node defaultTree();

    static ConfigSnapshot defaults();

    /// Merges root over the defaults and validates. Throws ConfigError.
    static ConfigSnapshot fromYaml(const YAML::Node& root);

    /// Missing file yields defaults. Throws ConfigError on read/parse/validation failure.
    static ConfigSnapshot loadFile(const QString& path);
};

/// $XDG_CONFIG_HOME/hushd, falling back to ~/.config/hushd.
/// Throws ConfigError when neither XDG_CONFIG_HOME nor HOME is set.
QString defaultConfigDir();

} // namespace hush
