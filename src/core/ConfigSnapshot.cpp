#include "core/ConfigSnapshot.hpp"
#include "core/ConfigError.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <string>

namespace hush {

namespace {

// Maps recurse; scalars and sequences from the user file replace the
// default wholesale, so a user `watchers:` list is the complete list.
YAML::Node overlay(const YAML::Node& defaults, const YAML::Node& user)
{
    if (!user.IsDefined() || user.IsNull())
        return YAML::Clone(defaults);
    if (!defaults.IsMap() || !user.IsMap())
        return YAML::Clone(user);

    YAML::Node merged = YAML::Clone(defaults);
    for (const auto& entry : user) {
        const std::string key = entry.first.as<std::string>();
        const YAML::Node existing = merged[key];
        merged[key] = existing.IsDefined() ? overlay(existing, entry.second)
                                           : YAML::Clone(entry.second);
    }
    return merged;
}

QString readString(const YAML::Node& node, const char* key, const QString& fallback)
{
    const YAML::Node value = node[key];
    if (!value.IsDefined() || value.IsNull())
        return fallback;
    return QString::fromStdString(value.as<std::string>());
}

int readInt(const YAML::Node& node, const char* section, const char* key, int min)
{
    const int value = node[key].as<int>();
    if (value < min)
        throw ConfigError(std::string(section) + "." + key + " must be >= " + std::to_string(min));
    return value;
}

QTime parseClock(const YAML::Node& node, const std::string& where)
{
    const QString text = QString::fromStdString(node.as<std::string>()).trimmed();
    QTime t = QTime::fromString(text, "HH:mm");
    if (!t.isValid())
        t = QTime::fromString(text, "H:mm");
    if (!t.isValid())
        throw ConfigError(where + ": invalid time '" + text.toStdString() + "', expected HH:mm");
    return t;
}

QSet<int> parseDays(const YAML::Node& node, const std::string& where)
{
    QSet<int> days;
    if (!node.IsDefined() || node.IsNull()) {
        for (int d = Qt::Monday; d <= Qt::Sunday; ++d) days.insert(d);
        return days;
    }

    if (node.IsScalar()) {
        const QString group = QString::fromStdString(node.as<std::string>()).toLower();
        if (group == "daily" || group == "all") {
            for (int d = Qt::Monday; d <= Qt::Sunday; ++d) days.insert(d);
        } else if (group == "weekdays") {
            for (int d = Qt::Monday; d <= Qt::Friday; ++d) days.insert(d);
        } else if (group == "weekends") {
            days = {Qt::Saturday, Qt::Sunday};
        } else {
            throw ConfigError(where + ": unknown day group '" + group.toStdString() + "'");
        }
        return days;
    }

    static const char* const names[] = {"mon", "tue", "wed", "thu", "fri", "sat", "sun"};
    for (const auto& item : node) {
        const QString day = QString::fromStdString(item.as<std::string>()).trimmed().toLower();
        int found = 0;
        for (int i = 0; i < 7; ++i) {
            if (day.startsWith(QLatin1String(names[i])))
                found = i + 1;
        }
        if (found == 0)
            throw ConfigError(where + ": unknown day '" + day.toStdString() + "'");
        days.insert(found);
    }
    return days;
}

WatcherSpec parseWatcher(const YAML::Node& node, int index, const WidgetSettings& widgets)
{
    const std::string where = "widgets.watchers[" + std::to_string(index) + "]";
    if (!node.IsMap())
        throw ConfigError(where + ": expected a mapping");

    WatcherSpec spec;
    spec.id = readString(node, "id", {}).trimmed();
    spec.command = readString(node, "command", {}).trimmed();
    spec.watchCommand = readString(node, "watch_command", {}).trimmed();
    if (spec.id.isEmpty())
        throw ConfigError(where + ": id is required");
    if (spec.command.isEmpty())
        throw ConfigError(where + ": command is required");

    spec.intervalMs = node["interval_ms"] ? readInt(node, where.c_str(), "interval_ms", 100)
                                          : widgets.refreshIntervalMs;
    spec.timeoutMs = node["timeout_ms"] ? readInt(node, where.c_str(), "timeout_ms", 1) : 350;
    spec.jitterMs = node["jitter_ms"] ? readInt(node, where.c_str(), "jitter_ms", 0) : 200;
    spec.enabled = node["enabled"].as<bool>(true);
    return spec;
}

YAML::Node watcherNode(const char* id, const char* command, const char* watch,
                       int intervalMs, int timeoutMs)
{
    YAML::Node w;
    w["id"] = id;
    w["command"] = command;
    if (watch)
        w["watch_command"] = watch;
    w["interval_ms"] = intervalMs;
    w["timeout_ms"] = timeoutMs;
    w["jitter_ms"] = 200;
    w["enabled"] = true;
    return w;
}

} // namespace

bool DndWindow::contains(const QDateTime& at) const
{
    const int day = at.date().dayOfWeek();
    const QTime t = at.time();

    if (start == end)
        return days.contains(day);
    if (start < end)
        return days.contains(day) && t >= start && t < end;

    const int previousDay = day == Qt::Monday ? Qt::Sunday : day - 1;
    return (days.contains(day) && t >= start) || (days.contains(previousDay) && t < end);
}

YAML::Node ConfigSnapshot::defaultTree()
{
    YAML::Node root(YAML::NodeType::Map);

    root["general"]["log_level"] = "info";
    root["general"]["dnd_default"] = false;

    root["popups"]["default_timeout_ms"] = 5000;
    root["popups"]["critical_timeout_ms"] = 0;

    root["history"]["max_entries"] = 200;
    root["history"]["max_active"] = 500;
    root["history"]["transient_to_history"] = false;
    root["history"]["dedup_window_ms"] = 2000;
    root["history"]["persist"] = false;

    root["dnd"]["allow_critical"] = true;
    root["dnd"]["tick_ms"] = 30000;
    root["dnd"]["windows"] = YAML::Node(YAML::NodeType::Sequence);

    root["rules"] = YAML::Node(YAML::NodeType::Sequence);

    root["widgets"]["max_concurrent"] = 2;
    root["widgets"]["max_streams"] = 4;
    root["widgets"]["refresh_interval_ms"] = 1000;
    root["widgets"]["refresh_interval_slow_ms"] = 3000;

    YAML::Node watchers(YAML::NodeType::Sequence);
    watchers.push_back(watcherNode("network-status", "nmcli -t -f STATE general", "nmcli monitor", 5000, 800));
    watchers.push_back(watcherNode("bluetooth", "bluetoothctl show", nullptr, 10000, 800));
    watchers.push_back(watcherNode("radio-kill", "rfkill -n -o TYPE,SOFT,HARD", nullptr, 10000, 800));
    watchers.push_back(watcherNode("audio", "wpctl get-volume @DEFAULT_AUDIO_SINK@", "pactl subscribe", 3000, 350));
    root["widgets"]["watchers"] = watchers;

    root["sound"]["enabled"] = false;
    root["sound"]["default_name"] = "message-new-instant";
    root["sound"]["default_file"] = "";
    root["sound"]["min_interval_ms"] = 250;
    root["sound"]["timeout_ms"] = 1200;

    root["theme"]["base"] = "base.css";
    root["theme"]["popup"] = "popup.css";
    root["theme"]["panel"] = "panel.css";
    root["theme"]["widgets"] = "widgets.css";

    root["cache"]["icon_budget_bytes"] = 8 * 1024 * 1024;
    root["cache"]["theme_budget_bytes"] = 1024 * 1024;

    return root;
}

ConfigSnapshot ConfigSnapshot::defaults()
{
    return fromYaml(YAML::Node());
}

ConfigSnapshot ConfigSnapshot::fromYaml(const YAML::Node& user)
{
    if (user.IsDefined() && !user.IsNull() && !user.IsMap())
        throw ConfigError("top level of the configuration must be a mapping");

    ConfigSnapshot s;
    try {
        const YAML::Node root = overlay(defaultTree(), user);

        const YAML::Node general = root["general"];
        s.general.logLevel = readString(general, "log_level", "info").toLower();
        static const QStringList levels = {"trace", "debug", "info", "warn", "warning", "error", "fatal"};
        if (!levels.contains(s.general.logLevel))
            throw ConfigError("general.log_level: unknown level '" + s.general.logLevel.toStdString() + "'");
        s.general.dndDefault = general["dnd_default"].as<bool>();

        const YAML::Node popups = root["popups"];
        s.popups.defaultTimeoutMs = readInt(popups, "popups", "default_timeout_ms", 0);
        s.popups.criticalTimeoutMs = readInt(popups, "popups", "critical_timeout_ms", 0);

        const YAML::Node history = root["history"];
        s.history.maxEntries = readInt(history, "history", "max_entries", 1);
        s.history.maxActive = readInt(history, "history", "max_active", 1);
        s.history.transientToHistory = history["transient_to_history"].as<bool>();
        s.history.dedupWindowMs = readInt(history, "history", "dedup_window_ms", 0);
        s.history.persist = history["persist"].as<bool>();

        const YAML::Node dnd = root["dnd"];
        s.dnd.allowCritical = dnd["allow_critical"].as<bool>();
        s.dnd.tickMs = readInt(dnd, "dnd", "tick_ms", 1000);
        if (!dnd["windows"].IsSequence())
            throw ConfigError("dnd.windows must be a list");
        int w = 0;
        for (const auto& item : dnd["windows"]) {
            const std::string where = "dnd.windows[" + std::to_string(w++) + "]";
            if (!item["start"] || !item["end"])
                throw ConfigError(where + ": start and end are required");
            DndWindow window;
            window.start = parseClock(item["start"], where);
            window.end = parseClock(item["end"], where);
            window.days = parseDays(item["days"], where);
            s.dnd.windows.append(window);
        }

        if (!root["rules"].IsSequence())
            throw ConfigError("rules must be a list");
        int r = 0;
        for (const auto& item : root["rules"])
            s.rules.push_back(parseRule(item, r++));

        const YAML::Node widgets = root["widgets"];
        s.widgets.maxConcurrent = readInt(widgets, "widgets", "max_concurrent", 1);
        s.widgets.maxStreams = readInt(widgets, "widgets", "max_streams", 0);
        s.widgets.refreshIntervalMs = readInt(widgets, "widgets", "refresh_interval_ms", 100);
        s.widgets.refreshIntervalSlowMs = readInt(widgets, "widgets", "refresh_interval_slow_ms", 100);
        if (!widgets["watchers"].IsSequence())
            throw ConfigError("widgets.watchers must be a list");
        QSet<QString> seen;
        int i = 0;
        for (const auto& item : widgets["watchers"]) {
            WatcherSpec spec = parseWatcher(item, i++, s.widgets);
            if (seen.contains(spec.id))
                throw ConfigError("widgets.watchers: duplicate id '" + spec.id.toStdString() + "'");
            seen.insert(spec.id);
            s.widgets.watchers.append(spec);
        }

        const YAML::Node sound = root["sound"];
        s.sound.enabled = sound["enabled"].as<bool>();
        s.sound.defaultName = readString(sound, "default_name", {});
        s.sound.defaultFile = readString(sound, "default_file", {});
        s.sound.minIntervalMs = readInt(sound, "sound", "min_interval_ms", 0);
        s.sound.timeoutMs = readInt(sound, "sound", "timeout_ms", 1);

        const YAML::Node theme = root["theme"];
        s.theme.base = readString(theme, "base", "base.css");
        s.theme.popup = readString(theme, "popup", "popup.css");
        s.theme.panel = readString(theme, "panel", "panel.css");
        s.theme.widgets = readString(theme, "widgets", "widgets.css");
        for (const QString* name : {&s.theme.base, &s.theme.popup, &s.theme.panel, &s.theme.widgets}) {
            if (name->trimmed().isEmpty())
                throw ConfigError("theme: stylesheet file names must not be empty");
        }

        const YAML::Node cache = root["cache"];
        s.cache.iconBudgetBytes = cache["icon_budget_bytes"].as<qint64>();
        s.cache.themeBudgetBytes = cache["theme_budget_bytes"].as<qint64>();
        if (s.cache.iconBudgetBytes < 0 || s.cache.themeBudgetBytes < 0)
            throw ConfigError("cache budgets must not be negative");
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }
    return s;
}

ConfigSnapshot ConfigSnapshot::loadFile(const QString& path)
{
    const QFileInfo info(path);
    YAML::Node user;

    if (info.exists()) {
        if (!info.isReadable())
            throw ConfigError("cannot read " + path.toStdString());
        try {
            user = YAML::LoadFile(path.toStdString());
        } catch (const YAML::BadFile& e) {
            throw ConfigError("cannot read " + path.toStdString() + ": " + e.what());
        } catch (const YAML::ParserException& e) {
            throw ConfigError("parse error in " + path.toStdString() + ": " + e.what());
        }
    }

    ConfigSnapshot s = fromYaml(user);
    s.sourcePath = info.absoluteFilePath();
    s.configDir = info.absolutePath();
    return s;
}

QString defaultConfigDir()
{
    const QByteArray xdg = qgetenv("XDG_CONFIG_HOME");
    if (!xdg.isEmpty())
        return QDir(QString::fromLocal8Bit(xdg)).filePath("hushd");
    const QByteArray home = qgetenv("HOME");
    if (home.isEmpty())
        throw ConfigError("neither XDG_CONFIG_HOME nor HOME is set");
    return QDir(QString::fromLocal8Bit(home)).filePath(".config/hushd");
}

} // namespace hush
