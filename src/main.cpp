#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDir>
#include <QFileInfo>
#include <QThreadPool>
#include <boost/log/trivial.hpp>
#include <iostream>
#include "core/ConfigError.hpp"
#include "core/Logging.hpp"
#include "core/cache/IconCache.hpp"
#include "core/cache/ThemeAssetCache.hpp"
#include "core/command/CommandRunner.hpp"
#include "core/command/WatcherResults.hpp"
#include "core/command/WatcherService.hpp"
#include "core/dnd/DndScheduler.hpp"
#include "core/history/HistoryStore.hpp"
#include "core/services/ConfigStore.hpp"
#include "core/services/ControlServer.hpp"
#include "core/services/EventBus.hpp"
#include "core/services/ExpiryScheduler.hpp"
#include "core/services/HotReloadWatcher.hpp"
#include "core/services/NotificationService.hpp"
#include "core/services/NotificationsAdaptor.hpp"
#include "core/services/SoundPlayer.hpp"
#include "core/services/ThemeStore.hpp"

#ifndef HUSHD_VERSION
#define HUSHD_VERSION "0.1.0"
#endif

namespace {

/// $XDG_STATE_HOME/hushd/history.json, default ~/.local/state/hushd/history.json.
QString historyPath()
{
    QString stateHome = qEnvironmentVariable("XDG_STATE_HOME");
    if (stateHome.isEmpty())
        stateHome = QDir::homePath() + QStringLiteral("/.local/state");
    return stateHome + QStringLiteral("/hushd/history.json");
}

void saveHistory(const hush::HistoryStore& history)
{
    const QString path = historyPath();
    if (!QDir().mkpath(QFileInfo(path).absolutePath()) || !history.save(path))
        BOOST_LOG_TRIVIAL(warning) << "[main] History not saved to " << path.toStdString();
}

QVariantMap historyCounts(const hush::HistoryStore& history)
{
    return {
        {"active", history.activeCount()},
        {"unread", history.unreadCount()},
        {"critical", history.criticalActiveCount()},
        {"size", history.size()},
    };
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("hushd");
    app.setApplicationVersion(HUSHD_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Desktop notification daemon");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{"c", "config"},
        "Configuration file (default: $XDG_CONFIG_HOME/hushd/config.yaml).", "path");
    QCommandLineOption checkOption("check", "Validate the configuration and theme, then exit.");
    QCommandLineOption replaceOption("replace", "Take over org.freedesktop.Notifications from the running server.");
    parser.addOption(configOption);
    parser.addOption(checkOption);
    parser.addOption(replaceOption);
    parser.process(app);

    hush::initLogging("info");

    QString configPath = parser.value(configOption);
    if (configPath.isEmpty()) {
        try {
            configPath = hush::defaultConfigDir() + "/config.yaml";
        } catch (const hush::ConfigError& e) {
            BOOST_LOG_TRIVIAL(fatal) << "[main] " << e.what();
            return 1;
        }
    }
    configPath = QFileInfo(configPath).absoluteFilePath();

    hush::ConfigStore config(configPath);
    if (!config.reload()) {
        if (parser.isSet(checkOption))
            std::cerr << configPath.toStdString() << ": " << config.lastError().toStdString() << std::endl;
        BOOST_LOG_TRIVIAL(fatal) << "[main] Cannot start with an invalid config: "
                                 << config.lastError().toStdString();
        return 1;
    }
    auto snapshot = config.snapshot();
    hush::initLogging(snapshot->general.logLevel);

    hush::ThemeAssetCache themeCache(snapshot->cache.themeBudgetBytes);
    hush::ThemeStore theme(config, themeCache);
    const bool themeOk = theme.reload();

    if (parser.isSet(checkOption)) {
        if (!themeOk) {
            std::cerr << "theme: one or more stylesheets are invalid" << std::endl;
            return 1;
        }
        std::cout << configPath.toStdString() << ": OK (" << snapshot->rules.size() << " rules, "
                  << snapshot->widgets.watchers.size() << " watchers)" << std::endl;
        return 0;
    }

    const QString configDir = QFileInfo(configPath).absolutePath();
    if (!QDir().mkpath(configDir)) {
        BOOST_LOG_TRIVIAL(fatal) << "[main] Cannot create config directory " << configDir.toStdString();
        return 1;
    }

    BOOST_LOG_TRIVIAL(info) << "[main] hushd " << HUSHD_VERSION << " starting, config "
                            << configPath.toStdString();

    hush::EventBus eventBus;
    hush::IconCache icons(snapshot->cache.iconBudgetBytes);

    hush::HistoryStore history(snapshot->history.maxEntries);
    if (snapshot->history.persist) {
        const int loaded = history.load(historyPath());
        BOOST_LOG_TRIVIAL(info) << "[main] Restored " << loaded << " history entries";
    }

    hush::DndScheduler dnd(config);
    hush::ExpiryScheduler expiry;
    hush::CommandRunner runner(snapshot->widgets.maxConcurrent, snapshot->widgets.maxStreams);
    hush::WatcherResults watcherResults;
    hush::WatcherService watchers(config, runner, watcherResults);
    hush::SoundPlayer sound(config, runner);

    hush::NotificationService notifications(config, history, dnd, expiry);
    notifications.setIconCache(&icons);
    notifications.setSoundPlayer(&sound);

    hush::HotReloadWatcher hotReload(config, theme);

    // --- Config reload fan-out ---
    QObject::connect(&config, &hush::ConfigStore::configReloaded, &app, [&]() {
        auto next = config.snapshot();
        hush::initLogging(next->general.logLevel);
        icons.setBudget(next->cache.iconBudgetBytes);
        themeCache.setBudget(next->cache.themeBudgetBytes);
        history.setCapacity(next->history.maxEntries);
        eventBus.publish(hush::topics::ConfigReloaded, QVariantMap{{"generation", config.generation()}});
    });
    QObject::connect(&config, &hush::ConfigStore::reloadFailed, &app, [&](const QString& error) {
        eventBus.publish(hush::topics::ConfigFailed, QVariantMap{{"error", error}});
    });
    QObject::connect(&theme, &hush::ThemeStore::themeReloaded, &app, [&]() {
        eventBus.publish(hush::topics::ThemeReloaded, theme.current().toJson(false).toVariantMap());
    });

    // --- State publication ---
    QObject::connect(&history, &hush::HistoryStore::changed, &app, [&]() {
        eventBus.publishCoalesced(hush::topics::HistoryChanged, historyCounts(history));
    });
    QObject::connect(&dnd, &hush::DndScheduler::stateChanged, &app, [&](hush::DndState state) {
        eventBus.publish(hush::topics::DndChanged,
                         QVariantMap{{"state", hush::dndStateName(state)},
                                     {"active", state != hush::DndState::Off}});
    });
    QObject::connect(&watchers, &hush::WatcherService::resultUpdated, &app, [&](const QString& id) {
        eventBus.publishCoalesced(hush::topics::WatchersUpdated, QVariantMap{{"id", id}});
    });
    QObject::connect(&notifications, &hush::NotificationService::historyCleared, &app, [&]() {
        if (config.snapshot()->history.persist)
            saveHistory(history);
    });

    // --- Session bus ---
    QDBusConnection sessionBus = QDBusConnection::sessionBus();
    if (!sessionBus.isConnected()) {
        BOOST_LOG_TRIVIAL(fatal) << "[main] No session bus: "
                                 << sessionBus.lastError().message().toStdString();
        return 1;
    }

    hush::NotificationsAdaptor adaptor(notifications);
    if (!sessionBus.registerObject(hush::NotificationsAdaptor::kObjectPath, &adaptor,
                                   QDBusConnection::ExportAllSlots | QDBusConnection::ExportAllSignals)) {
        BOOST_LOG_TRIVIAL(fatal) << "[main] Cannot register " << hush::NotificationsAdaptor::kObjectPath;
        return 1;
    }

    const auto queueOption = parser.isSet(replaceOption)
        ? QDBusConnectionInterface::ReplaceExistingService
        : QDBusConnectionInterface::DontQueueService;
    auto reply = sessionBus.interface()->registerService(
        hush::NotificationsAdaptor::kServiceName, queueOption,
        QDBusConnectionInterface::AllowReplacement);
    if (!reply.isValid() || reply.value() != QDBusConnectionInterface::ServiceRegistered) {
        BOOST_LOG_TRIVIAL(fatal) << "[main] Cannot own " << hush::NotificationsAdaptor::kServiceName
                                 << (reply.isValid() ? " (another server is running, try --replace)"
                                                     : ": " + reply.error().message().toStdString());
        return 1;
    }
    QObject::connect(sessionBus.interface(), &QDBusConnectionInterface::serviceUnregistered, &app,
                     [&app](const QString& name) {
        if (name != QLatin1String(hush::NotificationsAdaptor::kServiceName))
            return;
        BOOST_LOG_TRIVIAL(info) << "[main] Replaced by another notification server, exiting";
        app.quit();
    });

    // --- Control channel ---
    hush::ControlServer::Services services;
    services.config = &config;
    services.theme = &theme;
    services.history = &history;
    services.dnd = &dnd;
    services.notifications = &notifications;
    services.watchers = &watchers;
    services.bus = &eventBus;
    hush::ControlServer control(services);
    if (!control.start())
        BOOST_LOG_TRIVIAL(error) << "[main] Control channel unavailable; CLI and panel cannot connect";

    dnd.start();
    hotReload.start();

    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection);
    });
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(qApp, &QCoreApplication::quit, Qt::QueuedConnection);
    });

    int ret = app.exec();

    // Icon prefetch tasks reference the cache on this stack frame.
    QThreadPool::globalInstance()->waitForDone();
    control.stop();
    hotReload.stop();
    watchers.pause();
    expiry.cancelAll();
    if (config.snapshot()->history.persist)
        saveHistory(history);
    sessionBus.unregisterService(hush::NotificationsAdaptor::kServiceName);

    BOOST_LOG_TRIVIAL(info) << "[main] hushd stopped";
    return ret;
}
