#include "ControlServer.hpp"
#include "ConfigStore.hpp"
#include "EventBus.hpp"
#include "NotificationService.hpp"
#include "ThemeStore.hpp"
#include "core/command/WatcherService.hpp"
#include "core/dnd/DndScheduler.hpp"
#include "core/history/HistoryStore.hpp"
#include <QJsonParseError>
#include <QPointer>
#include <QJsonArray>
#include <QJsonDocument>
#include <boost/log/trivial.hpp>
#include <optional>
#include <utility>
#include <unistd.h>

namespace hush {

namespace {

QJsonObject okReply(QJsonObject obj = {})
{
    obj.insert("ok", true);
    return obj;
}

QJsonObject errorReply(const QString& message)
{
    return {{"ok", false}, {"error", message}};
}

std::optional<quint32> idArgument(const QJsonObject& data)
{
    const QJsonValue value = data.value("id");
    bool ok = false;
    qint64 id = 0;
    if (value.isDouble()) {
        id = value.toInteger(-1);
        ok = true;
    } else if (value.isString()) {
        id = value.toString().toLongLong(&ok);
    }
    if (!ok || id <= 0 || id > 0xffffffffLL)
        return std::nullopt;
    return static_cast<quint32>(id);
}

} // namespace

ControlServer::ControlServer(const Services& services, QObject* parent)
    : QObject(parent)
    , services_(services)
{
}

ControlServer::~ControlServer()
{
    stop();
}

QString ControlServer::defaultSocketPath()
{
    const QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (!runtimeDir.isEmpty())
        return runtimeDir + QStringLiteral("/hushd.sock");
    return QStringLiteral("/tmp/hushd-%1.sock").arg(::getuid());
}

bool ControlServer::start(const QString& socketPath)
{
    if (server_) return false;

    // A previous instance that crashed leaves its socket file behind.
    QLocalServer::removeServer(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);
    connect(server_, &QLocalServer::newConnection, this, &ControlServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        BOOST_LOG_TRIVIAL(error) << "[ControlServer] Failed to listen on " << socketPath.toStdString()
                                 << ": " << server_->errorString().toStdString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    socketPath_ = socketPath;
    if (services_.bus) {
        // Delivery is queued, so the server may be gone by the time it runs.
        QPointer<ControlServer> self(this);
        busSubscription_ = services_.bus->subscribe(QStringLiteral("*"),
            [self](const QString& topic, const QVariant& payload) {
                if (self)
                    self->broadcast(topic, payload);
            });
    }
    BOOST_LOG_TRIVIAL(info) << "[ControlServer] Listening on " << socketPath.toStdString();
    return true;
}

void ControlServer::stop()
{
    if (services_.bus && busSubscription_) {
        services_.bus->unsubscribe(busSubscription_);
        busSubscription_ = 0;
    }
    subscribers_.clear();
    buffers_.clear();
    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

void ControlServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        buffers_.insert(socket, {});
        connect(socket, &QLocalSocket::readyRead, this, &ControlServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &ControlServer::onDisconnected);
    }
}

void ControlServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    QByteArray& buffer = buffers_[socket];
    buffer.append(socket->readAll());

    int newline;
    while ((newline = buffer.indexOf('\n')) >= 0) {
        const QByteArray line = buffer.left(newline).trimmed();
        buffer.remove(0, newline + 1);
        if (!line.isEmpty())
            writeLine(socket, handleRequest(line, socket));
    }

    if (buffer.size() > kMaxLineBytes) {
        BOOST_LOG_TRIVIAL(warning) << "[ControlServer] Request line over " << kMaxLineBytes
                                   << " bytes, dropping client";
        writeLine(socket, errorReply(QStringLiteral("Request too large")));
        buffer.clear();
        socket->disconnectFromServer();
    }
}

void ControlServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;
    buffers_.remove(socket);
    subscribers_.remove(socket);
    socket->deleteLater();
}

void ControlServer::writeLine(QLocalSocket* socket, const QJsonObject& obj)
{
    socket->write(QJsonDocument(obj).toJson(QJsonDocument::Compact) + "\n");
    socket->flush();
}

QJsonObject ControlServer::handleRequest(const QByteArray& line, QLocalSocket* socket)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return errorReply(QStringLiteral("Invalid JSON: ") + parseError.errorString());
    if (!doc.isObject())
        return errorReply(QStringLiteral("Request must be a JSON object"));

    const QJsonObject obj = doc.object();
    const QString command = obj.value("command").toString();
    const QJsonValue rawData = obj.value("data");
    if (!rawData.isUndefined() && !rawData.isNull() && !rawData.isObject())
        return errorReply(QStringLiteral("\"data\" must be an object"));
    const QJsonObject data = rawData.toObject();

    BOOST_LOG_TRIVIAL(debug) << "[ControlServer] " << command.toStdString();

    if (command == QLatin1String("open_panel"))
        return handlePanel(QStringLiteral("open"));
    if (command == QLatin1String("close_panel"))
        return handlePanel(QStringLiteral("close"));
    if (command == QLatin1String("toggle_panel"))
        return handlePanel(QStringLiteral("toggle"));
    if (command == QLatin1String("toggle_dnd")) {
        services_.dnd->toggle();
        return okReply({{"dnd", dndStateName(services_.dnd->state())}});
    }
    if (command == QLatin1String("set_dnd"))
        return handleSetDnd(data);
    if (command == QLatin1String("clear_history"))
        return okReply({{"removed", services_.notifications->clearHistory()}});
    if (command == QLatin1String("list_active"))
        return handleList(true, data);
    if (command == QLatin1String("list_history"))
        return handleList(false, data);
    if (command == QLatin1String("dismiss"))
        return handleDismiss(data);
    if (command == QLatin1String("invoke_action"))
        return handleInvokeAction(data);
    if (command == QLatin1String("panel_visibility"))
        return handlePanelVisibility(data);
    if (command == QLatin1String("get_state"))
        return handleGetState();
    if (command == QLatin1String("watchers"))
        return handleWatchers();
    if (command == QLatin1String("reload_config"))
        return handleReloadConfig();
    if (command == QLatin1String("get_theme"))
        return handleGetTheme(data);
    if (command == QLatin1String("subscribe"))
        return handleSubscribe(socket);

    return errorReply(QStringLiteral("Unknown command"));
}

QJsonObject ControlServer::handlePanel(const QString& action)
{
    emit panelRequested(action);
    if (services_.bus)
        services_.bus->publish(topics::PanelRequested, QVariantMap{{"action", action}});
    return okReply();
}

QJsonObject ControlServer::handleSetDnd(const QJsonObject& data)
{
    const QJsonValue enabled = data.value("enabled");
    if (!enabled.isBool())
        return errorReply(QStringLiteral("set_dnd needs a boolean \"enabled\""));
    services_.dnd->setManual(enabled.toBool());
    return okReply({{"dnd", dndStateName(services_.dnd->state())}});
}

QJsonObject ControlServer::handleList(bool active, const QJsonObject& data)
{
    const bool full = data.value("full").toBool(false);
    QJsonArray entries;
    const auto list = services_.history->list(active ? HistoryFilter::Active : HistoryFilter::All);
    for (const Notification& n : list)
        entries.append(n.toJson(full));
    return okReply({{"notifications", entries}});
}

QJsonObject ControlServer::handleDismiss(const QJsonObject& data)
{
    auto id = idArgument(data);
    if (!id)
        return errorReply(QStringLiteral("dismiss needs a positive \"id\""));
    if (!services_.notifications->dismiss(*id))
        return errorReply(QStringLiteral("No open notification %1").arg(*id));
    return okReply();
}

QJsonObject ControlServer::handleInvokeAction(const QJsonObject& data)
{
    auto id = idArgument(data);
    const QString action = data.value("action").toString();
    if (!id || action.isEmpty())
        return errorReply(QStringLiteral("invoke_action needs \"id\" and \"action\""));
    if (!services_.notifications->invokeAction(*id, action))
        return errorReply(QStringLiteral("Notification %1 has no action \"%2\"").arg(*id).arg(action));
    return okReply();
}

QJsonObject ControlServer::handlePanelVisibility(const QJsonObject& data)
{
    const QJsonValue visible = data.value("visible");
    if (!visible.isBool())
        return errorReply(QStringLiteral("panel_visibility needs a boolean \"visible\""));

    panelVisible_ = visible.toBool();
    if (services_.watchers) {
        if (panelVisible_)
            services_.watchers->resume();
        else
            services_.watchers->pause();
    }
    if (panelVisible_)
        services_.history->markAllRead();
    emit panelVisibilityChanged(panelVisible_);
    return okReply();
}

QJsonObject ControlServer::handleGetState()
{
    QJsonObject obj{
        {"dnd", dndStateName(services_.dnd->state())},
        {"dnd_active", services_.dnd->isActive()},
        {"active", services_.history->activeCount()},
        {"unread", services_.history->unreadCount()},
        {"critical", services_.history->criticalActiveCount()},
        {"history_size", services_.history->size()},
        {"panel_visible", panelVisible_},
    };
    if (services_.config) {
        obj["config_generation"] = services_.config->generation();
        obj["config_error"] = services_.config->lastError();
    }
    return okReply(obj);
}

QJsonObject ControlServer::handleWatchers()
{
    if (!services_.watchers)
        return errorReply(QStringLiteral("Watchers not available"));

    QJsonArray results;
    for (const WatcherResult& result : services_.watchers->results().snapshot())
        results.append(result.toJson());
    return okReply({{"watchers", results}, {"paused", services_.watchers->isPaused()}});
}

QJsonObject ControlServer::handleReloadConfig()
{
    if (!services_.config)
        return errorReply(QStringLiteral("Config not available"));
    if (!services_.config->reload())
        return errorReply(services_.config->lastError());
    if (services_.theme && !services_.theme->reload())
        return errorReply(QStringLiteral("Config reloaded, theme rejected"));
    return okReply({{"generation", services_.config->generation()}});
}

QJsonObject ControlServer::handleGetTheme(const QJsonObject& data)
{
    if (!services_.theme)
        return errorReply(QStringLiteral("Theme not available"));
    const bool withCss = data.value("css").toBool(true);
    return okReply({{"theme", services_.theme->current().toJson(withCss)}});
}

QJsonObject ControlServer::handleSubscribe(QLocalSocket* socket)
{
    if (!socket)
        return errorReply(QStringLiteral("subscribe needs a connection"));
    subscribers_.insert(socket);
    return okReply({{"subscribed", true}});
}

void ControlServer::broadcast(const QString& topic, const QVariant& payload)
{
    if (subscribers_.isEmpty())
        return;
    const QJsonObject event{
        {"event", topic},
        {"payload", QJsonValue::fromVariant(payload)},
    };
    for (QLocalSocket* socket : std::as_const(subscribers_))
        writeLine(socket, event);
}

} // namespace hush
