#pragma once

#include <QHash>
#include <QJsonObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QSet>

namespace hush {

class ConfigStore;
class DndScheduler;
class HistoryStore;
class IEventBus;
class NotificationService;
class ThemeStore;
class WatcherService;

/// Local socket control channel for the CLI and the panel.
///
/// Requests and replies are newline-delimited JSON objects:
///   {"command": "...", "data": {...}}  ->  {"ok": true, ...}
/// A malformed line, an unknown command or bad arguments get
/// {"ok": false, "error": "..."} and the connection stays open.
/// After "subscribe" the client additionally receives every bus event as
/// {"event": topic, "payload": {...}}.
class ControlServer : public QObject {
    Q_OBJECT
public:
    static constexpr int kMaxLineBytes = 64 * 1024;

    struct Services {
        ConfigStore* config = nullptr;
        ThemeStore* theme = nullptr;
        HistoryStore* history = nullptr;
        DndScheduler* dnd = nullptr;
        NotificationService* notifications = nullptr;
        WatcherService* watchers = nullptr;
        IEventBus* bus = nullptr;
    };

    explicit ControlServer(const Services& services, QObject* parent = nullptr);
    ~ControlServer() override;

    /// $XDG_RUNTIME_DIR/hushd.sock, or /tmp/hushd-<uid>.sock without a
    /// runtime directory.
    static QString defaultSocketPath();

    /// Returns false if the socket cannot be bound.
    bool start(const QString& socketPath = defaultSocketPath());
    void stop();

    QString socketPath() const { return socketPath_; }
    bool panelVisible() const { return panelVisible_; }
    int subscriberCount() const { return subscribers_.size(); }

    /// Handles one request line and returns the reply object. Socket-bound
    /// commands (subscribe) need the requesting socket.
    QJsonObject handleRequest(const QByteArray& line, QLocalSocket* socket = nullptr);

signals:
    /// "open", "close" or "toggle".
    void panelRequested(const QString& action);
    void panelVisibilityChanged(bool visible);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    QJsonObject handlePanel(const QString& action);
    QJsonObject handleSetDnd(const QJsonObject& data);
    QJsonObject handleList(bool active, const QJsonObject& data);
    QJsonObject handleDismiss(const QJsonObject& data);
    QJsonObject handleInvokeAction(const QJsonObject& data);
    QJsonObject handlePanelVisibility(const QJsonObject& data);
    QJsonObject handleGetState();
    QJsonObject handleWatchers();
    QJsonObject handleReloadConfig();
    QJsonObject handleGetTheme(const QJsonObject& data);
    QJsonObject handleSubscribe(QLocalSocket* socket);

    void broadcast(const QString& topic, const QVariant& payload);
    static void writeLine(QLocalSocket* socket, const QJsonObject& obj);

    Services services_;
    QLocalServer* server_ = nullptr;
    QString socketPath_;
    QHash<QLocalSocket*, QByteArray> buffers_;
    QSet<QLocalSocket*> subscribers_;
    int busSubscription_ = 0;
    bool panelVisible_ = false;
};

} // namespace hush
