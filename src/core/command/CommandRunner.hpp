#pragma once

#include <QByteArray>
#include <QElapsedTimer>
#include <QObject>
#include <QProcess>
#include <QStringList>
#include <functional>

class QTimer;

namespace hush {

struct CommandSpec {
    QString command;
    int timeoutMs = 350;
};

struct CommandResult {
    enum class Status {
        Completed,
        TimedOut,
        ConcurrencyRejected,
        FailedToStart
    };

    Status status = Status::Completed;
    QByteArray stdoutData;
    int exitCode = -1;
    QString error;
    qint64 elapsedMs = 0;

    bool succeeded() const { return status == Status::Completed && exitCode == 0; }
};

QString commandStatusName(CommandResult::Status status);

/// A long-running command whose stdout is delivered line by line
/// (e.g. `pactl subscribe`). Created by CommandRunner::startStream.
class CommandStream : public QObject {
    Q_OBJECT
public:
    ~CommandStream() override;

    bool isRunning() const;
    /// Kills the stream's process group. finished() is not emitted.
    void stop();

signals:
    void lineReceived(const QString& line);
    void finished(int exitCode);

private:
    friend class CommandRunner;
    explicit CommandStream(QObject* parent);

    void onReadyRead();

    QProcess process_;
    QByteArray partial_;
    bool stopped_ = false;
};

/**
 * CommandRunner: the only place hushd starts external processes.
 *
 * run() enforces a global ceiling on in-flight probes: a request beyond it
 * completes immediately with ConcurrencyRejected. Every probe has a timeout;
 * on expiry its whole process group gets SIGKILL, the slot is released at
 * once and the callback sees TimedOut. Callbacks are always delivered from
 * the event loop, never from inside run().
 *
 * Command lines without shell metacharacters are split and executed
 * directly; anything else goes through /bin/sh -c.
 */
class CommandRunner : public QObject {
    Q_OBJECT
public:
    using Callback = std::function<void(const CommandResult&)>;

    static constexpr int kMaxOutputBytes = 64 * 1024;

    explicit CommandRunner(int maxConcurrent = 2, int maxStreams = 4, QObject* parent = nullptr);
    ~CommandRunner() override;

    void run(const CommandSpec& spec, Callback callback);

    /// Returns nullptr when the stream budget is exhausted or the command
    /// is empty. The stream is parented to the runner; callers stop() it
    /// and deleteLater() when done.
    CommandStream* startStream(const QString& command);

    void setMaxConcurrent(int max);
    void setMaxStreams(int max);
    int maxConcurrent() const { return maxConcurrent_; }
    int inFlight() const { return inFlight_; }
    bool hasCapacity() const { return inFlight_ < maxConcurrent_; }
    int activeStreams() const { return activeStreams_; }

    static bool needsShell(const QString& command);
    /// Program followed by its arguments.
    static QStringList argv(const QString& command);

signals:
    void budgetChanged(int inFlight, int maxConcurrent);

private:
    struct Job;

    void finish(Job* job, CommandResult result);
    void deliver(Callback callback, CommandResult result);

    int maxConcurrent_;
    int maxStreams_;
    int inFlight_ = 0;
    int activeStreams_ = 0;
};

/// Puts the child in its own process group so a timeout can kill the
/// whole tree (sh -c pipelines included).
void configureProcessGroup(QProcess& process);
/// SIGKILL to the process group of a running QProcess.
void killProcessGroup(QProcess& process);

} // namespace hush

Q_DECLARE_METATYPE(hush::CommandResult)
