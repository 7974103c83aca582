#include "core/command/CommandRunner.hpp"
#include "core/Logging.hpp"
#include <QMetaObject>
#include <QTimer>
#include <boost/log/trivial.hpp>
#include <memory>
#include <signal.h>
#include <unistd.h>

namespace hush {

QString commandStatusName(CommandResult::Status status)
{
    switch (status) {
    case CommandResult::Status::Completed: return QStringLiteral("completed");
    case CommandResult::Status::TimedOut: return QStringLiteral("timed-out");
    case CommandResult::Status::ConcurrencyRejected: return QStringLiteral("rejected");
    case CommandResult::Status::FailedToStart: return QStringLiteral("failed-to-start");
    }
    return QStringLiteral("failed-to-start");
}

void configureProcessGroup(QProcess& process)
{
    process.setChildProcessModifier([] { ::setpgid(0, 0); });
}

void killProcessGroup(QProcess& process)
{
    const qint64 pid = process.processId();
    if (pid > 0)
        ::kill(-static_cast<pid_t>(pid), SIGKILL);
    process.kill();
}

// --- CommandStream ---

CommandStream::CommandStream(QObject* parent)
    : QObject(parent)
{
    configureProcessGroup(process_);
    process_.setStandardErrorFile(QProcess::nullDevice());
    connect(&process_, &QProcess::readyReadStandardOutput, this, &CommandStream::onReadyRead);
    connect(&process_, &QProcess::finished, this, [this](int exitCode, QProcess::ExitStatus) {
        if (!stopped_)
            emit finished(exitCode);
    });
    connect(&process_, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
        if (error == QProcess::FailedToStart && !stopped_)
            emit finished(-1);
    });
}

CommandStream::~CommandStream()
{
    stop();
}

bool CommandStream::isRunning() const
{
    return process_.state() != QProcess::NotRunning;
}

void CommandStream::stop()
{
    stopped_ = true;
    if (process_.state() == QProcess::NotRunning)
        return;
    killProcessGroup(process_);
    process_.waitForFinished(200);
}

void CommandStream::onReadyRead()
{
    partial_.append(process_.readAllStandardOutput());
    int newline;
    while ((newline = partial_.indexOf('\n')) >= 0) {
        const QByteArray line = partial_.left(newline).trimmed();
        partial_.remove(0, newline + 1);
        if (!line.isEmpty())
            emit lineReceived(QString::fromUtf8(line));
    }
    if (partial_.size() > CommandRunner::kMaxOutputBytes)
        partial_.clear();
}

// --- CommandRunner ---

struct CommandRunner::Job {
    QProcess* process = nullptr;
    QTimer* timer = nullptr;
    Callback callback;
    QByteArray output;
    QElapsedTimer elapsed;
    bool done = false;
};

CommandRunner::CommandRunner(int maxConcurrent, int maxStreams, QObject* parent)
    : QObject(parent)
    , maxConcurrent_(qMax(1, maxConcurrent))
    , maxStreams_(qMax(0, maxStreams))
{
}

CommandRunner::~CommandRunner() = default;

bool CommandRunner::needsShell(const QString& command)
{
    static const QString meta = QStringLiteral("|&;<>()$`\\\"'*?[]#~=%{}\n");
    for (QChar c : command) {
        if (meta.contains(c))
            return true;
    }
    return false;
}

QStringList CommandRunner::argv(const QString& command)
{
    const QString trimmed = command.trimmed();
    if (trimmed.isEmpty())
        return {};
    if (needsShell(trimmed))
        return {QStringLiteral("/bin/sh"), QStringLiteral("-c"), trimmed};
    return QProcess::splitCommand(trimmed);
}

void CommandRunner::setMaxConcurrent(int max)
{
    maxConcurrent_ = qMax(1, max);
    emit budgetChanged(inFlight_, maxConcurrent_);
}

void CommandRunner::setMaxStreams(int max)
{
    maxStreams_ = qMax(0, max);
}

void CommandRunner::deliver(Callback callback, CommandResult result)
{
    if (!callback)
        return;
    QMetaObject::invokeMethod(this, [callback = std::move(callback), result = std::move(result)]() {
        callback(result);
    }, Qt::QueuedConnection);
}

void CommandRunner::finish(Job* job, CommandResult result)
{
    job->done = true;
    job->timer->stop();
    result.elapsedMs = job->elapsed.elapsed();
    --inFlight_;
    emit budgetChanged(inFlight_, maxConcurrent_);
    deliver(std::move(job->callback), std::move(result));
}

void CommandRunner::run(const CommandSpec& spec, Callback callback)
{
    const QStringList args = argv(spec.command);
    if (args.isEmpty()) {
        CommandResult result;
        result.status = CommandResult::Status::FailedToStart;
        result.error = QStringLiteral("empty command");
        deliver(std::move(callback), std::move(result));
        return;
    }

    if (inFlight_ >= maxConcurrent_) {
        BOOST_LOG_TRIVIAL(debug) << "[CommandRunner] Budget full (" << inFlight_ << "/"
                                 << maxConcurrent_ << "), rejecting " << logSnippet(spec.command);
        CommandResult result;
        result.status = CommandResult::Status::ConcurrencyRejected;
        deliver(std::move(callback), std::move(result));
        return;
    }

    ++inFlight_;
    emit budgetChanged(inFlight_, maxConcurrent_);

    auto job = std::make_shared<Job>();
    job->callback = std::move(callback);
    job->process = new QProcess(this);
    job->timer = new QTimer(this);
    job->timer->setSingleShot(true);

    QProcess* process = job->process;
    process->setStandardErrorFile(QProcess::nullDevice());
    configureProcessGroup(*process);

    auto cleanup = [job]() {
        job->process->deleteLater();
        job->timer->deleteLater();
    };

    connect(process, &QProcess::readyReadStandardOutput, this, [job]() {
        const QByteArray chunk = job->process->readAllStandardOutput();
        const int room = kMaxOutputBytes - job->output.size();
        if (room > 0)
            job->output.append(chunk.left(room));
    });

    connect(process, &QProcess::finished, this,
            [this, job, cleanup](int exitCode, QProcess::ExitStatus status) {
        if (!job->done) {
            const int room = kMaxOutputBytes - job->output.size();
            if (room > 0)
                job->output.append(job->process->readAllStandardOutput().left(room));

            CommandResult result;
            result.status = CommandResult::Status::Completed;
            result.stdoutData = job->output;
            result.exitCode = status == QProcess::NormalExit ? exitCode : -1;
            if (status != QProcess::NormalExit)
                result.error = QStringLiteral("process crashed");
            finish(job.get(), std::move(result));
        }
        cleanup();
    });

    connect(process, &QProcess::errorOccurred, this,
            [this, job, cleanup, command = spec.command](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart || job->done)
            return;
        BOOST_LOG_TRIVIAL(warning) << "[CommandRunner] Failed to start " << logSnippet(command)
                                   << ": " << job->process->errorString().toStdString();
        CommandResult result;
        result.status = CommandResult::Status::FailedToStart;
        result.error = job->process->errorString();
        finish(job.get(), std::move(result));
        cleanup();
    });

    connect(job->timer, &QTimer::timeout, this, [this, job, command = spec.command]() {
        if (job->done)
            return;
        BOOST_LOG_TRIVIAL(warning) << "[CommandRunner] Timed out after "
                                   << job->elapsed.elapsed() << "ms, killing " << logSnippet(command);
        killProcessGroup(*job->process);
        CommandResult result;
        result.status = CommandResult::Status::TimedOut;
        result.stdoutData = job->output;
        finish(job.get(), std::move(result));
    });

    BOOST_LOG_TRIVIAL(trace) << "[CommandRunner] Starting " << logSnippet(spec.command)
                             << " (" << inFlight_ << "/" << maxConcurrent_ << ")";
    job->elapsed.start();
    job->timer->start(qMax(1, spec.timeoutMs));
    process->start(args.first(), args.mid(1));
}

CommandStream* CommandRunner::startStream(const QString& command)
{
    const QStringList args = argv(command);
    if (args.isEmpty())
        return nullptr;
    if (activeStreams_ >= maxStreams_) {
        BOOST_LOG_TRIVIAL(warning) << "[CommandRunner] Stream budget exhausted (" << maxStreams_
                                   << "), not starting " << logSnippet(command);
        return nullptr;
    }

    auto* stream = new CommandStream(this);
    ++activeStreams_;
    connect(stream, &QObject::destroyed, this, [this]() { --activeStreams_; });

    BOOST_LOG_TRIVIAL(debug) << "[CommandRunner] Starting stream " << logSnippet(command);
    stream->process_.start(args.first(), args.mid(1));
    return stream;
}

} // namespace hush
