#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>
#include "core/command/WatcherService.hpp"
#include "core/services/ConfigStore.hpp"

namespace {

hush::ConfigSnapshot watchers(const QString& yaml)
{
    return hush::ConfigSnapshot::fromYaml(YAML::Load(yaml.toStdString()));
}

} // namespace

class TestWatcherService : public QObject {
    Q_OBJECT
private slots:
    void startsPaused()
    {
        hush::ConfigStore config("/nonexistent/config.yaml");
        config.replace(watchers(
            "widgets:\n"
            "  watchers:\n"
            "    - id: greeting\n"
            "      command: echo hello\n"));
        hush::CommandRunner runner;
        hush::WatcherResults results;
        hush::WatcherService service(config, runner, results);

        QVERIFY(service.isPaused());
        QCOMPARE(service.watcherIds(), QStringList({"greeting"}));
        QCOMPARE(service.armedTimerCount(), 0);
        QTest::qWait(150);
        QVERIFY(!results.get("greeting").has_value());
    }

    void resumeProbesAndRearms()
    {
        hush::ConfigStore config("/nonexistent/config.yaml");
        config.replace(watchers(
            "widgets:\n"
            "  watchers:\n"
            "    - id: greeting\n"
            "      command: echo hello\n"
            "      interval_ms: 60000\n"));
        hush::CommandRunner runner;
        hush::WatcherResults results;
        hush::WatcherService service(config, runner, results);
        QSignalSpy updated(&service, &hush::WatcherService::resultUpdated);

        service.resume();
        QTRY_COMPARE(updated.count(), 1);
        auto r = results.get("greeting");
        QVERIFY(r.has_value());
        QCOMPARE(r->value, QString("hello"));
        QVERIFY(!r->stale);
        QVERIFY(r->hasValue);
        QCOMPARE(service.armedTimerCount(), 1);

        service.pause();
        QCOMPARE(service.armedTimerCount(), 0);
    }

    void failureKeepsLastValueAsStale()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString flag = dir.filePath("slow");

        hush::ConfigStore config("/nonexistent/config.yaml");
        config.replace(watchers(QStringLiteral(
            "widgets:\n"
            "  watchers:\n"
            "    - id: probe\n"
            "      command: \"test -f %1 && sleep 3 || echo up\"\n"
            "      interval_ms: 60000\n"
            "      timeout_ms: 200\n").arg(flag)));
        hush::CommandRunner runner;
        hush::WatcherResults results;
        hush::WatcherService service(config, runner, results);
        QSignalSpy updated(&service, &hush::WatcherService::resultUpdated);

        service.resume();
        QTRY_COMPARE(updated.count(), 1);
        QCOMPARE(results.get("probe")->value, QString("up"));

        QFile marker(flag);
        QVERIFY(marker.open(QIODevice::WriteOnly));
        marker.close();

        service.refresh("probe");
        QTRY_COMPARE_WITH_TIMEOUT(updated.count(), 2, 5000);
        auto r = results.get("probe");
        QVERIFY(r->stale);
        QVERIFY(r->hasValue);
        QCOMPARE(r->value, QString("up"));
        QCOMPARE(r->lastError, QString("timed-out"));

        const QJsonObject json = r->toJson();
        QCOMPARE(json.value("stale").toBool(), true);
        QCOMPARE(json.value("value").toString(), QString("up"));
        QCOMPARE(json.value("error").toString(), QString("timed-out"));
    }

    void inFlightResultIsDiscardedAfterPause()
    {
        hush::ConfigStore config("/nonexistent/config.yaml");
        config.replace(watchers(
            "widgets:\n"
            "  watchers:\n"
            "    - id: slow\n"
            "      command: \"sleep 0.3; echo late\"\n"
            "      timeout_ms: 2000\n"));
        hush::CommandRunner runner;
        hush::WatcherResults results;
        hush::WatcherService service(config, runner, results);
        QSignalSpy updated(&service, &hush::WatcherService::resultUpdated);

        service.resume();
        QCOMPARE(runner.inFlight(), 1);
        service.pause();

        QTRY_COMPARE_WITH_TIMEOUT(runner.inFlight(), 0, 3000);
        QTest::qWait(50);
        QCOMPARE(updated.count(), 0);
        QVERIFY(!results.get("slow").has_value());
        QCOMPARE(service.armedTimerCount(), 0);
    }

    void reloadReplacesWatcherSet()
    {
        hush::ConfigStore config("/nonexistent/config.yaml");
        config.replace(watchers(
            "widgets:\n"
            "  watchers:\n"
            "    - id: a\n"
            "      command: echo a\n"
            "      interval_ms: 60000\n"
            "    - id: b\n"
            "      command: echo b\n"
            "      interval_ms: 60000\n"));
        hush::CommandRunner runner;
        hush::WatcherResults results;
        hush::WatcherService service(config, runner, results);
        QSignalSpy updated(&service, &hush::WatcherService::resultUpdated);

        service.resume();
        QTRY_COMPARE(updated.count(), 2);

        config.replace(watchers(
            "widgets:\n"
            "  max_concurrent: 4\n"
            "  watchers:\n"
            "    - id: b\n"
            "      command: echo b\n"
            "      interval_ms: 60000\n"
            "    - id: c\n"
            "      command: echo c\n"
            "      enabled: false\n"));

        QCOMPARE(service.watcherIds(), QStringList({"b"}));
        QCOMPARE(runner.maxConcurrent(), 4);
        QVERIFY(!results.get("a").has_value());
        QVERIFY(results.get("b").has_value());
        QTRY_COMPARE(updated.count(), 3);
    }

    void streamExitFallsBackToPolling()
    {
        hush::ConfigStore config("/nonexistent/config.yaml");
        config.replace(watchers(
            "widgets:\n"
            "  watchers:\n"
            "    - id: events\n"
            "      command: echo state\n"
            "      watch_command: \"printf 'changed\\\\n'\"\n"
            "      interval_ms: 60000\n"));
        hush::CommandRunner runner;
        hush::WatcherResults results;
        hush::WatcherService service(config, runner, results);
        QSignalSpy updated(&service, &hush::WatcherService::resultUpdated);

        service.resume();
        QTRY_VERIFY(updated.count() >= 1);
        QTRY_VERIFY_WITH_TIMEOUT(!service.isStreaming("events"), 3000);
        QTRY_COMPARE(service.armedTimerCount(), 1);
        QCOMPARE(results.get("events")->value, QString("state"));
    }

    void streamingWatcherArmsNoPollTimer()
    {
        hush::ConfigStore config("/nonexistent/config.yaml");
        config.replace(watchers(
            "widgets:\n"
            "  watchers:\n"
            "    - id: events\n"
            "      command: echo state\n"
            "      watch_command: sleep 30\n"
            "      interval_ms: 200\n"));
        hush::CommandRunner runner;
        hush::WatcherResults results;
        hush::WatcherService service(config, runner, results);
        QSignalSpy updated(&service, &hush::WatcherService::resultUpdated);

        service.resume();
        QVERIFY(service.isStreaming("events"));
        QTRY_COMPARE(updated.count(), 1);
        QTest::qWait(500);
        QCOMPARE(updated.count(), 1);
        QCOMPARE(service.armedTimerCount(), 0);

        service.pause();
        QVERIFY(!service.isStreaming("events"));
        QCOMPARE(runner.activeStreams(), 1);  // deleted from the event loop
        QTRY_COMPARE(runner.activeStreams(), 0);
    }

    void watchersBeyondBudgetAllGetFreshValues()
    {
        // Same shape as the built-in set: four watchers, two of them
        // streaming, against two concurrent slots.
        hush::ConfigStore config("/nonexistent/config.yaml");
        config.replace(watchers(
            "widgets:\n"
            "  max_concurrent: 2\n"
            "  watchers:\n"
            "    - id: network-status\n"
            "      command: \"sleep 0.2; echo connected\"\n"
            "      watch_command: sleep 30\n"
            "      interval_ms: 60000\n"
            "    - id: bluetooth\n"
            "      command: \"sleep 0.2; echo powered\"\n"
            "      interval_ms: 60000\n"
            "    - id: radio-kill\n"
            "      command: \"sleep 0.2; echo unblocked\"\n"
            "      interval_ms: 60000\n"
            "    - id: audio\n"
            "      command: \"sleep 0.2; echo 40%\"\n"
            "      watch_command: sleep 30\n"
            "      interval_ms: 60000\n"));
        hush::CommandRunner runner;
        hush::WatcherResults results;
        hush::WatcherService service(config, runner, results);

        service.resume();
        QCOMPARE(runner.inFlight(), 2);

        auto allFresh = [&results]() {
            for (const QString& id : {QStringLiteral("network-status"), QStringLiteral("bluetooth"),
                                      QStringLiteral("radio-kill"), QStringLiteral("audio")}) {
                auto r = results.get(id);
                if (!r || !r->hasValue || r->stale)
                    return false;
            }
            return true;
        };
        QTRY_VERIFY_WITH_TIMEOUT(allFresh(), 5000);
        QCOMPARE(results.get("network-status")->value, QString("connected"));
        QVERIFY(service.isStreaming("network-status"));
        QVERIFY(service.isStreaming("audio"));
        // only the two polling watchers keep a timer
        QCOMPARE(service.armedTimerCount(), 2);
    }

    void rejectedProbeOnStreamingWatcherIsRetried()
    {
        hush::ConfigStore config("/nonexistent/config.yaml");
        config.replace(watchers(
            "widgets:\n"
            "  max_concurrent: 1\n"
            "  watchers:\n"
            "    - id: events\n"
            "      command: echo state\n"
            "      watch_command: sleep 30\n"
            "      interval_ms: 60000\n"
            "      jitter_ms: 0\n"));
        hush::CommandRunner runner;
        hush::WatcherResults results;
        hush::WatcherService service(config, runner, results);

        service.resume();
        QTRY_VERIFY(results.get("events").has_value());
        QCOMPARE(service.armedTimerCount(), 0);

        runner.run({"sleep 0.5", 2000}, [](const hush::CommandResult&) {});
        service.refresh("events");
        QTRY_COMPARE(results.get("events")->lastError, QString("rejected"));
        QVERIFY(results.get("events")->stale);
        QVERIFY(service.isStreaming("events"));
        QCOMPARE(service.armedTimerCount(), 1);

        QTRY_VERIFY_WITH_TIMEOUT(!results.get("events")->stale, 3000);
        QCOMPARE(results.get("events")->value, QString("state"));
        QCOMPARE(service.armedTimerCount(), 0);
    }
};

QTEST_GUILESS_MAIN(TestWatcherService)
#include "test_watcher_service.moc"
