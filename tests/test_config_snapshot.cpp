#include <QTest>
#include "core/ConfigError.hpp"
#include "core/ConfigSnapshot.hpp"

namespace {

hush::ConfigSnapshot fromText(const char* yaml)
{
    return hush::ConfigSnapshot::fromYaml(YAML::Load(yaml));
}

bool rejects(const char* yaml)
{
    try {
        fromText(yaml);
    } catch (const hush::ConfigError&) {
        return true;
    }
    return false;
}

QDateTime at(int day, const char* time)
{
    // October 2026: the 12th is a Monday.
    return QDateTime(QDate(2026, 10, day), QTime::fromString(time, "HH:mm"));
}

} // namespace

class TestConfigSnapshot : public QObject {
    Q_OBJECT
private slots:
    void defaults()
    {
        auto s = hush::ConfigSnapshot::defaults();
        QCOMPARE(s.general.logLevel, QString("info"));
        QCOMPARE(s.popups.defaultTimeoutMs, 5000);
        QCOMPARE(s.popups.criticalTimeoutMs, 0);
        QCOMPARE(s.history.maxEntries, 200);
        QCOMPARE(s.history.dedupWindowMs, 2000);
        QVERIFY(s.dnd.allowCritical);
        QCOMPARE(s.dnd.tickMs, 30000);
        QCOMPARE(s.widgets.maxConcurrent, 2);
        QCOMPARE(s.cache.iconBudgetBytes, qint64(8 * 1024 * 1024));
        QCOMPARE(s.cache.themeBudgetBytes, qint64(1024 * 1024));
        QCOMPARE(s.theme.widgets, QString("widgets.css"));
        QVERIFY(s.rules.empty());

        QStringList ids;
        for (const auto& w : s.widgets.watchers)
            ids << w.id;
        QCOMPARE(ids, QStringList({"network-status", "bluetooth", "radio-kill", "audio"}));
        QCOMPARE(s.widgets.watchers.first().watchCommand, QString("nmcli monitor"));
    }

    void userMapsMergeOverDefaults()
    {
        auto s = fromText("history:\n  max_entries: 50\n");
        QCOMPARE(s.history.maxEntries, 50);
        QCOMPARE(s.history.maxActive, 500);
        QCOMPARE(s.history.dedupWindowMs, 2000);
        QCOMPARE(s.popups.defaultTimeoutMs, 5000);
    }

    void userSequencesReplaceDefaults()
    {
        auto s = fromText(
            "widgets:\n"
            "  watchers:\n"
            "    - id: load\n"
            "      command: cat /proc/loadavg\n");
        QCOMPARE(s.widgets.watchers.size(), 1);
        const auto& w = s.widgets.watchers.first();
        QCOMPARE(w.id, QString("load"));
        QCOMPARE(w.intervalMs, s.widgets.refreshIntervalMs);
        QCOMPARE(w.timeoutMs, 350);
        QVERIFY(w.enabled);
    }

    void loadsFixtureFile()
    {
        auto s = hush::ConfigSnapshot::loadFile(QString(TEST_DATA_DIR) + "/test_config.yaml");
        QCOMPARE(s.general.logLevel, QString("debug"));
        QCOMPARE(s.popups.defaultTimeoutMs, 4000);
        QCOMPARE(s.history.maxEntries, 50);
        QCOMPARE(s.history.dedupWindowMs, 1500);
        QCOMPARE(int(s.rules.size()), 3);
        QCOMPARE(s.rules.at(0).name, QString("mute-spotify"));
        QCOMPARE(int(s.rules.at(1).actions.size()), 1);
        QCOMPARE(s.dnd.windows.size(), 1);
        QCOMPARE(s.widgets.maxConcurrent, 3);
        QCOMPARE(s.widgets.watchers.size(), 2);
        QCOMPARE(s.widgets.watchers.at(1).jitterMs, 500);
        QCOMPARE(s.theme.popup, QString("popups/dark.css"));
        QCOMPARE(s.theme.base, QString("base.css"));
        QCOMPARE(s.configDir, QString(TEST_DATA_DIR));
    }

    void missingFileYieldsDefaults()
    {
        auto s = hush::ConfigSnapshot::loadFile("/nonexistent/hushd/config.yaml");
        QCOMPARE(s.history.maxEntries, 200);
        QCOMPARE(s.configDir, QString("/nonexistent/hushd"));
    }

    void malformedFileIsRejected()
    {
        bool threw = false;
        try {
            hush::ConfigSnapshot::loadFile(QString(TEST_DATA_DIR) + "/malformed_config.yaml");
        } catch (const hush::ConfigError& e) {
            threw = true;
            QVERIFY(QString(e.what()).contains("parse error"));
        }
        QVERIFY(threw);
    }

    void invalidValuesAreRejected()
    {
        QVERIFY(rejects("general:\n  log_level: loud\n"));
        QVERIFY(rejects("history:\n  max_entries: 0\n"));
        QVERIFY(rejects("history:\n  max_entries: lots\n"));
        QVERIFY(rejects("dnd:\n  windows:\n    - start: \"25:00\"\n      end: \"07:00\"\n"));
        QVERIFY(rejects("dnd:\n  windows:\n    - start: \"22:00\"\n      end: \"07:00\"\n      days: [funday]\n"));
        QVERIFY(rejects("widgets:\n  watchers:\n    - id: a\n      command: x\n    - id: a\n      command: y\n"));
        QVERIFY(rejects("widgets:\n  watchers:\n    - id: a\n"));
        QVERIFY(rejects("theme:\n  base: \"\"\n"));
        QVERIFY(rejects("- just\n- a list\n"));
    }

    void invalidRulesAreRejectedAtLoad()
    {
        QVERIFY(rejects("rules:\n  - app: \"[abc\"\n    match: glob\n    suppress: true\n"));
        QVERIFY(rejects("rules:\n  - force_urgency: extreme\n"));
        QVERIFY(rejects("rules:\n  - urgency: high\n    suppress: true\n"));
        QVERIFY(rejects("rules:\n  - app: foo\n"));
        QVERIFY(rejects("rules:\n  - app: foo\n    actions: [explode]\n"));
        QVERIFY(rejects("rules:\n  - app: foo\n    match: regex\n    suppress: true\n"));
        QVERIFY(!rejects("rules:\n  - app: \"[abc]*\"\n    match: glob\n    suppress: true\n"));
    }

    void windowWithinOneDay()
    {
        auto s = fromText("dnd:\n  windows:\n    - start: \"09:00\"\n      end: \"17:00\"\n      days: weekdays\n");
        const auto& w = s.dnd.windows.first();
        QVERIFY(w.contains(at(12, "09:00")));
        QVERIFY(w.contains(at(16, "16:59")));
        QVERIFY(!w.contains(at(16, "17:00")));
        QVERIFY(!w.contains(at(17, "12:00")));  // Saturday
    }

    void windowCrossingMidnightBelongsToStartDay()
    {
        auto s = fromText("dnd:\n  windows:\n    - start: \"22:00\"\n      end: \"07:00\"\n      days: [fri]\n");
        const auto& w = s.dnd.windows.first();
        QVERIFY(w.contains(at(16, "23:00")));   // Friday night
        QVERIFY(w.contains(at(17, "03:00")));   // Saturday morning, still Friday's window
        QVERIFY(!w.contains(at(16, "03:00")));  // Friday morning belongs to Thursday
        QVERIFY(!w.contains(at(17, "22:30")));
    }

    void equalStartAndEndMeansAllDay()
    {
        auto s = fromText("dnd:\n  windows:\n    - start: \"00:00\"\n      end: \"00:00\"\n      days: weekends\n");
        const auto& w = s.dnd.windows.first();
        QVERIFY(w.contains(at(18, "13:37")));
        QVERIFY(!w.contains(at(19, "13:37")));
    }

    void defaultConfigDirFollowsXdg()
    {
        const QByteArray saved = qgetenv("XDG_CONFIG_HOME");
        qputenv("XDG_CONFIG_HOME", "/tmp/xdg-test");
        QCOMPARE(hush::defaultConfigDir(), QString("/tmp/xdg-test/hushd"));
        if (saved.isEmpty())
            qunsetenv("XDG_CONFIG_HOME");
        else
            qputenv("XDG_CONFIG_HOME", saved);
    }
};

QTEST_GUILESS_MAIN(TestConfigSnapshot)
#include "test_config_snapshot.moc"
