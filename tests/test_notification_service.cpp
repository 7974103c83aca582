#include <QSignalSpy>
#include <QTest>
#include "core/dnd/DndScheduler.hpp"
#include "core/history/HistoryStore.hpp"
#include "core/services/ConfigStore.hpp"
#include "core/services/ExpiryScheduler.hpp"
#include "core/services/NotificationService.hpp"
#include <memory>

namespace {

hush::NotifyRequest request(const QString& app, const QString& summary)
{
    hush::NotifyRequest req;
    req.appName = app;
    req.summary = summary;
    req.body = "body";
    return req;
}

// Everything the service needs, wired the way main() wires it.
struct Fixture {
    explicit Fixture(const char* yaml = "")
        : config("/nonexistent/config.yaml")
        , history(config.snapshot()->history.maxEntries)
    {
        auto snapshot = hush::ConfigSnapshot::fromYaml(YAML::Load(yaml));
        config.replace(snapshot);
        history.setCapacity(snapshot.history.maxEntries);
        dnd = std::make_unique<hush::DndScheduler>(config);
        service = std::make_unique<hush::NotificationService>(config, history, *dnd, expiry);
    }

    hush::ConfigStore config;
    hush::HistoryStore history;
    hush::ExpiryScheduler expiry;
    std::unique_ptr<hush::DndScheduler> dnd;
    std::unique_ptr<hush::NotificationService> service;
};

} // namespace

class TestNotificationService : public QObject {
    Q_OBJECT
private slots:
    void initTestCase()
    {
        qRegisterMetaType<hush::Notification>();
        qRegisterMetaType<hush::CloseReason>();
    }

    void seventhNotificationExpiresWithDefaultTimeout()
    {
        Fixture f("popups:\n  default_timeout_ms: 200\n");
        QSignalSpy closed(f.service.get(), &hush::NotificationService::notificationClosed);
        QSignalSpy shown(f.service.get(), &hush::NotificationService::notificationShown);

        quint32 id = 0;
        for (int i = 1; i <= 7; ++i)
            id = f.service->notify(request("mail", QStringLiteral("message %1").arg(i)));
        QCOMPARE(id, 7u);
        QCOMPARE(shown.count(), 7);
        QVERIFY(f.expiry.isScheduled(7));

        QTRY_COMPARE_WITH_TIMEOUT(closed.count(), 7, 3000);
        QCOMPARE(closed.last().at(1).value<hush::CloseReason>(), hush::CloseReason::Expired);
        QVERIFY(!f.history.isOpen(7));
        QCOMPARE(f.history.find(7)->closeReason, hush::CloseReason::Expired);
    }

    void explicitTimeoutAndNeverExpire()
    {
        Fixture f;
        auto req = request("a", "explicit");
        req.expireTimeout = 1234;
        const quint32 a = f.service->notify(req);
        req = request("a", "never");
        req.expireTimeout = 0;
        const quint32 b = f.service->notify(req);

        QVERIFY(f.expiry.isScheduled(a));
        QVERIFY(!f.expiry.isScheduled(b));

        hush::Notification n;
        n.expireTimeout = hush::ExpireTimeout::explicitMs(1234);
        auto config = hush::ConfigSnapshot::defaults();
        QCOMPARE(hush::NotificationService::expiryFor(n, config), 1234);
        n.resident = true;
        QCOMPARE(hush::NotificationService::expiryFor(n, config), 0);
        n.resident = false;
        n.expireTimeout = {};
        n.urgency = hush::Urgency::Critical;
        QCOMPARE(hush::NotificationService::expiryFor(n, config), 0);
        n.urgency = hush::Urgency::Low;
        QCOMPARE(hush::NotificationService::expiryFor(n, config), 5000);
    }

    void replacesIdUpdatesInPlace()
    {
        Fixture f;
        const quint32 id = f.service->notify(request("dl", "10%"));
        auto req = request("dl", "50%");
        req.replacesId = id;
        QCOMPARE(f.service->notify(req), id);
        QCOMPARE(f.history.size(), 1);
        QCOMPARE(f.history.find(id)->summary, QString("50%"));
    }

    void replacingClosedOrUnknownIdAllocatesNewOne()
    {
        Fixture f;
        const quint32 id = f.service->notify(request("dl", "first"));
        QVERIFY(f.service->closeNotification(id));

        auto req = request("dl", "second");
        req.replacesId = id;
        const quint32 next = f.service->notify(req);
        QVERIFY(next != id);

        req = request("dl", "third");
        req.replacesId = 4242;
        QVERIFY(f.service->notify(req) != 4242u);
    }

    void suppressedNotificationGetsIdButNoEntry()
    {
        Fixture f("rules:\n  - app: spam\n    suppress: true\n");
        QSignalSpy shown(f.service.get(), &hush::NotificationService::notificationShown);

        const quint32 id = f.service->notify(request("spam", "buy"));
        QVERIFY(id != 0);
        QVERIFY(!f.history.find(id).has_value());
        QCOMPARE(shown.count(), 0);

        // the id is consumed
        QVERIFY(f.service->notify(request("mail", "hi")) > id);
    }

    void dndHoldsBackUnlessExempt()
    {
        Fixture f("rules:\n  - app: pager\n    dnd_exempt: true\n");
        f.dnd->setManual(true);
        QSignalSpy shown(f.service.get(), &hush::NotificationService::notificationShown);

        const quint32 quiet = f.service->notify(request("mail", "hi"));
        QVERIFY(!f.history.find(quiet).has_value());

        const quint32 exempt = f.service->notify(request("pager", "disk full"));
        QVERIFY(f.history.isOpen(exempt));

        auto critical = request("mail", "server down");
        critical.hints.insert("urgency", QVariant::fromValue<uchar>(2));
        QVERIFY(f.history.isOpen(f.service->notify(critical)));

        auto bypass = request("timer", "tea");
        bypass.hints.insert("x-hush-dnd-bypass", true);
        QVERIFY(f.history.isOpen(f.service->notify(bypass)));

        QCOMPARE(shown.count(), 3);
    }

    void malformedRequestChangesNothing()
    {
        Fixture f;
        auto req = request("a", "b");
        req.expireTimeout = -5;
        bool threw = false;
        try {
            f.service->notify(req);
        } catch (const hush::ProtocolError&) {
            threw = true;
        }
        QVERIFY(threw);
        QCOMPARE(f.history.size(), 0);
        QCOMPARE(f.service->notify(request("a", "b")), 1u);
    }

    void closeNotificationEmitsOnce()
    {
        Fixture f;
        QSignalSpy closed(f.service.get(), &hush::NotificationService::notificationClosed);

        const quint32 id = f.service->notify(request("a", "b"));
        QVERIFY(f.service->closeNotification(id));
        QVERIFY(!f.service->closeNotification(id));
        QVERIFY(!f.service->closeNotification(999));

        QCOMPARE(closed.count(), 1);
        QCOMPARE(closed.first().at(0).toUInt(), id);
        QCOMPARE(closed.first().at(1).value<hush::CloseReason>(), hush::CloseReason::ClosedByRequest);
        QVERIFY(!f.expiry.isScheduled(id));
    }

    void invokeActionClosesUnlessResident()
    {
        Fixture f;
        QSignalSpy invoked(f.service.get(), &hush::NotificationService::actionInvoked);
        QSignalSpy closed(f.service.get(), &hush::NotificationService::notificationClosed);

        auto req = request("mail", "new message");
        req.actions = {"default", "Open", "archive", "Archive"};
        const quint32 id = f.service->notify(req);

        QVERIFY(!f.service->invokeAction(id, "delete"));
        QVERIFY(!f.service->invokeAction(777, "default"));
        QVERIFY(f.service->invokeAction(id, "archive"));
        QCOMPARE(invoked.count(), 1);
        QCOMPARE(invoked.first().at(1).toString(), QString("archive"));
        QCOMPARE(closed.count(), 1);
        QCOMPARE(closed.first().at(1).value<hush::CloseReason>(), hush::CloseReason::Dismissed);
        QVERIFY(!f.service->invokeAction(id, "default"));

        auto resident = request("music", "Now playing");
        resident.actions = {"pause", "Pause"};
        resident.hints.insert("resident", true);
        const quint32 rid = f.service->notify(resident);
        QVERIFY(f.service->invokeAction(rid, "pause"));
        QVERIFY(f.history.isOpen(rid));
    }

    void transientEntriesSkipHistory()
    {
        Fixture f;
        auto req = request("vol", "50%");
        req.hints.insert("transient", true);
        const quint32 id = f.service->notify(req);
        QVERIFY(f.service->dismiss(id));
        QVERIFY(!f.history.find(id).has_value());

        Fixture keep("history:\n  transient_to_history: true\n");
        const quint32 kept = keep.service->notify(req);
        QVERIFY(keep.service->dismiss(kept));
        QVERIFY(keep.history.find(kept).has_value());
    }

    void activeCapClosesOldest()
    {
        Fixture f("history:\n  max_active: 2\n");
        QSignalSpy closed(f.service.get(), &hush::NotificationService::notificationClosed);

        f.service->notify(request("a", "one"));
        f.service->notify(request("a", "two"));
        f.service->notify(request("a", "three"));

        QCOMPARE(f.history.activeCount(), 2);
        QCOMPARE(closed.count(), 1);
        QCOMPARE(closed.first().at(0).toUInt(), 1u);
        QCOMPARE(closed.first().at(1).value<hush::CloseReason>(), hush::CloseReason::Undefined);
    }

    void historyEvictionOfOpenEntryIsReported()
    {
        Fixture f("history:\n  max_entries: 2\n");
        QSignalSpy closed(f.service.get(), &hush::NotificationService::notificationClosed);

        f.service->notify(request("a", "one"));
        f.service->notify(request("a", "two"));
        f.service->notify(request("a", "three"));

        QCOMPARE(f.history.size(), 2);
        QVERIFY(!f.expiry.isScheduled(1));
        QTRY_COMPARE(closed.count(), 1);
        QCOMPARE(closed.first().at(0).toUInt(), 1u);
        QCOMPARE(closed.first().at(1).value<hush::CloseReason>(), hush::CloseReason::Undefined);
    }

    void clearHistoryDismissesOpenEntries()
    {
        Fixture f;
        QSignalSpy closed(f.service.get(), &hush::NotificationService::notificationClosed);
        QSignalSpy cleared(f.service.get(), &hush::NotificationService::historyCleared);

        const quint32 a = f.service->notify(request("a", "one"));
        f.service->notify(request("a", "two"));
        QVERIFY(f.service->closeNotification(a));

        QCOMPARE(f.service->clearHistory(), 2);
        QCOMPARE(f.history.size(), 0);
        QCOMPARE(closed.count(), 2);
        QCOMPARE(closed.last().at(1).value<hush::CloseReason>(), hush::CloseReason::Dismissed);
        QCOMPARE(cleared.count(), 1);
        QCOMPARE(f.expiry.pendingCount(), 0);
    }

    void hidePopupStillRecords()
    {
        Fixture f("rules:\n  - app: spotify\n    actions: [hide_popup]\n");
        QSignalSpy shown(f.service.get(), &hush::NotificationService::notificationShown);
        const quint32 id = f.service->notify(request("spotify", "Next track"));
        QVERIFY(f.history.isOpen(id));
        QCOMPARE(shown.count(), 0);
    }

    void identicalBurstIsCounted()
    {
        Fixture f;
        const quint32 first = f.service->notify(request("build", "failed"));
        const quint32 second = f.service->notify(request("build", "failed"));
        QCOMPARE(second, first);
        QCOMPARE(f.history.size(), 1);
        QCOMPARE(f.history.find(first)->repeatCount, 2);
    }

    void capabilitiesAndServerInformation()
    {
        Fixture f;
        const QStringList caps = f.service->capabilities();
        QVERIFY(caps.contains("actions"));
        QVERIFY(caps.contains("body"));
        QVERIFY(!caps.contains("sound"));

        Fixture loud("sound:\n  enabled: true\nhistory:\n  persist: true\n");
        QVERIFY(loud.service->capabilities().contains("sound"));
        QVERIFY(loud.service->capabilities().contains("persistence"));

        const auto info = f.service->serverInformation();
        QCOMPARE(info.name, QString("hushd"));
        QCOMPARE(info.specVersion, QString("1.2"));
        QVERIFY(!info.version.isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestNotificationService)
#include "test_notification_service.moc"
