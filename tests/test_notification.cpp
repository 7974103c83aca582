#include <QTest>
#include "core/Notification.hpp"

namespace {

hush::RawImage rgbaImage(int width, int height)
{
    hush::RawImage image;
    image.width = width;
    image.height = height;
    image.channels = 4;
    image.hasAlpha = true;
    image.rowstride = width * 4;
    image.data = QByteArray(image.rowstride * height, char(0x7f));
    return image;
}

} // namespace

class TestNotification : public QObject {
    Q_OBJECT
private slots:
    void emptyAppNameBecomesUnknown()
    {
        hush::NotifyRequest req;
        req.appName = "   ";
        req.summary = "hi";
        auto n = hush::notificationFromRequest(req);
        QCOMPARE(n.appName, QString("Unknown"));
        QCOMPARE(n.id, 0u);
        QVERIFY(n.isOpen());
    }

    void actionsArePairedAndTrailingKeyDropped()
    {
        hush::NotifyRequest req;
        req.actions = {"default", "Open", "reply", "Reply", "orphan"};
        auto n = hush::notificationFromRequest(req);
        QCOMPARE(n.actions.size(), 2);
        QCOMPARE(n.actions.at(1).key, QString("reply"));
        QCOMPARE(n.actions.at(1).label, QString("Reply"));
        QVERIFY(n.hasAction("default"));
        QVERIFY(!n.hasAction("orphan"));
    }

    void hintsFillTypedFields()
    {
        hush::NotifyRequest req;
        req.hints = {
            {"urgency", QVariant::fromValue<uchar>(2)},
            {"category", "email.arrived"},
            {"desktop-entry", "org.gnome.Evolution.desktop"},
            {"image-path", "/usr/share/icons/x.png"},
            {"transient", true},
            {"resident", "true"},
        };
        auto n = hush::notificationFromRequest(req);
        QCOMPARE(n.urgency, hush::Urgency::Critical);
        QCOMPARE(n.category, QString("email.arrived"));
        QCOMPARE(n.desktopEntry, QString("org.gnome.Evolution"));
        QCOMPARE(n.imagePath, QString("/usr/share/icons/x.png"));
        QVERIFY(n.transient);
        QVERIFY(n.resident);
    }

    void expireTimeoutKinds()
    {
        hush::NotifyRequest req;
        req.expireTimeout = -1;
        QCOMPARE(hush::notificationFromRequest(req).expireTimeout.kind, hush::ExpireTimeout::Kind::Default);
        req.expireTimeout = 0;
        QCOMPARE(hush::notificationFromRequest(req).expireTimeout.kind, hush::ExpireTimeout::Kind::Never);
        req.expireTimeout = 1500;
        auto n = hush::notificationFromRequest(req);
        QCOMPARE(n.expireTimeout.kind, hush::ExpireTimeout::Kind::Explicit);
        QCOMPARE(n.expireTimeout.ms, 1500);
    }

    void timeoutBelowMinusOneIsRejected()
    {
        hush::NotifyRequest req;
        req.expireTimeout = -2;
        bool threw = false;
        try {
            hush::notificationFromRequest(req);
        } catch (const hush::ProtocolError&) {
            threw = true;
        }
        QVERIFY(threw);
    }

    void inlineImageIsKept()
    {
        hush::NotifyRequest req;
        req.hints.insert("image-data", QVariant::fromValue(rgbaImage(4, 4)));
        auto n = hush::notificationFromRequest(req);
        QVERIFY(n.imageData.has_value());
        QCOMPARE(n.imageData->width, 4);
        QVERIFY(!n.hints.contains("image-data"));
    }

    void inconsistentImageIsRejected()
    {
        hush::RawImage image = rgbaImage(8, 8);
        image.data.truncate(10);
        hush::NotifyRequest req;
        req.hints.insert("image-data", QVariant::fromValue(image));

        bool threw = false;
        try {
            hush::notificationFromRequest(req);
        } catch (const hush::ProtocolError&) {
            threw = true;
        }
        QVERIFY(threw);
    }

    void oversizedImageIsDroppedNotRejected()
    {
        hush::NotifyRequest req;
        req.hints.insert("icon_data", QVariant::fromValue(rgbaImage(600, 2)));
        auto n = hush::notificationFromRequest(req);
        QVERIFY(!n.imageData.has_value());
    }

    void jsonOmitsBodyUnlessFull()
    {
        hush::NotifyRequest req;
        req.appName = "mail";
        req.summary = "New message";
        req.body = "secret";
        auto n = hush::notificationFromRequest(req);
        n.id = 12;

        QVERIFY(!n.toJson(false).contains("body"));
        QCOMPARE(n.toJson(true).value("body").toString(), QString("secret"));

        auto restored = hush::Notification::fromJson(n.toJson(true));
        QVERIFY(restored.has_value());
        QCOMPARE(restored->id, 12u);
        QCOMPARE(restored->summary, QString("New message"));
        QVERIFY(restored->closed);
    }

    void closeReasonWireValues()
    {
        QCOMPARE(static_cast<quint32>(hush::CloseReason::Expired), 1u);
        QCOMPARE(static_cast<quint32>(hush::CloseReason::Undefined), 4u);
        QCOMPARE(hush::closeReasonName(hush::CloseReason::ClosedByRequest), QString("closed"));
        QVERIFY(hush::urgencyFromName("CRITICAL") == hush::Urgency::Critical);
        QVERIFY(!hush::urgencyFromName("urgent").has_value());
    }
};

QTEST_GUILESS_MAIN(TestNotification)
#include "test_notification.moc"
