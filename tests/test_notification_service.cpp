#include <QTest>
#include <QSignalSpy>
#include "core/services/NotificationService.hpp"

class TestNotificationService : public QObject {
    Q_OBJECT
private slots:
    void testNotifyMessageLayout()
    {
        btt::Notification n;
        n.appName = "bluetooth-timeout";
        n.icon = "bluetooth-symbolic";
        n.summary = "Bluetooth Timeout Warning";
        n.body = "Bluetooth adapter will turn off in 1m due to inactivity.";

        const QDBusMessage msg = btt::NotificationService::buildNotifyMessage(n);
        QCOMPARE(msg.type(), QDBusMessage::MethodCallMessage);
        QCOMPARE(msg.service(), QString("org.freedesktop.Notifications"));
        QCOMPARE(msg.path(), QString("/org/freedesktop/Notifications"));
        QCOMPARE(msg.interface(), QString("org.freedesktop.Notifications"));
        QCOMPARE(msg.member(), QString("Notify"));

        // susssasa{sv}i
        const QList<QVariant> args = msg.arguments();
        QCOMPARE(args.size(), 8);
        QCOMPARE(args.at(0).toString(), QString("bluetooth-timeout"));
        QCOMPARE(args.at(1).metaType(), QMetaType::fromType<quint32>());
        QCOMPARE(args.at(1).toUInt(), 0u);
        QCOMPARE(args.at(2).toString(), QString("bluetooth-symbolic"));
        QCOMPARE(args.at(3).toString(), QString("Bluetooth Timeout Warning"));
        QCOMPARE(args.at(4).toString(), n.body);
        QVERIFY(args.at(5).toStringList().isEmpty());
        QVERIFY(args.at(6).toMap().isEmpty());
        QCOMPARE(args.at(7).metaType(), QMetaType::fromType<qint32>());
        QCOMPARE(args.at(7).toInt(), -1);
    }

    void testReplacesId()
    {
        btt::Notification n;
        n.replacesId = 42;
        n.expireTimeoutMs = 5000;

        const QList<QVariant> args = btt::NotificationService::buildNotifyMessage(n).arguments();
        QCOMPARE(args.at(1).toUInt(), 42u);
        QCOMPARE(args.at(7).toInt(), 5000);
    }

    void testNotifyWithoutSessionBus()
    {
        btt::NotificationService svc(QDBusConnection(QStringLiteral("btt-test-no-session")),
                                     QStringLiteral("bluetooth-timeout"));
        QSignalSpy failed(&svc, &btt::NotificationService::notificationFailed);
        QSignalSpy shown(&svc, &btt::NotificationService::notificationShown);

        QTest::ignoreMessage(QtWarningMsg, "[Notifications] Session bus not connected, notification dropped");
        svc.notify("Bluetooth Adapter Turned Off",
                   "Bluetooth adapter has been turned off due to inactivity.",
                   "bluetooth-disabled-symbolic");

        QCOMPARE(failed.count(), 1);
        QCOMPARE(shown.count(), 0);
        QCOMPARE(svc.lastNotificationId(), 0u);
    }
};

QTEST_MAIN(TestNotificationService)
#include "test_notification_service.moc"
