#include <QtTest>
#include <QSignalSpy>
#include <QElapsedTimer>
#include <QThread>
#include "core/timeout/TimeoutController.hpp"

using namespace std::chrono_literals;
using Duration = btt::TimeoutController::Duration;

namespace {

QList<qint64> millis(const QList<Duration>& durations)
{
    QList<qint64> out;
    for (const auto& d : durations)
        out << d.count();
    return out;
}

} // namespace

class TestTimeoutController : public QObject {
    Q_OBJECT

private slots:
    void warningsThenDeadline()
    {
        // 300s timeout with warnings at 300s, 60s, 30s and 10s, scaled down to ms
        btt::TimeoutController controller;
        QSignalSpy warnings(&controller, &btt::TimeoutController::warningDue);
        QSignalSpy deadline(&controller, &btt::TimeoutController::deadlineReached);

        QElapsedTimer clock;
        QList<qint64> firedAt;
        qint64 deadlineAt = -1;
        connect(&controller, &btt::TimeoutController::warningDue, this,
                [&]() { firedAt << clock.elapsed(); });
        connect(&controller, &btt::TimeoutController::deadlineReached, this,
                [&]() { deadlineAt = clock.elapsed(); });

        clock.start();
        QVERIFY(controller.start(3000ms, {3000ms, 600ms, 300ms, 100ms}));
        const quint64 session = controller.sessionId();

        QVERIFY(deadline.wait(5000));

        // Each checkpoint fires at total - offset and before the next one
        QCOMPARE(firedAt.size(), 3);
        QVERIFY2(firedAt.at(0) >= 2400 && firedAt.at(0) < 2700, qPrintable(QString::number(firedAt.at(0))));
        QVERIFY2(firedAt.at(1) >= 2700 && firedAt.at(1) < 2900, qPrintable(QString::number(firedAt.at(1))));
        QVERIFY2(firedAt.at(2) >= 2900 && firedAt.at(2) < 3000, qPrintable(QString::number(firedAt.at(2))));
        QVERIFY2(deadlineAt >= 3000, qPrintable(QString::number(deadlineAt)));

        QCOMPARE(warnings.count(), 3);
        QCOMPARE(warnings.at(0).at(1).toLongLong(), qint64(600));
        QCOMPARE(warnings.at(1).at(1).toLongLong(), qint64(300));
        QCOMPARE(warnings.at(2).at(1).toLongLong(), qint64(100));
        for (const auto& args : warnings)
            QCOMPARE(args.at(0).toULongLong(), session);

        QCOMPARE(deadline.count(), 1);
        QCOMPARE(deadline.at(0).at(0).toULongLong(), session);

        // Expired but still live until its owner cancels it
        QVERIFY(controller.isActive());
        QVERIFY(controller.isExpired());
        QVERIFY(controller.isCurrent(session));
        QCOMPARE(controller.remaining().count(), Duration(0).count());
        QCOMPARE(millis(controller.firedWarnings()), (QList<qint64>{600, 300, 100}));

        QTest::qWait(200);
        QCOMPARE(deadline.count(), 1);
        controller.cancel();
        QVERIFY(!controller.isActive());
    }

    void longTimeoutStaysArmed()
    {
        // Beyond the int range of a single QTimer interval
        btt::TimeoutController controller;
        QSignalSpy deadline(&controller, &btt::TimeoutController::deadlineReached);

        const Duration total = std::chrono::hours(24 * 25);
        QVERIFY(controller.start(total, {std::chrono::hours(24 * 24)}));
        QVERIFY(controller.isArmed());
        QVERIFY(controller.remaining() > std::chrono::hours(24 * 24));

        QTest::qWait(50);
        QVERIFY(controller.isArmed());
        QCOMPARE(deadline.count(), 0);
        QVERIFY(controller.firedWarnings().isEmpty());
        controller.cancel();
        QVERIFY(!controller.isArmed());
    }

    void cancelSilencesSession()
    {
        btt::TimeoutController controller;
        QSignalSpy warnings(&controller, &btt::TimeoutController::warningDue);
        QSignalSpy deadline(&controller, &btt::TimeoutController::deadlineReached);

        QVERIFY(controller.start(200ms, {150ms}));
        const quint64 session = controller.sessionId();
        controller.cancel();

        QVERIFY(!controller.isActive());
        QVERIFY(!controller.isCurrent(session));
        QCOMPARE(controller.remaining().count(), Duration(0).count());

        QTest::qWait(400);
        QCOMPARE(warnings.count(), 0);
        QCOMPARE(deadline.count(), 0);
    }

    void cancelIsIdempotent()
    {
        btt::TimeoutController controller;
        controller.cancel();
        controller.cancel();
        QVERIFY(!controller.isActive());
        QCOMPARE(controller.sessionId(), quint64(0));

        QVERIFY(controller.start(100ms, {}));
        controller.cancel();
        controller.cancel();

        // A later session is unaffected by the earlier cancels
        QSignalSpy deadline(&controller, &btt::TimeoutController::deadlineReached);
        QVERIFY(controller.start(100ms, {}));
        QVERIFY(deadline.wait(1000));
        QCOMPARE(deadline.at(0).at(0).toULongLong(), controller.sessionId());
        QCOMPARE(controller.sessionId(), quint64(2));
    }

    void startRefusedWhileLive()
    {
        btt::TimeoutController controller;
        QVERIFY(controller.start(10s, {5s}));
        const quint64 session = controller.sessionId();

        QVERIFY(!controller.start(1s, {}));
        QCOMPARE(controller.sessionId(), session);
        QVERIFY(controller.remaining() > 5s);
        QCOMPARE(millis(controller.pendingWarnings()), QList<qint64>{5000});

        controller.cancel();
    }

    void resetOpensNewSession()
    {
        btt::TimeoutController controller;
        QVERIFY(controller.start(10s, {}));
        const quint64 first = controller.sessionId();

        QVERIFY(controller.reset(20s, {1s}));
        QVERIFY(controller.sessionId() > first);
        QVERIFY(!controller.isCurrent(first));
        QVERIFY(controller.isCurrent(controller.sessionId()));
        QVERIFY(controller.remaining() > 10s);

        controller.cancel();
    }

    void offsetsOutsideWindowSkipped()
    {
        btt::TimeoutController controller;
        QVERIFY(controller.start(1000ms, {1000ms, 2000ms, 0ms, -5ms, 500ms, 200ms, 500ms}));
        QCOMPARE(millis(controller.pendingWarnings()), (QList<qint64>{500, 200}));
        controller.cancel();

        QVERIFY(!controller.start(0ms, {}));
        QVERIFY(!controller.isActive());
    }

    void cancelFromWarningReceiver()
    {
        btt::TimeoutController controller;
        QSignalSpy deadline(&controller, &btt::TimeoutController::deadlineReached);
        int warningsSeen = 0;
        connect(&controller, &btt::TimeoutController::warningDue, this, [&]() {
            ++warningsSeen;
            controller.cancel();
        });

        QVERIFY(controller.start(300ms, {250ms, 100ms}));
        QTRY_COMPARE_WITH_TIMEOUT(warningsSeen, 1, 1000);
        QTest::qWait(400);
        QCOMPARE(warningsSeen, 1);
        QCOMPARE(deadline.count(), 0);
    }

    void overdueWarningsCollapse()
    {
        btt::TimeoutController controller;
        QSignalSpy warnings(&controller, &btt::TimeoutController::warningDue);
        QSignalSpy deadline(&controller, &btt::TimeoutController::deadlineReached);

        // Due at 100, 200 and 300ms; the loop is blocked until 350ms
        QVERIFY(controller.start(600ms, {500ms, 400ms, 300ms}));
        QThread::msleep(350);

        QVERIFY(deadline.wait(2000));
        QCOMPARE(warnings.count(), 1);
        QCOMPARE(warnings.at(0).at(1).toLongLong(), qint64(300));
        QCOMPARE(millis(controller.firedWarnings()), (QList<qint64>{500, 400, 300}));
        controller.cancel();
    }

    void overdueDeadlineSkipsWarnings()
    {
        btt::TimeoutController controller;
        QSignalSpy warnings(&controller, &btt::TimeoutController::warningDue);
        QSignalSpy deadline(&controller, &btt::TimeoutController::deadlineReached);

        QVERIFY(controller.start(100ms, {50ms}));
        QThread::msleep(150);

        QVERIFY(deadline.wait(1000));
        QCOMPARE(warnings.count(), 0);
        QVERIFY(controller.pendingWarnings().isEmpty());
        controller.cancel();
    }
};

QTEST_MAIN(TestTimeoutController)
#include "test_timeout_controller.moc"
