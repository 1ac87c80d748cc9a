#include <QtTest>
#include "core/Duration.hpp"

using namespace std::chrono_literals;

class TestDuration : public QObject {
    Q_OBJECT
private slots:
    void testParse_data();
    void testParse();
    void testParseRejects_data();
    void testParseRejects();
    void testFormat();
};

void TestDuration::testParse_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<qint64>("millis");

    QTest::newRow("default timeout") << "5m 1s" << qint64(301000);
    QTest::newRow("seconds") << "30s" << qint64(30000);
    QTest::newRow("bare integer") << "300" << qint64(300000);
    QTest::newRow("compact") << "1h30m" << qint64(5400000);
    QTest::newRow("long units") << "2 minutes 5 seconds" << qint64(125000);
    QTest::newRow("millis") << "250ms" << qint64(250);
    QTest::newRow("day") << "1d" << qint64(86400000);
    QTest::newRow("padded") << "  10 sec  " << qint64(10000);
    QTest::newRow("zero") << "0s" << qint64(0);
}

void TestDuration::testParse()
{
    QFETCH(QString, text);
    QFETCH(qint64, millis);

    const auto parsed = btt::parseDuration(text);
    QVERIFY(parsed.has_value());
    QCOMPARE(qint64(parsed->count()), millis);
}

void TestDuration::testParseRejects_data()
{
    QTest::addColumn<QString>("text");

    QTest::newRow("empty") << "";
    QTest::newRow("blank") << "   ";
    QTest::newRow("unit only") << "s";
    QTest::newRow("unknown unit") << "5 fortnights";
    QTest::newRow("negative") << "-5";
    QTest::newRow("trailing junk") << "5m!";
    QTest::newRow("fraction") << "1.5h";
    QTest::newRow("seconds overflow") << "18446744073709552s";
    QTest::newRow("bare overflow") << "9223372036854775807";
    QTest::newRow("sum overflow") << "106751991167d 300000000s";
    QTest::newRow("digits past qint64") << "99999999999999999999ms";
}

void TestDuration::testParseRejects()
{
    QFETCH(QString, text);
    QVERIFY(!btt::parseDuration(text).has_value());
}

void TestDuration::testFormat()
{
    QCOMPARE(btt::formatDuration(301000ms), QString("5m 1s"));
    QCOMPARE(btt::formatDuration(5min), QString("5m"));
    QCOMPARE(btt::formatDuration(30s), QString("30s"));
    QCOMPARE(btt::formatDuration(1h + 500ms), QString("1h 500ms"));
    QCOMPARE(btt::formatDuration(0ms), QString("0s"));

    // What formatDuration writes, parseDuration reads back.
    QCOMPARE(qint64(btt::parseDuration(btt::formatDuration(90061001ms))->count()), qint64(90061001));
}

QTEST_MAIN(TestDuration)
#include "test_duration.moc"
