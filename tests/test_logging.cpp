#include <QtTest>
#include <QTemporaryDir>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include "core/Logging.hpp"

using boost::log::trivial::severity_level;

class TestLogging : public QObject {
    Q_OBJECT
private slots:
    void testSeverityNames()
    {
        QCOMPARE(btt::logging::severityFromString("trace").value(), severity_level::trace);
        QCOMPARE(btt::logging::severityFromString("Debug").value(), severity_level::debug);
        QCOMPARE(btt::logging::severityFromString(" info ").value(), severity_level::info);
        QCOMPARE(btt::logging::severityFromString("WARNING").value(), severity_level::warning);
        QCOMPARE(btt::logging::severityFromString("error").value(), severity_level::error);
        QCOMPARE(btt::logging::severityFromString("fatal").value(), severity_level::fatal);
        QVERIFY(!btt::logging::severityFromString("verbose").has_value());
        QVERIFY(!btt::logging::severityFromString("").has_value());
    }

    void testFileSinkAppendsAndFilters()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("logs/daemon.log");

        {
            QFile existing(dir.filePath("logs/daemon.log"));
            QVERIFY(QDir().mkpath(dir.filePath("logs")));
            QVERIFY(existing.open(QIODevice::WriteOnly));
            existing.write("previous run\n");
        }

        QVERIFY(btt::logging::init(severity_level::info, path));
        BOOST_LOG_TRIVIAL(debug) << "hidden detail";
        BOOST_LOG_TRIVIAL(warning) << "[Test] adapter gone";
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();

        QFile log(path);
        QVERIFY(log.open(QIODevice::ReadOnly));
        const QString contents = QString::fromUtf8(log.readAll());
        QVERIFY(contents.startsWith("previous run\n"));
        QVERIFY(contents.contains("[warning] [Test] adapter gone"));
        QVERIFY(!contents.contains("hidden detail"));
    }

    void testQtMessagesForwarded()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("qt.log");

        QVERIFY(btt::logging::init(severity_level::debug, path));
        const QtMessageHandler previous = btt::logging::installQtMessageHandler();
        qInfo() << "[AdapterMonitor] forwarded";
        qInstallMessageHandler(previous);
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();

        QFile log(path);
        QVERIFY(log.open(QIODevice::ReadOnly));
        QVERIFY(QString::fromUtf8(log.readAll()).contains("[info] [AdapterMonitor] forwarded"));
    }
};

QTEST_MAIN(TestLogging)
#include "test_logging.moc"
