#include <signal.h>
#include <QCoreApplication>
#include <QDBusConnection>
#include <QFile>
#include <QStandardPaths>
#include <boost/log/trivial.hpp>
#include "core/Duration.hpp"
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/bluetooth/AdapterMonitor.hpp"
#include "core/bluetooth/AdapterStateMachine.hpp"
#include "core/services/BluezAdapterService.hpp"
#include "core/services/NotificationService.hpp"
#include "core/timeout/TimeoutController.hpp"

namespace {

constexpr int EXIT_SUBSCRIPTION_FAILED = 1;
constexpr int EXIT_INVALID_CONFIG = 2;

QString defaultConfigPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
        + "/bluetooth-timeout/config.yml";
}

void requestQuit(int)
{
    QMetaObject::invokeMethod(QCoreApplication::instance(), []() {
        BOOST_LOG_TRIVIAL(info) << "[Main] Termination requested, exiting";
        QCoreApplication::exit(0);
    }, Qt::QueuedConnection);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("bluetooth-timeout");
    app.setApplicationVersion("0.1.0");

    // Console logging until the configured level and file are known
    btt::logging::init(boost::log::trivial::info);
    btt::logging::installQtMessageHandler();

    const QStringList args = app.arguments();
    const QString configPath = args.size() > 1 ? args.at(1) : defaultConfigPath();

    btt::YamlConfig config;
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const btt::ConfigError& e) {
            BOOST_LOG_TRIVIAL(fatal) << "[Main] " << e.what();
            return EXIT_INVALID_CONFIG;
        }
        BOOST_LOG_TRIVIAL(info) << "[Main] Loaded configuration from " << configPath.toStdString();
    } else {
        BOOST_LOG_TRIVIAL(warning) << "[Main] No configuration at " << configPath.toStdString()
                                   << ", using defaults";
    }

    const QStringList problems = config.validate();
    if (!problems.isEmpty()) {
        for (const QString& problem : problems)
            BOOST_LOG_TRIVIAL(fatal) << "[Main] Invalid configuration: " << problem.toStdString();
        return EXIT_INVALID_CONFIG;
    }
    for (const QString& key : config.unknownKeys())
        BOOST_LOG_TRIVIAL(warning) << "[Main] Ignoring unknown configuration key '"
                                   << key.toStdString() << "'";

    const auto level = btt::logging::severityFromString(config.logLevel());
    btt::logging::init(level.value_or(boost::log::trivial::info), config.logFile());

    const btt::BusSettings settings = config.busSettings();
    QDBusConnection systemBus = QDBusConnection::systemBus();
    QDBusConnection sessionBus = QDBusConnection::sessionBus();

    btt::TimeoutPolicy policy;
    policy.timeout = config.timeout();
    policy.warnings = config.notificationsAt();
    policy.notificationsEnabled = config.notificationsEnabled();

    btt::AdapterMonitor monitor(systemBus, settings);
    btt::BluezAdapterService adapter(systemBus, settings);
    btt::NotificationService notifications(sessionBus, QStringLiteral("bluetooth-timeout"));
    btt::TimeoutController timeout;
    btt::AdapterStateMachine machine(&adapter, &notifications, &timeout, policy);

    QObject::connect(&monitor, &btt::AdapterMonitor::eventReceived,
                     &machine, &btt::AdapterStateMachine::post);
    QObject::connect(&monitor, &btt::AdapterMonitor::subscriptionLost, &app, []() {
        BOOST_LOG_TRIVIAL(fatal) << "[Main] Lost the Bluetooth service, exiting";
        QCoreApplication::exit(EXIT_SUBSCRIPTION_FAILED);
    });

    // Subscribe before querying so no change between the two goes unseen.
    // Events that arrive meanwhile are queued behind the initial snapshot.
    if (!monitor.start()) {
        BOOST_LOG_TRIVIAL(fatal) << "[Main] Could not subscribe to " << settings.service.toStdString();
        return EXIT_SUBSCRIPTION_FAILED;
    }
    if (!machine.initialize())
        return EXIT_SUBSCRIPTION_FAILED;

    signal(SIGINT, requestQuit);
    signal(SIGTERM, requestQuit);

    BOOST_LOG_TRIVIAL(info) << "[Main] Watching " << settings.adapterPath.toStdString()
                            << ", timeout " << btt::formatDuration(policy.timeout).toStdString();

    const int ret = app.exec();
    timeout.cancel();
    return ret;
}
