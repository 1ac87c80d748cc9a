#include "core/bluetooth/AdapterMonitor.hpp"
#include <QDebug>
#include <QDBusArgument>
#include <QDBusConnectionInterface>
#include <QDBusObjectPath>
#include <QDBusReply>
#include <QDBusServiceWatcher>

namespace btt {

namespace {

const QString kPropertiesInterface = QStringLiteral("org.freedesktop.DBus.Properties");
const QString kObjectManagerInterface = QStringLiteral("org.freedesktop.DBus.ObjectManager");

// Read one signal argument, whether it arrived marshalled from the bus
// (QDBusArgument) or was built locally with native types.
template<typename T>
bool extractArgument(const QVariant& value, const char* signature, T& out)
{
    if (value.metaType() == QMetaType::fromType<QDBusArgument>()) {
        const auto arg = value.value<QDBusArgument>();
        if (arg.currentSignature() != QLatin1String(signature))
            return false;
        arg >> out;
        return true;
    }
    if (!value.canConvert<T>())
        return false;
    out = value.value<T>();
    return true;
}

bool extractPath(const QVariant& value, QString& out)
{
    if (value.metaType() == QMetaType::fromType<QDBusObjectPath>()) {
        out = value.value<QDBusObjectPath>().path();
        return true;
    }
    return false;
}

} // namespace

AdapterMonitor::AdapterMonitor(const QDBusConnection& bus, const BusSettings& settings,
                               QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , settings_(settings)
{
}

bool AdapterMonitor::isListening() const { return listening_; }
const BusSettings& AdapterMonitor::settings() const { return settings_; }

bool AdapterMonitor::start()
{
    if (listening_) return true;

    if (!bus_.isConnected()) {
        qCritical() << "[AdapterMonitor] System bus not connected:" << bus_.lastError().message();
        return false;
    }

    auto* busInterface = bus_.interface();
    if (!busInterface) {
        qCritical() << "[AdapterMonitor] No bus interface available";
        return false;
    }
    QDBusReply<bool> registered = busInterface->isServiceRegistered(settings_.service);
    if (!registered.isValid() || !registered.value()) {
        qCritical() << "[AdapterMonitor] Service" << settings_.service << "is not on the bus";
        return false;
    }

    const bool subscribed =
        bus_.connect(settings_.service, QString(), kPropertiesInterface,
                     QStringLiteral("PropertiesChanged"), {settings_.adapterInterface}, QString(),
                     this, SLOT(handleSignal(QDBusMessage)))
        && bus_.connect(settings_.service, QString(), kPropertiesInterface,
                        QStringLiteral("PropertiesChanged"), {settings_.deviceInterface}, QString(),
                        this, SLOT(handleSignal(QDBusMessage)))
        && bus_.connect(settings_.service, QString(), kObjectManagerInterface,
                        QStringLiteral("InterfacesAdded"),
                        this, SLOT(handleSignal(QDBusMessage)))
        && bus_.connect(settings_.service, QString(), kObjectManagerInterface,
                        QStringLiteral("InterfacesRemoved"),
                        this, SLOT(handleSignal(QDBusMessage)));
    if (!subscribed) {
        qCritical() << "[AdapterMonitor] Failed to subscribe to" << settings_.service
                    << "signals:" << bus_.lastError().message();
        return false;
    }

    serviceWatcher_ = new QDBusServiceWatcher(settings_.service, bus_,
        QDBusServiceWatcher::WatchForUnregistration, this);
    connect(serviceWatcher_, &QDBusServiceWatcher::serviceUnregistered,
            this, &AdapterMonitor::onServiceUnregistered);

    listening_ = true;
    qInfo() << "[AdapterMonitor] Listening for" << settings_.adapterPath
            << "and its devices on" << settings_.service;
    return true;
}

void AdapterMonitor::onServiceUnregistered(const QString& service)
{
    qCritical() << "[AdapterMonitor]" << service << "left the bus, subscription lost";
    listening_ = false;
    emit subscriptionLost();
}

void AdapterMonitor::handleSignal(const QDBusMessage& message)
{
    if (message.type() != QDBusMessage::SignalMessage) {
        qWarning() << "[AdapterMonitor] Ignoring non-signal message" << message.member();
        return;
    }

    const QString member = message.member();
    if (message.interface() == kPropertiesInterface && member == QLatin1String("PropertiesChanged"))
        handlePropertiesChanged(message);
    else if (message.interface() == kObjectManagerInterface && member == QLatin1String("InterfacesAdded"))
        handleInterfacesAdded(message);
    else if (message.interface() == kObjectManagerInterface && member == QLatin1String("InterfacesRemoved"))
        handleInterfacesRemoved(message);
    else
        qDebug() << "[AdapterMonitor] Unhandled signal" << message.interface() << member;
}

void AdapterMonitor::handlePropertiesChanged(const QDBusMessage& message)
{
    const QList<QVariant> args = message.arguments();
    QString interface;
    QVariantMap changed;
    if (args.size() != 3
        || !extractArgument(args.at(0), "s", interface)
        || !extractArgument(args.at(1), "a{sv}", changed)) {
        qWarning() << "[AdapterMonitor] Malformed PropertiesChanged from" << message.path()
                   << "dropped";
        return;
    }

    if (auto event = decodePropertiesChanged(message.path(), interface, changed))
        emit eventReceived(*event);
}

void AdapterMonitor::handleInterfacesAdded(const QDBusMessage& message)
{
    const QList<QVariant> args = message.arguments();
    QString path;
    InterfaceMap interfaces;
    if (args.size() != 2
        || !extractPath(args.at(0), path)
        || !extractArgument(args.at(1), "a{sa{sv}}", interfaces)) {
        qWarning() << "[AdapterMonitor] Malformed InterfacesAdded, dropped";
        return;
    }

    if (auto event = decodeInterfacesAdded(path, interfaces))
        emit eventReceived(*event);
}

void AdapterMonitor::handleInterfacesRemoved(const QDBusMessage& message)
{
    const QList<QVariant> args = message.arguments();
    QString path;
    QStringList interfaces;
    if (args.size() != 2
        || !extractPath(args.at(0), path)
        || !extractArgument(args.at(1), "as", interfaces)) {
        qWarning() << "[AdapterMonitor] Malformed InterfacesRemoved, dropped";
        return;
    }

    if (auto event = decodeInterfacesRemoved(path, interfaces))
        emit eventReceived(*event);
}

std::optional<bool> AdapterMonitor::boolProperty(const QVariantMap& properties,
                                                 const QString& name,
                                                 const QString& path) const
{
    const auto it = properties.constFind(name);
    if (it == properties.cend())
        return std::nullopt;
    if (it->typeId() != QMetaType::Bool) {
        qWarning() << "[AdapterMonitor]" << name << "on" << path
                   << "is not a boolean (" << it->typeName() << "), dropped";
        return std::nullopt;
    }
    return it->toBool();
}

std::optional<AdapterEvent> AdapterMonitor::decodePropertiesChanged(const QString& path,
    const QString& interface, const QVariantMap& changed) const
{
    if (interface == settings_.adapterInterface) {
        if (path != settings_.adapterPath)
            return std::nullopt;
        const auto powered = boolProperty(changed, QStringLiteral("Powered"), path);
        if (!powered)
            return std::nullopt;
        return *powered ? AdapterEvent::poweredOn() : AdapterEvent::poweredOff();
    }

    if (interface == settings_.deviceInterface) {
        if (!settings_.isDevicePath(path))
            return std::nullopt;
        const auto connected = boolProperty(changed, QStringLiteral("Connected"), path);
        if (!connected)
            return std::nullopt;
        return *connected ? AdapterEvent::connected(path) : AdapterEvent::disconnected(path);
    }

    return std::nullopt;
}

std::optional<AdapterEvent> AdapterMonitor::decodeInterfacesAdded(const QString& path,
    const InterfaceMap& interfaces) const
{
    if (path == settings_.adapterPath) {
        const auto adapter = interfaces.constFind(settings_.adapterInterface);
        if (adapter == interfaces.cend())
            return std::nullopt;
        const auto powered = boolProperty(*adapter, QStringLiteral("Powered"), path);
        if (!powered)
            return std::nullopt;
        qInfo() << "[AdapterMonitor] Adapter" << path << "appeared";
        return *powered ? AdapterEvent::poweredOn() : AdapterEvent::poweredOff();
    }

    if (settings_.isDevicePath(path)) {
        const auto device = interfaces.constFind(settings_.deviceInterface);
        if (device == interfaces.cend())
            return std::nullopt;
        const auto connected = boolProperty(*device, QStringLiteral("Connected"), path);
        if (connected && *connected)
            return AdapterEvent::connected(path);
    }

    return std::nullopt;
}

std::optional<AdapterEvent> AdapterMonitor::decodeInterfacesRemoved(const QString& path,
    const QStringList& interfaces) const
{
    if (path == settings_.adapterPath && interfaces.contains(settings_.adapterInterface)) {
        qInfo() << "[AdapterMonitor] Adapter" << path << "removed";
        return AdapterEvent::poweredOff();
    }

    if (settings_.isDevicePath(path) && interfaces.contains(settings_.deviceInterface))
        return AdapterEvent::removed(path);

    return std::nullopt;
}

} // namespace btt
