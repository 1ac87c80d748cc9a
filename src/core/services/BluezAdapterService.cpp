#include "BluezAdapterService.hpp"
#include "core/bluetooth/ManagedObjects.hpp"
#include <QDebug>
#include <QDBusInterface>
#include <QDBusReply>
#include <QDBusVariant>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>

namespace btt {

BluezAdapterService::BluezAdapterService(const QDBusConnection& bus, const BusSettings& settings,
                                         QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , settings_(settings)
{
}

QVariant BluezAdapterService::getAdapterProperty(const QString& property)
{
    QDBusInterface props(settings_.service, settings_.adapterPath,
        "org.freedesktop.DBus.Properties", bus_);
    props.setTimeout(CALL_TIMEOUT_MS);
    QDBusReply<QDBusVariant> reply = props.call("Get", settings_.adapterInterface, property);
    if (reply.isValid())
        return reply.value().variant();
    qWarning() << "[BluezAdapter] Failed to get" << property << ":" << reply.error().message();
    return {};
}

std::optional<bool> BluezAdapterService::isPowered()
{
    const QVariant powered = getAdapterProperty(QStringLiteral("Powered"));
    if (powered.typeId() != QMetaType::Bool) {
        if (powered.isValid())
            qWarning() << "[BluezAdapter] Powered is not a boolean:" << powered;
        return std::nullopt;
    }
    return powered.toBool();
}

std::optional<QStringList> BluezAdapterService::connectedDevices()
{
    QDBusInterface objectManager(settings_.service, "/",
        "org.freedesktop.DBus.ObjectManager", bus_);
    objectManager.setTimeout(CALL_TIMEOUT_MS);

    QDBusMessage reply = objectManager.call("GetManagedObjects");
    if (reply.type() != QDBusMessage::ReplyMessage || reply.arguments().isEmpty()) {
        qWarning() << "[BluezAdapter] GetManagedObjects failed:" << reply.errorMessage();
        return std::nullopt;
    }

    const QVariant payload = reply.arguments().first();
    std::optional<ManagedObjects> objects;
    if (payload.metaType() == QMetaType::fromType<QDBusArgument>())
        objects = parseManagedObjects(payload.value<QDBusArgument>());
    if (!objects) {
        qWarning() << "[BluezAdapter] Unexpected GetManagedObjects reply signature:"
                   << reply.signature();
        return std::nullopt;
    }

    const QStringList devices = connectedDevicePaths(*objects, settings_);
    qInfo() << "[BluezAdapter] Found" << devices.size() << "connected device(s) on"
            << settings_.adapterPath;
    return devices;
}

void BluezAdapterService::powerOff(std::function<void(bool ok)> done)
{
    qInfo() << "[BluezAdapter] Powering off" << settings_.adapterPath;

    QDBusMessage call = QDBusMessage::createMethodCall(settings_.service, settings_.adapterPath,
        "org.freedesktop.DBus.Properties", "Set");
    call << settings_.adapterInterface
         << QStringLiteral("Powered")
         << QVariant::fromValue(QDBusVariant(false));

    QDBusPendingCall pending = bus_.asyncCall(call, CALL_TIMEOUT_MS);
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this,
            [watcher, done = std::move(done)]() {
        watcher->deleteLater();
        const bool ok = !watcher->isError();
        if (ok)
            qInfo() << "[BluezAdapter] Power-off request accepted";
        else
            qWarning() << "[BluezAdapter] Power-off request failed:" << watcher->error().message();
        if (done)
            done(ok);
    });
}

} // namespace btt
