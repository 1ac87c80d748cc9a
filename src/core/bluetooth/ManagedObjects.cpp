#include "core/bluetooth/ManagedObjects.hpp"
#include <QDBusObjectPath>

namespace btt {

std::optional<ManagedObjects> parseManagedObjects(const QDBusArgument& arg)
{
    if (arg.currentSignature() != QLatin1String("a{oa{sa{sv}}}"))
        return std::nullopt;

    // Outer map is keyed by object path; each value demarshals as InterfaceMap.
    ManagedObjects objects;
    arg.beginMap();
    while (!arg.atEnd()) {
        arg.beginMapEntry();
        QDBusObjectPath path;
        InterfaceMap interfaces;
        arg >> path >> interfaces;
        arg.endMapEntry();
        objects.insert(path.path(), interfaces);
    }
    arg.endMap();
    return objects;
}

QStringList connectedDevicePaths(const ManagedObjects& objects, const BusSettings& settings)
{
    QStringList paths;
    for (auto it = objects.cbegin(); it != objects.cend(); ++it) {
        if (!settings.isDevicePath(it.key()))
            continue;
        const auto iface = it.value().constFind(settings.deviceInterface);
        if (iface == it.value().cend())
            continue;
        const QVariant connected = iface->value(QStringLiteral("Connected"));
        if (connected.typeId() == QMetaType::Bool && connected.toBool())
            paths << it.key();
    }
    return paths;
}

} // namespace btt
