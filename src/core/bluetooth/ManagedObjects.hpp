#pragma once

#include "core/bluetooth/BusSettings.hpp"
#include <QDBusArgument>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <optional>

namespace btt {

/// interface name → properties, the a{sa{sv}} payload of InterfacesAdded.
using InterfaceMap = QMap<QString, QVariantMap>;

/// object path → interfaces, the a{oa{sa{sv}}} reply of GetManagedObjects.
using ManagedObjects = QMap<QString, InterfaceMap>;

/// Demarshal a GetManagedObjects reply. Returns nullopt if the argument does
/// not carry the expected a{oa{sa{sv}}} signature.
std::optional<ManagedObjects> parseManagedObjects(const QDBusArgument& arg);

/// Object paths of devices under settings.adapterPath whose Connected
/// property is true.
QStringList connectedDevicePaths(const ManagedObjects& objects, const BusSettings& settings);

} // namespace btt
