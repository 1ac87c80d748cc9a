#pragma once

#include <QString>

namespace btt {

/// Where the adapter lives on the system bus and which interfaces identify
/// adapters and devices. Defaults match BlueZ 5.
struct BusSettings {
    QString service = QStringLiteral("org.bluez");
    QString adapterPath = QStringLiteral("/org/bluez/hci0");
    QString adapterInterface = QStringLiteral("org.bluez.Adapter1");
    QString deviceInterface = QStringLiteral("org.bluez.Device1");

    /// True if objectPath is strictly below the adapter (e.g. .../hci0/dev_XX).
    bool isDevicePath(const QString& objectPath) const
    {
        return objectPath.size() > adapterPath.size() + 1
            && objectPath.startsWith(adapterPath)
            && objectPath.at(adapterPath.size()) == QLatin1Char('/');
    }
};

} // namespace btt
