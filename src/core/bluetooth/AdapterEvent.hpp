#pragma once

#include <QDebug>
#include <QMetaType>
#include <QString>

namespace btt {

enum class AdapterEventType {
    AdapterPoweredOn,
    AdapterPoweredOff,
    DeviceConnected,
    DeviceDisconnected,
    DeviceRemoved
};

/// Semantic event decoded from a BlueZ notification.
/// device is the device object path for device events, empty otherwise.
struct AdapterEvent {
    AdapterEventType type = AdapterEventType::AdapterPoweredOff;
    QString device;

    static AdapterEvent poweredOn() { return {AdapterEventType::AdapterPoweredOn, {}}; }
    static AdapterEvent poweredOff() { return {AdapterEventType::AdapterPoweredOff, {}}; }
    static AdapterEvent connected(const QString& path) { return {AdapterEventType::DeviceConnected, path}; }
    static AdapterEvent disconnected(const QString& path) { return {AdapterEventType::DeviceDisconnected, path}; }
    static AdapterEvent removed(const QString& path) { return {AdapterEventType::DeviceRemoved, path}; }

    bool isDeviceEvent() const { return !device.isEmpty(); }

    bool operator==(const AdapterEvent& other) const
    {
        return type == other.type && device == other.device;
    }
    bool operator!=(const AdapterEvent& other) const { return !(*this == other); }
};

const char* toString(AdapterEventType type);
QDebug operator<<(QDebug debug, const AdapterEvent& event);

} // namespace btt

Q_DECLARE_METATYPE(btt::AdapterEvent)
