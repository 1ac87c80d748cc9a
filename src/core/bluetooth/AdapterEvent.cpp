#include "core/bluetooth/AdapterEvent.hpp"

namespace btt {

const char* toString(AdapterEventType type)
{
    switch (type) {
    case AdapterEventType::AdapterPoweredOn:   return "AdapterPoweredOn";
    case AdapterEventType::AdapterPoweredOff:  return "AdapterPoweredOff";
    case AdapterEventType::DeviceConnected:    return "DeviceConnected";
    case AdapterEventType::DeviceDisconnected: return "DeviceDisconnected";
    case AdapterEventType::DeviceRemoved:      return "DeviceRemoved";
    }
    return "Unknown";
}

QDebug operator<<(QDebug debug, const AdapterEvent& event)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << toString(event.type);
    if (event.isDeviceEvent())
        debug.nospace() << '(' << qUtf8Printable(event.device) << ')';
    return debug;
}

} // namespace btt
