#pragma once

#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

namespace btt {

/// Narrow view of the Bluetooth stack used by the state machine.
class IAdapterService {
public:
    virtual ~IAdapterService() = default;

    /// Current value of the adapter's Powered property, nullopt if the query failed.
    virtual std::optional<bool> isPowered() = 0;

    /// Object paths of devices under the adapter that are connected right now,
    /// nullopt if the query failed.
    virtual std::optional<QStringList> connectedDevices() = 0;

    /// Ask the stack to set Powered=false. Does not block; done(true) runs
    /// once the stack accepted the request, done(false) if it failed.
    virtual void powerOff(std::function<void(bool ok)> done) = 0;
};

} // namespace btt
