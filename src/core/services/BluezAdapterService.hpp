#pragma once

#include "IAdapterService.hpp"
#include "core/bluetooth/BusSettings.hpp"
#include <QObject>
#include <QDBusConnection>
#include <QVariant>

namespace btt {

/// IAdapterService backed by BlueZ on the system bus.
class BluezAdapterService : public QObject, public IAdapterService {
    Q_OBJECT
public:
    BluezAdapterService(const QDBusConnection& bus, const BusSettings& settings,
                        QObject* parent = nullptr);

    std::optional<bool> isPowered() override;
    std::optional<QStringList> connectedDevices() override;
    void powerOff(std::function<void(bool ok)> done) override;

private:
    QVariant getAdapterProperty(const QString& property);

    static constexpr int CALL_TIMEOUT_MS = 5000;

    QDBusConnection bus_;
    BusSettings settings_;
};

} // namespace btt
