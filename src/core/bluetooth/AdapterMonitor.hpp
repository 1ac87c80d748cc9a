#pragma once

#include "core/bluetooth/AdapterEvent.hpp"
#include "core/bluetooth/BusSettings.hpp"
#include "core/bluetooth/ManagedObjects.hpp"
#include <QObject>
#include <QDBusConnection>
#include <QDBusMessage>
#include <QStringList>
#include <QVariantMap>
#include <optional>

class QDBusServiceWatcher;

namespace btt {

/// Watches BlueZ notifications for one adapter and its devices and turns
/// them into AdapterEvents. Everything not about the configured adapter or
/// one of its devices is dropped here.
class AdapterMonitor : public QObject {
    Q_OBJECT
public:
    AdapterMonitor(const QDBusConnection& bus, const BusSettings& settings,
                   QObject* parent = nullptr);

    /// Subscribe to PropertiesChanged, InterfacesAdded and InterfacesRemoved.
    /// Returns false if the bus is down, the service is not registered or a
    /// match rule is rejected.
    bool start();
    bool isListening() const;
    const BusSettings& settings() const;

    std::optional<AdapterEvent> decodePropertiesChanged(const QString& path,
                                                        const QString& interface,
                                                        const QVariantMap& changed) const;
    std::optional<AdapterEvent> decodeInterfacesAdded(const QString& path,
                                                      const InterfaceMap& interfaces) const;
    std::optional<AdapterEvent> decodeInterfacesRemoved(const QString& path,
                                                        const QStringList& interfaces) const;

public slots:
    /// Entry point for every subscribed signal. Malformed messages are logged
    /// and dropped.
    void handleSignal(const QDBusMessage& message);

signals:
    void eventReceived(const btt::AdapterEvent& event);
    void subscriptionLost();

private slots:
    void onServiceUnregistered(const QString& service);

private:
    void handlePropertiesChanged(const QDBusMessage& message);
    void handleInterfacesAdded(const QDBusMessage& message);
    void handleInterfacesRemoved(const QDBusMessage& message);
    std::optional<bool> boolProperty(const QVariantMap& properties, const QString& name,
                                     const QString& path) const;

    QDBusConnection bus_;
    BusSettings settings_;
    bool listening_ = false;
    QDBusServiceWatcher* serviceWatcher_ = nullptr;
};

} // namespace btt
