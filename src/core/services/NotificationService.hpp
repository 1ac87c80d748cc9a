#pragma once

#include "INotificationService.hpp"
#include <QObject>
#include <QDBusConnection>
#include <QDBusMessage>

namespace btt {

struct Notification {
    QString appName;
    quint32 replacesId = 0;  // 0 = new notification
    QString icon;
    QString summary;
    QString body;
    qint32 expireTimeoutMs = -1;  // -1 = server default
};

/// Sends notifications through org.freedesktop.Notifications on the session bus.
class NotificationService : public QObject, public INotificationService {
    Q_OBJECT
public:
    NotificationService(const QDBusConnection& bus, const QString& appName,
                        QObject* parent = nullptr);

    void notify(const QString& summary, const QString& body, const QString& icon) override;

    /// The Notify method call for n, exposed for tests.
    static QDBusMessage buildNotifyMessage(const Notification& n);

    /// Id the server assigned to the most recent notification, 0 if none yet.
    quint32 lastNotificationId() const { return lastId_; }

signals:
    void notificationShown(quint32 id);
    void notificationFailed(const QString& error);

private:
    QDBusConnection bus_;
    QString appName_;
    quint32 lastId_ = 0;
};

} // namespace btt
