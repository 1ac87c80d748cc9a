#include "NotificationService.hpp"
#include <QDebug>
#include <QDBusPendingCall>
#include <QDBusPendingCallWatcher>
#include <QDBusPendingReply>
#include <QStringList>
#include <QVariantMap>

namespace btt {

NotificationService::NotificationService(const QDBusConnection& bus, const QString& appName,
                                         QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , appName_(appName)
{
}

QDBusMessage NotificationService::buildNotifyMessage(const Notification& n)
{
    QDBusMessage call = QDBusMessage::createMethodCall(
        "org.freedesktop.Notifications", "/org/freedesktop/Notifications",
        "org.freedesktop.Notifications", "Notify");
    call << n.appName
         << n.replacesId
         << n.icon
         << n.summary
         << n.body
         << QStringList()   // actions
         << QVariantMap()   // hints
         << n.expireTimeoutMs;
    return call;
}

void NotificationService::notify(const QString& summary, const QString& body, const QString& icon)
{
    Notification n;
    n.appName = appName_;
    n.icon = icon;
    n.summary = summary;
    n.body = body;

    qInfo() << "[Notifications]" << summary << "-" << body;

    if (!bus_.isConnected()) {
        qWarning() << "[Notifications] Session bus not connected, notification dropped";
        emit notificationFailed(QStringLiteral("session bus not connected"));
        return;
    }

    QDBusPendingCall pending = bus_.asyncCall(buildNotifyMessage(n));
    auto* watcher = new QDBusPendingCallWatcher(pending, this);
    connect(watcher, &QDBusPendingCallWatcher::finished, this, [this, watcher]() {
        watcher->deleteLater();
        QDBusPendingReply<quint32> reply = *watcher;
        if (reply.isError()) {
            qWarning() << "[Notifications] Notify failed:" << reply.error().message();
            emit notificationFailed(reply.error().message());
            return;
        }
        lastId_ = reply.value();
        emit notificationShown(lastId_);
    });
}

} // namespace btt
