#pragma once

#include <QString>

namespace btt {

class INotificationService {
public:
    virtual ~INotificationService() = default;

    /// Show a desktop notification. Fire-and-forget: failures are logged by
    /// the implementation and never reported back.
    /// icon is a theme icon name such as "bluetooth-symbolic", or empty.
    virtual void notify(const QString& summary, const QString& body, const QString& icon) = 0;
};

} // namespace btt
